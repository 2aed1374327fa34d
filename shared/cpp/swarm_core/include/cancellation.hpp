#pragma once
#include <atomic>
#include <memory>

// External stop signal for a run. cancel() only stores a lock-free atomic and
// may be called from a signal handler.
class CancellationToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

// Routes SIGINT to a token while in scope and restores the previous handler on
// exit, including when the scope unwinds through an exception. Not nestable.
class ScopedSigintCancel {
public:
    explicit ScopedSigintCancel(std::shared_ptr<CancellationToken> token);
    ~ScopedSigintCancel();

    ScopedSigintCancel(const ScopedSigintCancel&) = delete;
    ScopedSigintCancel& operator=(const ScopedSigintCancel&) = delete;

private:
    std::shared_ptr<CancellationToken> token_;
    void (*previous_)(int);
};
