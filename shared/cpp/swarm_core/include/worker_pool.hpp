#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

struct PoolSnapshot {
    std::size_t slots{0};
    std::size_t busy{0};
    std::size_t queued{0};
};

// Fixed number of execution slots. Holds no task state: jobs are opaque
// callables. Jobs must not throw; an escaping exception is logged and dropped.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t slots);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has begun.
    bool submit(std::function<void()> job);

    std::size_t slots() const { return slots_; }
    PoolSnapshot snapshot();

    // Runs every queued job, then joins the threads. Idempotent.
    void shutdown();

private:
    void worker_loop();

    std::size_t slots_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::thread> threads_;
    std::size_t busy_{0};
    bool stopping_{false};
};
