#include "../include/call_ledger.hpp"
#include "../include/log.hpp"
#include <exception>
#include <utility>

CallLedger::~CallLedger() { join_all(); }

void CallLedger::launch(std::function<void()> fn) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        reap_locked(finished);
        calls_.push_back(Call{std::thread([fn = std::move(fn), done]() {
            try {
                fn();
            } catch (const std::exception& e) {
                log_error("orchestrator", std::string("fan-out call threw: ") + e.what());
            }
            done->store(true);
        }), done});
    }
    for (auto& t : finished) t.join();
}

void CallLedger::reap_locked(std::vector<std::thread>& finished) {
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (it->done->load()) {
            finished.push_back(std::move(it->thread));
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

void CallLedger::record(const std::string& agent_id, bool ok, double latency_ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& s = stats_[agent_id];
    ++s.calls;
    if (!ok) ++s.failures;
    s.total_latency_ms += latency_ms;
}

void CallLedger::join_all() {
    std::vector<Call> calls;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        calls.swap(calls_);
    }
    for (auto& c : calls) {
        if (c.thread.joinable()) c.thread.join();
    }
}

std::size_t CallLedger::tracked() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_.size();
}

std::size_t CallLedger::running() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (const auto& c : calls_) {
        if (!c.done->load()) ++n;
    }
    return n;
}

std::map<std::string, AgentStats> CallLedger::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stats_;
}
