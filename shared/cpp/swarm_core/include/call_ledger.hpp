#pragma once
#include "run_report.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Consensus fan-out calls run on their own threads so that a round can time
// out while calls are still outstanding. Threads whose call has returned are
// joined on the next launch; join_all waits for the rest. Also accumulates
// per-agent call statistics for the run report.
class CallLedger {
public:
    CallLedger() = default;
    ~CallLedger();

    CallLedger(const CallLedger&) = delete;
    CallLedger& operator=(const CallLedger&) = delete;

    void launch(std::function<void()> fn);
    void record(const std::string& agent_id, bool ok, double latency_ms);
    void join_all();

    // Threads launched and not yet joined, finished or not.
    std::size_t tracked() const;
    // Calls still executing.
    std::size_t running() const;

    std::map<std::string, AgentStats> stats() const;

private:
    struct Call {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_locked(std::vector<std::thread>& finished);

    mutable std::mutex mtx_;
    std::vector<Call> calls_;
    std::map<std::string, AgentStats> stats_;
};
