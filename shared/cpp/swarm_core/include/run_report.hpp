#pragma once
#include "task.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// One status transition, recorded by the scheduling thread in the order applied.
struct RunEvent {
    std::uint64_t seq{0};
    std::string task_id;
    TaskStatus status{TaskStatus::Pending};
    std::optional<FailureReason> reason;
    std::string detail;
    long long at_ms{0};  // since run start
};

struct TaskReport {
    std::string id;
    TaskStatus status{TaskStatus::Pending};
    std::optional<FailureReason> failure;
    std::string detail;
    int retry_count{0};
    int attempts{0};
    std::optional<AgentAnswer> result;
    long long elapsed_ms{0};  // first dispatch to terminal status
};

struct AgentStats {
    std::size_t calls{0};
    std::size_t failures{0};
    double total_latency_ms{0.0};

    double mean_latency_ms() const { return calls ? total_latency_ms / (double)calls : 0.0; }
};

struct RunReport {
    std::string run_id;
    std::map<std::string, TaskReport> tasks;
    std::map<std::string, AgentStats> agents;
    std::vector<RunEvent> events;
    long long elapsed_ms{0};
    bool cancelled{false};

    std::size_t count(TaskStatus s) const;
    std::size_t count(FailureReason r) const;
    bool all_succeeded() const;

    // Events for one task, in order.
    std::vector<RunEvent> events_for(const std::string& task_id) const;
    // Sequence number of the first event putting the task into `s`, if any.
    std::optional<std::uint64_t> first_seq(const std::string& task_id, TaskStatus s) const;
};

nlohmann::json to_json(const RunEvent& e);
nlohmann::json to_json(const TaskReport& t);
nlohmann::json to_json(const RunReport& r);
