#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class TaskStatus { Pending, Ready, Running, AwaitingConsensus, Succeeded, Failed };

enum class FailureReason { AgentFailure, ConsensusFailure, UpstreamFailure, Cancelled };

std::string to_string(TaskStatus s);
std::string to_string(FailureReason r);
TaskStatus task_status_from_string(const std::string& s);
FailureReason failure_reason_from_string(const std::string& s);

inline bool is_terminal(TaskStatus s) {
    return s == TaskStatus::Succeeded || s == TaskStatus::Failed;
}

// Whether a task needs N-way agreement. f is the number of faulty answers
// tolerated; a consensus task fans out to 2f+1 agents.
struct ConsensusSetting {
    bool required{false};
    int f{0};

    static ConsensusSetting none() { return {}; }
    static ConsensusSetting with_faults(int f) { return {true, f}; }
    std::size_t fan_out() const { return required ? (std::size_t)(2 * f + 1) : 1; }
};

inline bool operator==(const ConsensusSetting& a, const ConsensusSetting& b) {
    return a.required == b.required && (!a.required || a.f == b.f);
}

// Accepts a non-negative integer or the string "none".
ConsensusSetting consensus_setting_from_json(const nlohmann::json& v);
nlohmann::json consensus_setting_to_json(const ConsensusSetting& s);

struct TaskSpec {
    std::string prompt;
    nlohmann::json payload;  // agent-specific structured input, may be null
    std::string role;        // requested agent role; empty means any
    std::map<std::string, nlohmann::json> context;  // dependency id -> accepted answer payload
};

struct AgentAnswer {
    std::string task_id;
    std::string agent_id;
    nlohmann::json payload;  // string for free text, anything else is structured
    double confidence{1.0};
    std::vector<float> embedding;  // empty when the agent supplies none
    std::chrono::system_clock::time_point timestamp{};

    // Null payloads and blank strings count as no answer.
    bool empty() const;
};

nlohmann::json answer_to_json(const AgentAnswer& a);
AgentAnswer answer_from_json(const nlohmann::json& j);

struct Task {
    std::string id;
    int priority{0};
    std::vector<std::string> dependencies;
    TaskSpec spec;
    std::optional<int> max_retries;             // unset: run default
    std::optional<ConsensusSetting> consensus;  // unset: run policy

    TaskStatus status{TaskStatus::Pending};
    std::optional<AgentAnswer> result;
    std::optional<FailureReason> failure;
    std::string failure_detail;
    int retry_count{0};
};
