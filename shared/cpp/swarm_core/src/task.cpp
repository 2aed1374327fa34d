#include "../include/task.hpp"
#include "../include/errors.hpp"
#include <cctype>

using json = nlohmann::json;

std::string to_string(TaskStatus s) {
    switch (s) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::Ready: return "ready";
    case TaskStatus::Running: return "running";
    case TaskStatus::AwaitingConsensus: return "awaiting-consensus";
    case TaskStatus::Succeeded: return "succeeded";
    case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(FailureReason r) {
    switch (r) {
    case FailureReason::AgentFailure: return "AgentFailure";
    case FailureReason::ConsensusFailure: return "ConsensusFailure";
    case FailureReason::UpstreamFailure: return "UpstreamFailure";
    case FailureReason::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

TaskStatus task_status_from_string(const std::string& s) {
    if (s == "pending") return TaskStatus::Pending;
    if (s == "ready") return TaskStatus::Ready;
    if (s == "running") return TaskStatus::Running;
    if (s == "awaiting-consensus") return TaskStatus::AwaitingConsensus;
    if (s == "succeeded") return TaskStatus::Succeeded;
    if (s == "failed") return TaskStatus::Failed;
    throw std::invalid_argument("unknown task status: " + s);
}

FailureReason failure_reason_from_string(const std::string& s) {
    if (s == "AgentFailure") return FailureReason::AgentFailure;
    if (s == "ConsensusFailure") return FailureReason::ConsensusFailure;
    if (s == "UpstreamFailure") return FailureReason::UpstreamFailure;
    if (s == "Cancelled") return FailureReason::Cancelled;
    throw std::invalid_argument("unknown failure reason: " + s);
}

ConsensusSetting consensus_setting_from_json(const json& v) {
    if (v.is_null()) return ConsensusSetting::none();
    if (v.is_string()) {
        if (v.get<std::string>() == "none") return ConsensusSetting::none();
        throw ConfigError("consensus must be a non-negative integer or \"none\", got \"" + v.get<std::string>() + "\"");
    }
    if (v.is_number_integer()) {
        int f = v.get<int>();
        if (f < 0) throw ConfigError("fault tolerance must be >= 0, got " + std::to_string(f));
        return ConsensusSetting::with_faults(f);
    }
    throw ConfigError("consensus must be a non-negative integer or \"none\"");
}

json consensus_setting_to_json(const ConsensusSetting& s) {
    if (!s.required) return "none";
    return s.f;
}

bool AgentAnswer::empty() const {
    if (payload.is_null()) return true;
    if (payload.is_string()) {
        for (unsigned char c : payload.get_ref<const std::string&>()) {
            if (!std::isspace(c)) return false;
        }
        return true;
    }
    return false;
}

json answer_to_json(const AgentAnswer& a) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(a.timestamp.time_since_epoch()).count();
    json j = {
        {"task_id", a.task_id},
        {"agent_id", a.agent_id},
        {"payload", a.payload},
        {"confidence", a.confidence},
        {"timestamp_ms", ms}
    };
    if (!a.embedding.empty()) j["embedding_dim"] = a.embedding.size();
    return j;
}

AgentAnswer answer_from_json(const json& j) {
    AgentAnswer a;
    a.task_id = j.value("task_id", std::string());
    a.agent_id = j.value("agent_id", std::string());
    a.payload = j.value("payload", json());
    a.confidence = j.value("confidence", 1.0);
    a.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(j.value("timestamp_ms", (long long)0)));
    return a;
}
