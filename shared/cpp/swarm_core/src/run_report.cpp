#include "../include/run_report.hpp"

using json = nlohmann::json;

std::size_t RunReport::count(TaskStatus s) const {
    std::size_t n = 0;
    for (const auto& kv : tasks) n += kv.second.status == s ? 1 : 0;
    return n;
}

std::size_t RunReport::count(FailureReason r) const {
    std::size_t n = 0;
    for (const auto& kv : tasks) n += (kv.second.failure && *kv.second.failure == r) ? 1 : 0;
    return n;
}

bool RunReport::all_succeeded() const {
    return count(TaskStatus::Succeeded) == tasks.size();
}

std::vector<RunEvent> RunReport::events_for(const std::string& task_id) const {
    std::vector<RunEvent> out;
    for (const auto& e : events) {
        if (e.task_id == task_id) out.push_back(e);
    }
    return out;
}

std::optional<std::uint64_t> RunReport::first_seq(const std::string& task_id, TaskStatus s) const {
    for (const auto& e : events) {
        if (e.task_id == task_id && e.status == s) return e.seq;
    }
    return std::nullopt;
}

json to_json(const RunEvent& e) {
    json j = {
        {"seq", e.seq},
        {"task", e.task_id},
        {"status", to_string(e.status)},
        {"at_ms", e.at_ms}
    };
    if (e.reason) j["reason"] = to_string(*e.reason);
    if (!e.detail.empty()) j["detail"] = e.detail;
    return j;
}

json to_json(const TaskReport& t) {
    json j = {
        {"id", t.id},
        {"status", to_string(t.status)},
        {"retry_count", t.retry_count},
        {"attempts", t.attempts},
        {"elapsed_ms", t.elapsed_ms}
    };
    if (t.failure) j["failure"] = to_string(*t.failure);
    if (!t.detail.empty()) j["detail"] = t.detail;
    if (t.result) j["result"] = answer_to_json(*t.result);
    return j;
}

json to_json(const RunReport& r) {
    json tasks = json::array();
    for (const auto& kv : r.tasks) tasks.push_back(to_json(kv.second));
    json agents = json::object();
    for (const auto& kv : r.agents) {
        agents[kv.first] = {
            {"calls", kv.second.calls},
            {"failures", kv.second.failures},
            {"mean_latency_ms", kv.second.mean_latency_ms()}
        };
    }
    json events = json::array();
    for (const auto& e : r.events) events.push_back(to_json(e));
    return json{
        {"run_id", r.run_id},
        {"elapsed_ms", r.elapsed_ms},
        {"cancelled", r.cancelled},
        {"summary", {
            {"total", r.tasks.size()},
            {"succeeded", r.count(TaskStatus::Succeeded)},
            {"failed", r.count(TaskStatus::Failed)}
        }},
        {"tasks", tasks},
        {"agents", agents},
        {"events", events}
    };
}
