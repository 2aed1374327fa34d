#include "../include/task_graph.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>
#include <utility>

using json = nlohmann::json;

void TaskGraph::add_task(Task task, std::vector<std::string> dependencies) {
    task.dependencies = std::move(dependencies);
    add_task(std::move(task));
}

void TaskGraph::add_task(Task task) {
    if (task.id.empty()) throw GraphError("task id must not be empty");
    if (tasks_.count(task.id)) throw DuplicateIdError("duplicate task id: " + task.id);

    std::unordered_set<std::string> seen;
    std::vector<std::string> deps;
    for (auto& d : task.dependencies) {
        if (seen.insert(d).second) deps.push_back(d);
    }
    for (const auto& d : deps) {
        if (d == task.id) throw CycleError("task " + task.id + " depends on itself");
        if (reaches(d, task.id)) throw CycleError("dependency " + task.id + " -> " + d + " would create a cycle");
    }
    task.dependencies = std::move(deps);

    task.status = TaskStatus::Pending;
    task.result.reset();
    task.failure.reset();
    task.failure_detail.clear();
    task.retry_count = 0;
    if (dependencies_succeeded(task)) task.status = TaskStatus::Ready;

    for (const auto& d : task.dependencies) dependents_[d].push_back(task.id);
    tasks_.emplace(task.id, std::move(task));
}

void TaskGraph::validate() const {
    for (const auto& kv : tasks_) {
        for (const auto& d : kv.second.dependencies) {
            if (!tasks_.count(d)) {
                throw UnknownDependencyError("task " + kv.first + " depends on unknown task " + d);
            }
        }
    }
}

bool TaskGraph::contains(const std::string& id) const {
    return tasks_.count(id) > 0;
}

const Task& TaskGraph::task(const std::string& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) throw std::out_of_range("unknown task: " + id);
    return it->second;
}

Task& TaskGraph::at(const std::string& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) throw std::out_of_range("unknown task: " + id);
    return it->second;
}

std::vector<std::string> TaskGraph::ids() const {
    std::vector<std::string> out;
    out.reserve(tasks_.size());
    for (const auto& kv : tasks_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> TaskGraph::dependents(const std::string& id) const {
    auto it = dependents_.find(id);
    if (it == dependents_.end()) return {};
    return it->second;
}

// Follows dependency edges from `from`; ids that are referenced but not yet
// added are dead ends.
bool TaskGraph::reaches(const std::string& from, const std::string& target) const {
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack{from};
    while (!stack.empty()) {
        std::string cur = stack.back();
        stack.pop_back();
        if (cur == target) return true;
        if (!visited.insert(cur).second) continue;
        auto it = tasks_.find(cur);
        if (it == tasks_.end()) continue;
        for (const auto& d : it->second.dependencies) stack.push_back(d);
    }
    return false;
}

bool TaskGraph::dependencies_succeeded(const Task& t) const {
    for (const auto& d : t.dependencies) {
        auto it = tasks_.find(d);
        if (it == tasks_.end() || it->second.status != TaskStatus::Succeeded) return false;
    }
    return true;
}

std::vector<std::string> TaskGraph::ready_tasks() const {
    std::vector<const Task*> ready;
    for (const auto& kv : tasks_) {
        if (kv.second.status == TaskStatus::Ready) ready.push_back(&kv.second);
    }
    std::sort(ready.begin(), ready.end(), [](const Task* a, const Task* b) {
        if (a->priority != b->priority) return a->priority > b->priority;
        return a->id < b->id;
    });
    std::vector<std::string> out;
    out.reserve(ready.size());
    for (const auto* t : ready) out.push_back(t->id);
    return out;
}

void TaskGraph::mark_running(const std::string& id) {
    Task& t = at(id);
    if (t.status != TaskStatus::Ready) {
        throw std::logic_error("task " + id + " cannot start from status " + to_string(t.status));
    }
    t.status = TaskStatus::Running;
}

void TaskGraph::mark_awaiting_consensus(const std::string& id) {
    Task& t = at(id);
    if (t.status != TaskStatus::Running) {
        throw std::logic_error("task " + id + " cannot await consensus from status " + to_string(t.status));
    }
    t.status = TaskStatus::AwaitingConsensus;
}

void TaskGraph::mark_retry(const std::string& id) {
    Task& t = at(id);
    if (t.status != TaskStatus::Running && t.status != TaskStatus::AwaitingConsensus) {
        throw std::logic_error("task " + id + " cannot be retried from status " + to_string(t.status));
    }
    t.status = TaskStatus::Ready;
    ++t.retry_count;
}

void TaskGraph::mark_succeeded(const std::string& id, AgentAnswer result) {
    Task& t = at(id);
    if (t.status != TaskStatus::Running && t.status != TaskStatus::AwaitingConsensus) {
        throw std::logic_error("task " + id + " cannot succeed from status " + to_string(t.status));
    }
    t.status = TaskStatus::Succeeded;
    t.result = std::move(result);
    for (const auto& dep_id : dependents(id)) {
        auto it = tasks_.find(dep_id);
        if (it == tasks_.end() || it->second.status != TaskStatus::Pending) continue;
        if (dependencies_succeeded(it->second)) it->second.status = TaskStatus::Ready;
    }
}

std::vector<std::string> TaskGraph::mark_failed(const std::string& id, FailureReason reason, const std::string& detail) {
    Task& t = at(id);
    if (is_terminal(t.status)) {
        throw std::logic_error("task " + id + " is already " + to_string(t.status));
    }
    t.status = TaskStatus::Failed;
    t.failure = reason;
    t.failure_detail = detail;

    std::vector<std::string> propagated;
    std::deque<std::string> frontier{id};
    while (!frontier.empty()) {
        std::string cur = frontier.front();
        frontier.pop_front();
        for (const auto& dep_id : dependents(cur)) {
            auto it = tasks_.find(dep_id);
            if (it == tasks_.end() || is_terminal(it->second.status)) continue;
            it->second.status = TaskStatus::Failed;
            it->second.failure = FailureReason::UpstreamFailure;
            it->second.failure_detail = "upstream task " + id + " failed";
            propagated.push_back(dep_id);
            frontier.push_back(dep_id);
        }
    }
    return propagated;
}

void TaskGraph::mark_cancelled(const std::string& id) {
    Task& t = at(id);
    if (is_terminal(t.status)) return;
    t.status = TaskStatus::Failed;
    t.failure = FailureReason::Cancelled;
    t.failure_detail = "run cancelled";
}

bool TaskGraph::all_terminal() const {
    for (const auto& kv : tasks_) {
        if (!is_terminal(kv.second.status)) return false;
    }
    return true;
}

std::vector<std::string> TaskGraph::non_terminal() const {
    std::vector<std::string> out;
    for (const auto& kv : tasks_) {
        if (!is_terminal(kv.second.status)) out.push_back(kv.first);
    }
    return out;
}

TaskGraph task_graph_from_json(const json& j) {
    if (!j.contains("tasks") || !j["tasks"].is_array()) {
        throw GraphError("graph document needs a \"tasks\" array");
    }
    TaskGraph g;
    for (const auto& jt : j["tasks"]) {
        Task t;
        t.id = jt.at("id").get<std::string>();
        t.priority = jt.value("priority", 0);
        t.dependencies = jt.value("depends_on", std::vector<std::string>{});
        t.spec.prompt = jt.value("prompt", std::string());
        t.spec.payload = jt.value("payload", json());
        t.spec.role = jt.value("role", std::string());
        if (jt.contains("max_retries")) {
            int r = jt["max_retries"].get<int>();
            if (r < 0) throw ConfigError("task " + t.id + ": max_retries must be >= 0");
            t.max_retries = r;
        }
        if (jt.contains("consensus")) t.consensus = consensus_setting_from_json(jt["consensus"]);
        g.add_task(std::move(t));
    }
    g.validate();
    return g;
}

json task_graph_to_json(const TaskGraph& g) {
    json tasks = json::array();
    for (const auto& id : g.ids()) {
        const Task& t = g.task(id);
        json jt = {
            {"id", t.id},
            {"priority", t.priority},
            {"depends_on", t.dependencies},
            {"prompt", t.spec.prompt}
        };
        if (!t.spec.payload.is_null()) jt["payload"] = t.spec.payload;
        if (!t.spec.role.empty()) jt["role"] = t.spec.role;
        if (t.max_retries) jt["max_retries"] = *t.max_retries;
        if (t.consensus) jt["consensus"] = consensus_setting_to_json(*t.consensus);
        tasks.push_back(std::move(jt));
    }
    return json{{"tasks", tasks}};
}
