#pragma once
#include "task.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// Dependency graph of tasks. Acyclic by construction: add_task rejects any
// edge that would close a cycle. Dependencies may name tasks added later;
// validate() checks that every referenced id exists.
//
// Status model: a task with no dependencies starts Ready, any other task starts
// Pending and is promoted to Ready when its last dependency succeeds. Ready
// therefore always means "all dependencies succeeded, not dispatched".
class TaskGraph {
public:
    // Throws DuplicateIdError or CycleError. Runtime state on the task
    // (status, result, retries) is reset.
    void add_task(Task task);
    void add_task(Task task, std::vector<std::string> dependencies);

    // Throws UnknownDependencyError.
    void validate() const;

    bool contains(const std::string& id) const;
    const Task& task(const std::string& id) const;
    std::size_t size() const { return tasks_.size(); }
    std::vector<std::string> ids() const;
    std::vector<std::string> dependents(const std::string& id) const;

    // Ready tasks, highest priority first, ties by ascending id.
    std::vector<std::string> ready_tasks() const;

    void mark_running(const std::string& id);
    void mark_awaiting_consensus(const std::string& id);
    void mark_retry(const std::string& id);
    void mark_succeeded(const std::string& id, AgentAnswer result);
    // Fails the task and every transitive dependent (UpstreamFailure).
    // Returns the ids failed by propagation, in breadth-first order.
    std::vector<std::string> mark_failed(const std::string& id, FailureReason reason, const std::string& detail = {});
    void mark_cancelled(const std::string& id);

    bool all_terminal() const;
    std::vector<std::string> non_terminal() const;

private:
    Task& at(const std::string& id);
    bool reaches(const std::string& from, const std::string& target) const;
    bool dependencies_succeeded(const Task& t) const;

    std::map<std::string, Task> tasks_;
    std::unordered_map<std::string, std::vector<std::string>> dependents_;
};

// {"tasks":[{"id","priority","depends_on","prompt","payload","role","max_retries","consensus"}]}
TaskGraph task_graph_from_json(const nlohmann::json& j);
nlohmann::json task_graph_to_json(const TaskGraph& g);
