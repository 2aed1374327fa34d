#pragma once
#include "llm_client.hpp"
#include "../../swarm_core/include/task_graph.hpp"
#include <memory>
#include <string>

// Asks a planner model to split a goal into 3-5 subtasks and turns the reply
// into a task graph. Subtask ids are prefixed with "t" when purely numeric.
class TaskDecomposer {
public:
    TaskDecomposer(std::shared_ptr<LlmClient> llm, std::string model);

    // Throws AgentUnavailable/AgentTimeout from the model, or graph errors
    // when the reply describes a cycle or duplicate ids.
    TaskGraph decompose(const std::string& goal);

private:
    std::shared_ptr<LlmClient> llm_;
    std::string model_;
};

std::string decomposition_prompt(const std::string& goal);

// Builds a graph from the first [...] block in reply. Falls back to a single
// task holding goal when nothing parseable is found.
TaskGraph graph_from_decomposition(const std::string& reply, const std::string& goal);
