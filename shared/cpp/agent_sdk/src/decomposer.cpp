#include "../include/decomposer.hpp"
#include "../../swarm_core/include/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

using json = nlohmann::json;

TaskDecomposer::TaskDecomposer(std::shared_ptr<LlmClient> llm, std::string model)
    : llm_(std::move(llm)), model_(std::move(model)) {}

std::string decomposition_prompt(const std::string& goal) {
    return "Break this task into 3-5 smaller subtasks. Return JSON array:\n"
           "[{\"id\": \"1\", \"description\": \"...\", \"dependencies\": [], \"priority\": 1}]\n\n"
           "Task: " + goal;
}

TaskGraph TaskDecomposer::decompose(const std::string& goal) {
    std::vector<ChatMessage> msgs = {
        {"system", "You are a project planner. Create actionable plans with clear steps and dependencies."},
        {"user", decomposition_prompt(goal)}
    };
    std::string reply = llm_->chat(model_, msgs);
    return graph_from_decomposition(reply, goal);
}

namespace {
std::string id_of(const json& v) {
    std::string s = v.is_string() ? v.get<std::string>() : v.dump();
    bool numeric = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    return numeric ? "t" + s : s;
}

TaskGraph single_task(const std::string& goal) {
    TaskGraph g;
    Task t;
    t.id = "t1";
    t.spec.prompt = goal;
    g.add_task(std::move(t));
    return g;
}
}

TaskGraph graph_from_decomposition(const std::string& reply, const std::string& goal) {
    auto start = reply.find('[');
    auto end = reply.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        log_warn("decomposer", "no JSON array in reply, using a single task");
        return single_task(goal);
    }

    json arr;
    try {
        arr = json::parse(reply.substr(start, end - start + 1));
    } catch (const json::exception& e) {
        log_warn("decomposer", std::string("unparseable reply, using a single task: ") + e.what());
        return single_task(goal);
    }
    if (!arr.is_array() || arr.empty()) return single_task(goal);

    TaskGraph g;
    std::size_t n = 0;
    for (const auto& jt : arr) {
        ++n;
        if (!jt.is_object()) continue;
        Task t;
        t.id = jt.contains("id") ? id_of(jt["id"]) : "t" + std::to_string(n);
        t.spec.prompt = jt.value("description", std::string());
        if (jt.contains("priority") && jt["priority"].is_number()) t.priority = jt["priority"].get<int>();
        if (jt.contains("dependencies") && jt["dependencies"].is_array()) {
            for (const auto& d : jt["dependencies"]) t.dependencies.push_back(id_of(d));
        }
        g.add_task(std::move(t));
    }
    if (g.size() == 0) return single_task(goal);
    g.validate();
    log_info("decomposer", "goal split into " + std::to_string(g.size()) + " tasks");
    return g;
}
