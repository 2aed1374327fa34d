#include "../include/role_agent.hpp"
#include "../../swarm_core/include/errors.hpp"
#include "../../swarm_core/include/log.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <utility>

using json = nlohmann::json;

std::string to_string(AgentRole r) {
    switch (r) {
    case AgentRole::Analyst: return "analyst";
    case AgentRole::Coder: return "coder";
    case AgentRole::Reviewer: return "reviewer";
    case AgentRole::Planner: return "planner";
    case AgentRole::Executor: return "executor";
    }
    return "analyst";
}

AgentRole agent_role_from_string(const std::string& name) {
    if (name == "analyst") return AgentRole::Analyst;
    if (name == "coder") return AgentRole::Coder;
    if (name == "reviewer") return AgentRole::Reviewer;
    if (name == "planner") return AgentRole::Planner;
    if (name == "executor") return AgentRole::Executor;
    throw ConfigError("unknown agent role: " + name);
}

const std::string& system_prompt_for(AgentRole r) {
    static const std::map<AgentRole, std::string> prompts = {
        {AgentRole::Analyst, "You are an analyst. Break down problems, identify requirements, and provide clear analysis. Be thorough but concise."},
        {AgentRole::Coder, "You are an expert programmer. Write clean, efficient code with proper error handling."},
        {AgentRole::Reviewer, "You are a code reviewer. Check for bugs, security issues, performance problems, and style. Be constructive."},
        {AgentRole::Planner, "You are a project planner. Create actionable plans with clear steps and dependencies."},
        {AgentRole::Executor, "You carry out the requested step exactly and report only the result."},
    };
    return prompts.at(r);
}

RoleAgent::RoleAgent(RoleAgentConfig cfg, std::shared_ptr<LlmClient> llm)
    : cfg_(std::move(cfg)), llm_(std::move(llm)) {
    if (cfg_.id.empty()) cfg_.id = to_string(cfg_.role);
    if (!llm_) throw ConfigError("agent " + cfg_.id + " has no model client");
}

std::vector<ChatMessage> RoleAgent::build_messages(const TaskSpec& spec) const {
    std::string user;
    if (!spec.context.empty()) {
        user += "Completed prerequisite work:\n";
        for (const auto& kv : spec.context) {
            user += "[" + kv.first + "] " + (kv.second.is_string() ? kv.second.get<std::string>() : kv.second.dump()) + "\n";
        }
        user += "\n";
    }
    user += spec.prompt;
    if (!spec.payload.is_null()) {
        user += "\n\nInput:\n" + spec.payload.dump(2);
        if (spec.payload.is_object() && spec.payload.value("response_format", std::string()) == "json") {
            user += "\n\nRespond with a single JSON value and nothing else.";
        }
    }
    return {
        ChatMessage{"system", system_prompt_for(cfg_.role)},
        ChatMessage{"user", user}
    };
}

AgentAnswer RoleAgent::propose(const TaskSpec& spec) {
    std::string reply = llm_->chat(cfg_.model, build_messages(spec));

    AgentAnswer a;
    a.agent_id = cfg_.id;
    a.timestamp = std::chrono::system_clock::now();
    a.payload = reply;

    bool want_json = spec.payload.is_object() && spec.payload.value("response_format", std::string()) == "json";
    if (want_json) {
        if (auto parsed = extract_json(reply)) {
            a.payload = std::move(*parsed);
        } else {
            log_debug("agent", cfg_.id + ": reply is not JSON, keeping text");
        }
    }

    if (cfg_.embed_answers && a.payload.is_string() && !a.empty()) {
        try {
            a.embedding = llm_->embed(cfg_.embed_model, reply);
        } catch (const std::exception& e) {
            log_warn("agent", cfg_.id + ": embedding failed, falling back to text similarity: " + e.what());
        }
    }
    return a;
}

std::optional<json> extract_json(const std::string& text) {
    auto obj = text.find('{');
    auto arr = text.find('[');
    auto start = std::min(obj, arr);
    if (start == std::string::npos) return std::nullopt;
    char close = text[start] == '{' ? '}' : ']';
    auto end = text.rfind(close);
    if (end == std::string::npos || end < start) return std::nullopt;
    try {
        return json::parse(text.substr(start, end - start + 1));
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::vector<std::shared_ptr<Agent>> make_default_crew(std::shared_ptr<LlmClient> llm, const OllamaConfig& cfg) {
    std::vector<std::shared_ptr<Agent>> out;
    for (auto role : {AgentRole::Analyst, AgentRole::Coder, AgentRole::Reviewer, AgentRole::Planner, AgentRole::Executor}) {
        RoleAgentConfig rc;
        rc.id = to_string(role);
        rc.role = role;
        rc.model = role == AgentRole::Coder ? cfg.code_model : cfg.chat_model;
        rc.embed_model = cfg.embed_model;
        out.push_back(std::make_shared<RoleAgent>(rc, llm));
    }
    return out;
}

std::vector<std::shared_ptr<Agent>> agents_from_json(const json& j, std::shared_ptr<LlmClient> llm,
                                                     const OllamaConfig& cfg) {
    if (j.is_null() || (j.is_array() && j.empty())) return make_default_crew(llm, cfg);
    if (!j.is_array()) throw ConfigError("\"agents\" must be an array");
    std::vector<std::shared_ptr<Agent>> out;
    for (const auto& ja : j) {
        RoleAgentConfig rc;
        rc.role = agent_role_from_string(ja.value("role", std::string("analyst")));
        rc.id = ja.value("id", to_string(rc.role) + "-" + std::to_string(out.size() + 1));
        rc.model = ja.value("model", rc.role == AgentRole::Coder ? cfg.code_model : cfg.chat_model);
        rc.embed_model = ja.value("embed_model", cfg.embed_model);
        rc.embed_answers = ja.value("embed", true);
        out.push_back(std::make_shared<RoleAgent>(rc, llm));
    }
    return out;
}
