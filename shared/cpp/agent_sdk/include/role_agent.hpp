#pragma once
#include "llm_client.hpp"
#include "ollama_client.hpp"
#include "../../swarm_core/include/agent.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// The closed set of agent roles. Roles differ only in their system prompt.
enum class AgentRole { Analyst, Coder, Reviewer, Planner, Executor };

std::string to_string(AgentRole r);
AgentRole agent_role_from_string(const std::string& name);
const std::string& system_prompt_for(AgentRole r);

struct RoleAgentConfig {
    std::string id;
    AgentRole role{AgentRole::Analyst};
    std::string model;        // empty: client default
    std::string embed_model;  // empty: client default
    bool embed_answers{true};
};

// Agent backed by a chat model. Renders the task prompt, its payload and the
// answers of its dependencies into one user message. When the payload asks for
// {"response_format":"json"} the reply is parsed into a structured answer.
class RoleAgent : public Agent {
public:
    RoleAgent(RoleAgentConfig cfg, std::shared_ptr<LlmClient> llm);

    const std::string& id() const override { return cfg_.id; }
    std::string role() const override { return to_string(cfg_.role); }
    AgentAnswer propose(const TaskSpec& spec) override;

    std::vector<ChatMessage> build_messages(const TaskSpec& spec) const;

private:
    RoleAgentConfig cfg_;
    std::shared_ptr<LlmClient> llm_;
};

// Parses the first JSON object or array embedded in a model reply.
std::optional<nlohmann::json> extract_json(const std::string& text);

// One agent per role, coder on the code model. Ids are the role names.
std::vector<std::shared_ptr<Agent>> make_default_crew(std::shared_ptr<LlmClient> llm, const OllamaConfig& cfg);

// [{"id","role","model","embed_model","embed"}]; an empty or null array yields the default crew.
std::vector<std::shared_ptr<Agent>> agents_from_json(const nlohmann::json& j, std::shared_ptr<LlmClient> llm,
                                                     const OllamaConfig& cfg);
