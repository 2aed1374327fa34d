#include "test_agents.hpp"
#include "../shared/cpp/agent_sdk/include/role_agent.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;

namespace {
RoleAgentConfig config(const std::string& id, AgentRole role) {
    RoleAgentConfig c;
    c.id = id;
    c.role = role;
    c.model = "test-model";
    c.embed_model = "test-embed";
    return c;
}
}

TEST(RoleAgent, MessagesCarryRolePromptPayloadAndDependencyAnswers) {
    auto llm = std::make_shared<FakeLlm>();
    RoleAgent agent(config("rev", AgentRole::Reviewer), llm);

    TaskSpec spec;
    spec.prompt = "Review the patch";
    spec.payload = json{{"file", "main.cpp"}};
    spec.context["write"] = "int main() { return 0; }";
    spec.context["plan"] = json{{"steps", 2}};

    auto msgs = agent.build_messages(spec);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].role, "system");
    EXPECT_EQ(msgs[0].content, system_prompt_for(AgentRole::Reviewer));
    EXPECT_EQ(msgs[1].role, "user");
    EXPECT_NE(msgs[1].content.find("Review the patch"), std::string::npos);
    EXPECT_NE(msgs[1].content.find("main.cpp"), std::string::npos);
    EXPECT_NE(msgs[1].content.find("[write] int main()"), std::string::npos);
    EXPECT_NE(msgs[1].content.find("\"steps\":2"), std::string::npos);
    EXPECT_EQ(agent.role(), "reviewer");
}

TEST(RoleAgent, ProposeReturnsTextAnswerWithEmbedding) {
    auto llm = std::make_shared<FakeLlm>();
    llm->on_chat = [](const std::string&, const std::vector<ChatMessage>&) { return std::string("Looks good."); };
    RoleAgent agent(config("rev", AgentRole::Reviewer), llm);

    TaskSpec spec;
    spec.prompt = "Review";
    AgentAnswer a = agent.propose(spec);
    EXPECT_EQ(a.agent_id, "rev");
    EXPECT_EQ(a.payload, "Looks good.");
    EXPECT_EQ(a.embedding, llm->embedding);
    EXPECT_NE(a.timestamp, std::chrono::system_clock::time_point{});
    EXPECT_EQ(llm->models(), std::vector<std::string>{"test-model"});
}

TEST(RoleAgent, EmbeddingFailureStillYieldsAnswer) {
    auto llm = std::make_shared<FakeLlm>();
    llm->fail_embed = true;
    RoleAgent agent(config("a", AgentRole::Analyst), llm);
    TaskSpec spec;
    spec.prompt = "Analyse";
    AgentAnswer a = agent.propose(spec);
    EXPECT_EQ(a.payload, "ok");
    EXPECT_TRUE(a.embedding.empty());
}

TEST(RoleAgent, MalformedEmbeddingStillYieldsAnswer) {
    auto llm = std::make_shared<FakeLlm>();
    llm->malformed_embed = true;
    RoleAgent agent(config("a", AgentRole::Analyst), llm);
    TaskSpec spec;
    spec.prompt = "Analyse";
    AgentAnswer a;
    ASSERT_NO_THROW(a = agent.propose(spec));
    EXPECT_EQ(a.payload, "ok");
    EXPECT_TRUE(a.embedding.empty());
}

TEST(RoleAgent, JsonResponseFormatProducesStructuredAnswer) {
    auto llm = std::make_shared<FakeLlm>();
    llm->on_chat = [](const std::string&, const std::vector<ChatMessage>&) {
        return std::string("Here you go:\n```json\n{\"verdict\": \"approve\", \"issues\": []}\n```");
    };
    RoleAgent agent(config("rev", AgentRole::Reviewer), llm);
    TaskSpec spec;
    spec.prompt = "Review";
    spec.payload = json{{"response_format", "json"}};

    AgentAnswer a = agent.propose(spec);
    ASSERT_TRUE(a.payload.is_object());
    EXPECT_EQ(a.payload["verdict"], "approve");
    EXPECT_TRUE(a.embedding.empty());
    EXPECT_NE(agent.build_messages(spec)[1].content.find("single JSON value"), std::string::npos);
}

TEST(RoleAgent, ModelErrorsPropagate) {
    auto llm = std::make_shared<FakeLlm>();
    llm->on_chat = [](const std::string&, const std::vector<ChatMessage>&) -> std::string {
        throw AgentTimeout("model took too long");
    };
    RoleAgent agent(config("c", AgentRole::Coder), llm);
    EXPECT_THROW(agent.propose(TaskSpec{}), AgentTimeout);
    EXPECT_THROW(RoleAgent(config("x", AgentRole::Coder), nullptr), ConfigError);
}

TEST(RoleAgent, ExtractJsonFindsEmbeddedValue) {
    auto obj = extract_json("Sure! {\"a\": 1} Hope that helps.");
    ASSERT_TRUE(obj.has_value());
    EXPECT_EQ((*obj)["a"], 1);

    auto arr = extract_json("[1, 2, 3]");
    ASSERT_TRUE(arr.has_value());
    EXPECT_EQ(arr->size(), 3u);

    EXPECT_FALSE(extract_json("no json here").has_value());
    EXPECT_FALSE(extract_json("{ broken").has_value());
}

TEST(RoleAgent, DefaultCrewCoversEveryRoleAndCoderUsesCodeModel) {
    auto llm = std::make_shared<FakeLlm>();
    OllamaConfig cfg;
    cfg.chat_model = "chat";
    cfg.code_model = "code";
    auto crew = make_default_crew(llm, cfg);
    ASSERT_EQ(crew.size(), 5u);

    for (const auto& a : crew) {
        TaskSpec spec;
        spec.prompt = "hi";
        a->propose(spec);
    }
    auto models = llm->models();
    EXPECT_EQ(models[0], "chat");
    EXPECT_EQ(models[1], "code");
    EXPECT_EQ(crew[1]->id(), "coder");
    EXPECT_EQ(crew[4]->role(), "executor");
}

TEST(RoleAgent, AgentsFromJson) {
    auto llm = std::make_shared<FakeLlm>();
    OllamaConfig cfg;
    EXPECT_EQ(agents_from_json(json(), llm, cfg).size(), 5u);
    EXPECT_EQ(agents_from_json(json::array(), llm, cfg).size(), 5u);

    auto agents = agents_from_json(json::parse(R"([
        {"id": "p1", "role": "planner", "model": "big"},
        {"role": "coder", "embed": false}
    ])"), llm, cfg);
    ASSERT_EQ(agents.size(), 2u);
    EXPECT_EQ(agents[0]->id(), "p1");
    EXPECT_EQ(agents[0]->role(), "planner");
    EXPECT_EQ(agents[1]->id(), "coder-2");

    EXPECT_THROW(agents_from_json(json::parse(R"([{"role": "wizard"}])"), llm, cfg), ConfigError);
    EXPECT_THROW(agents_from_json(json::object(), llm, cfg), ConfigError);
    EXPECT_EQ(agent_role_from_string(to_string(AgentRole::Planner)), AgentRole::Planner);
}
