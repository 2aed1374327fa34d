#include "test_agents.hpp"
#include "../shared/cpp/agent_sdk/include/decomposer.hpp"
#include <gtest/gtest.h>

TEST(Decomposer, BuildsGraphFromModelReply) {
    std::string reply = R"(Here is the plan:
[
  {"id": "1", "description": "Gather requirements", "dependencies": [], "priority": 3},
  {"id": "2", "description": "Write the code", "dependencies": ["1"], "priority": 2},
  {"id": "3", "description": "Test it", "dependencies": ["2", "1"]}
]
Good luck!)";
    TaskGraph g = graph_from_decomposition(reply, "build a thing");
    ASSERT_EQ(g.size(), 3u);
    EXPECT_EQ(g.ready_tasks(), std::vector<std::string>{"t1"});
    EXPECT_EQ(g.task("t2").dependencies, std::vector<std::string>{"t1"});
    EXPECT_EQ(g.task("t2").spec.prompt, "Write the code");
    EXPECT_EQ(g.task("t1").priority, 3);
    EXPECT_EQ(g.task("t3").priority, 0);
}

TEST(Decomposer, UnparseableReplyFallsBackToSingleTask) {
    for (const std::string reply : {"I cannot help with that.", "[not json at all]", "[]"}) {
        TaskGraph g = graph_from_decomposition(reply, "the goal");
        ASSERT_EQ(g.size(), 1u) << reply;
        EXPECT_EQ(g.task("t1").spec.prompt, "the goal");
    }
}

TEST(Decomposer, CyclicOrDanglingPlansAreRejected) {
    EXPECT_THROW(graph_from_decomposition(
                     R"([{"id":"a","dependencies":["b"]},{"id":"b","dependencies":["a"]}])", "g"),
                 CycleError);
    EXPECT_THROW(graph_from_decomposition(R"([{"id":"a","dependencies":["zzz"]}])", "g"),
                 UnknownDependencyError);
}

TEST(Decomposer, AsksThePlannerModelWithTheGoal) {
    auto llm = std::make_shared<FakeLlm>();
    llm->on_chat = [](const std::string&, const std::vector<ChatMessage>&) {
        return std::string(R"([{"id": 1, "description": "only step"}])");
    };
    TaskDecomposer d(llm, "planner-model");
    TaskGraph g = d.decompose("ship the release");
    ASSERT_EQ(g.size(), 1u);
    EXPECT_EQ(g.task("t1").spec.prompt, "only step");

    auto chats = llm->chats();
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_NE(chats[0].back().content.find("Task: ship the release"), std::string::npos);
    EXPECT_EQ(llm->models().front(), "planner-model");
}
