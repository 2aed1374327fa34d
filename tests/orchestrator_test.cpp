#include "test_agents.hpp"
#include "../shared/cpp/swarm_core/include/orchestrator.hpp"
#include "../shared/cpp/swarm_core/include/util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <random>
#include <set>

using namespace std::chrono_literals;

namespace {
Task make_task(const std::string& id, int priority = 0, std::vector<std::string> deps = {}) {
    Task t;
    t.id = id;
    t.priority = priority;
    t.dependencies = std::move(deps);
    t.spec.prompt = id;
    return t;
}

RunContext fast_context(std::vector<std::shared_ptr<Agent>> agents, int concurrency = 4) {
    RunContext ctx;
    ctx.config.concurrency = concurrency;
    ctx.config.max_retries = 2;
    ctx.config.retry_backoff = RetryBackoff{1, 2.0, 5};
    ctx.config.consensus_timeout_ms = 2000;
    ctx.agents = std::move(agents);
    return ctx;
}

class CollectingSink : public ResultSink {
public:
    void accept(const std::string& task_id, const AgentAnswer& result) override {
        std::lock_guard<std::mutex> lk(mu_);
        got_[task_id].push_back(result);
    }
    std::map<std::string, std::vector<AgentAnswer>> got() const {
        std::lock_guard<std::mutex> lk(mu_);
        return got_;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, std::vector<AgentAnswer>> got_;
};

class ThrowingSink : public ResultSink {
public:
    void accept(const std::string&, const AgentAnswer&) override { throw std::runtime_error("disk full"); }
};
}

TEST(Orchestrator, DependentNeverStartsBeforeDependencySucceeds) {
    TaskGraph g;
    g.add_task(make_task("c", 0, {"b"}));
    g.add_task(make_task("b", 0, {"a"}));
    g.add_task(make_task("a"));

    auto agent = echo_agent("solo", 5);
    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({agent}));

    ASSERT_TRUE(r.all_succeeded());
    EXPECT_LT(*r.first_seq("a", TaskStatus::Succeeded), *r.first_seq("b", TaskStatus::Running));
    EXPECT_LT(*r.first_seq("b", TaskStatus::Succeeded), *r.first_seq("c", TaskStatus::Running));
    EXPECT_EQ(r.tasks.at("c").result->payload, "done: c");
}

TEST(Orchestrator, HigherPriorityAndSiblingDispatchTogetherJoinWaits) {
    TaskGraph g;
    g.add_task(make_task("A", 5));
    g.add_task(make_task("B", 1));
    g.add_task(make_task("C", 0, {"A", "B"}));

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    auto agent = std::make_shared<FakeAgent>("w", [&](const TaskSpec& spec, int) {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(30ms);
        --running;
        return text_answer("ok " + spec.prompt);
    });

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({agent}, 2));

    ASSERT_TRUE(r.all_succeeded());
    auto a_run = *r.first_seq("A", TaskStatus::Running);
    auto b_run = *r.first_seq("B", TaskStatus::Running);
    auto first_done = std::min(*r.first_seq("A", TaskStatus::Succeeded), *r.first_seq("B", TaskStatus::Succeeded));
    EXPECT_LT(a_run, b_run);
    EXPECT_LT(b_run, first_done);
    EXPECT_GT(*r.first_seq("C", TaskStatus::Running), *r.first_seq("A", TaskStatus::Succeeded));
    EXPECT_GT(*r.first_seq("C", TaskStatus::Running), *r.first_seq("B", TaskStatus::Succeeded));
    EXPECT_EQ(peak.load(), 2);

    // C sees both upstream answers.
    auto seen = agent->seen();
    auto it = std::find_if(seen.begin(), seen.end(), [](const TaskSpec& s) { return s.prompt == "C"; });
    ASSERT_NE(it, seen.end());
    EXPECT_EQ(it->context.at("A"), "ok A");
    EXPECT_EQ(it->context.at("B"), "ok B");
}

TEST(Orchestrator, AgentFailureAfterExactlyMaxRetriesPlusOneAttempts) {
    TaskGraph g;
    g.add_task(make_task("t"));
    auto agent = failing_agent("down");

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({agent}));

    const auto& t = r.tasks.at("t");
    EXPECT_EQ(t.status, TaskStatus::Failed);
    EXPECT_EQ(*t.failure, FailureReason::AgentFailure);
    EXPECT_EQ(t.attempts, 3);
    EXPECT_EQ(t.retry_count, 2);
    EXPECT_EQ(agent->calls(), 3);
    EXPECT_EQ(r.agents.at("down").failures, 3u);
    EXPECT_NE(t.detail.find("down"), std::string::npos);
}

TEST(Orchestrator, TaskMaxRetriesOverridesRunDefault) {
    TaskGraph g;
    Task t = make_task("t");
    t.max_retries = 0;
    g.add_task(std::move(t));
    auto agent = failing_agent("down");

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({agent}));
    EXPECT_EQ(r.tasks.at("t").attempts, 1);
    EXPECT_EQ(agent->calls(), 1);
}

TEST(Orchestrator, TransientFailureRecoversOnRetry) {
    TaskGraph g;
    g.add_task(make_task("t"));
    auto flaky = std::make_shared<FakeAgent>("flaky", [](const TaskSpec&, int call) {
        if (call < 3) throw AgentTimeout("slow model");
        return text_answer("finally");
    });

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({flaky}));
    const auto& t = r.tasks.at("t");
    EXPECT_EQ(t.status, TaskStatus::Succeeded);
    EXPECT_EQ(t.retry_count, 2);
    EXPECT_EQ(t.result->payload, "finally");

    std::vector<TaskStatus> seq;
    for (const auto& e : r.events_for("t")) seq.push_back(e.status);
    std::vector<TaskStatus> expected{TaskStatus::Running, TaskStatus::Ready, TaskStatus::Running,
                                     TaskStatus::Ready, TaskStatus::Running, TaskStatus::Succeeded};
    EXPECT_EQ(seq, expected);
}

TEST(Orchestrator, EmptyAnswerIsAFailedAttempt) {
    TaskGraph g;
    g.add_task(make_task("t"));
    auto blank = constant_agent("blank", "  ");
    auto ctx = fast_context({blank});
    ctx.config.max_retries = 1;

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);
    EXPECT_EQ(*r.tasks.at("t").failure, FailureReason::AgentFailure);
    EXPECT_EQ(blank->calls(), 2);
}

TEST(Orchestrator, UpstreamFailureNeverInvokesAgentsForDependents) {
    TaskGraph g;
    g.add_task(make_task("A"));
    g.add_task(make_task("B", 0, {"A"}));
    g.add_task(make_task("C", 0, {"B"}));
    g.add_task(make_task("D"));

    auto agent = std::make_shared<FakeAgent>("w", [](const TaskSpec& spec, int) -> AgentAnswer {
        if (spec.prompt == "A") throw AgentUnavailable("A always breaks");
        return text_answer("ok");
    });
    auto ctx = fast_context({agent});
    ctx.config.max_retries = 1;

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);

    EXPECT_EQ(*r.tasks.at("A").failure, FailureReason::AgentFailure);
    EXPECT_EQ(*r.tasks.at("B").failure, FailureReason::UpstreamFailure);
    EXPECT_EQ(*r.tasks.at("C").failure, FailureReason::UpstreamFailure);
    EXPECT_EQ(r.tasks.at("D").status, TaskStatus::Succeeded);
    EXPECT_FALSE(agent->saw_prompt("B"));
    EXPECT_FALSE(agent->saw_prompt("C"));
    EXPECT_FALSE(r.first_seq("B", TaskStatus::Running).has_value());
    EXPECT_EQ(r.tasks.at("B").attempts, 0);
    EXPECT_EQ(r.count(FailureReason::UpstreamFailure), 2u);
}

TEST(Orchestrator, ConsensusAcceptsMajorityAnswer) {
    TaskGraph g;
    Task t = make_task("vote");
    t.consensus = ConsensusSetting::with_faults(1);
    g.add_task(std::move(t));

    auto a1 = constant_agent("a1", "42");
    auto a2 = constant_agent("a2", "41");
    auto a3 = constant_agent("a3", " 42 ");
    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({a1, a2, a3}));

    const auto& vote = r.tasks.at("vote");
    ASSERT_EQ(vote.status, TaskStatus::Succeeded);
    EXPECT_EQ(normalize_text(vote.result->payload.get<std::string>()), "42");
    EXPECT_EQ(vote.result->task_id, "vote");
    EXPECT_TRUE(r.first_seq("vote", TaskStatus::AwaitingConsensus).has_value());
    EXPECT_EQ(a1->calls() + a2->calls() + a3->calls(), 3);
}

TEST(Orchestrator, ConsensusFailureAfterEveryRoundDisagrees) {
    TaskGraph g;
    g.add_task(make_task("vote"));

    auto a1 = constant_agent("a1", "alpha");
    auto a2 = constant_agent("a2", "beta");
    auto a3 = constant_agent("a3", "gamma");
    auto ctx = fast_context({a1, a2, a3});
    ctx.config.consensus.default_setting = ConsensusSetting::with_faults(1);
    ctx.config.max_retries = 1;

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);

    const auto& vote = r.tasks.at("vote");
    EXPECT_EQ(vote.status, TaskStatus::Failed);
    EXPECT_EQ(*vote.failure, FailureReason::ConsensusFailure);
    EXPECT_EQ(vote.attempts, 2);
    EXPECT_EQ(a1->calls() + a2->calls() + a3->calls(), 6);
    EXPECT_NE(vote.detail.find("no-quorum"), std::string::npos);
}

TEST(Orchestrator, ConsensusRoundTimesOutWhileCallsAreOutstanding) {
    TaskGraph g;
    Task t = make_task("vote");
    t.max_retries = 0;
    g.add_task(std::move(t));

    auto ctx = fast_context({constant_agent("a1", "x"), constant_agent("a2", "y"), constant_agent("slow", "x", 300)});
    ctx.config.consensus.overrides["vote"] = ConsensusSetting::with_faults(1);
    ctx.config.consensus_timeout_ms = 50;

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);
    const auto& vote = r.tasks.at("vote");
    EXPECT_EQ(*vote.failure, FailureReason::ConsensusFailure);
    EXPECT_NE(vote.detail.find("timed-out"), std::string::npos);
    EXPECT_EQ(r.agents.at("slow").calls, 1u);
}

TEST(Orchestrator, RotationMovesRetriesToOtherAgents) {
    auto graph = [] {
        TaskGraph g;
        g.add_task(make_task("t"));
        return g;
    };

    auto down = failing_agent("down");
    auto up = constant_agent("up", "fine");
    auto ctx = fast_context({down, up});
    ctx.config.max_retries = 1;

    Orchestrator orch;
    ctx.config.agent_rotation = AgentRotation::Rotate;
    RunReport rotated = orch.run(graph(), ctx);
    EXPECT_EQ(rotated.tasks.at("t").status, TaskStatus::Succeeded);
    EXPECT_EQ(rotated.tasks.at("t").result->agent_id, "up");

    ctx.config.agent_rotation = AgentRotation::Reuse;
    RunReport reused = orch.run(graph(), ctx);
    EXPECT_EQ(reused.tasks.at("t").status, TaskStatus::Failed);
    EXPECT_EQ(reused.agents.count("up"), 0u);
}

TEST(Orchestrator, RoleSelectsMatchingAgent) {
    TaskGraph g;
    Task t = make_task("code");
    t.spec.role = "coder";
    g.add_task(std::move(t));

    auto analyst = echo_agent("analyst", 0, "analyst");
    auto coder = echo_agent("coder", 0, "coder");
    Orchestrator orch;
    RunReport r = orch.run(std::move(g), fast_context({analyst, coder}));
    EXPECT_EQ(r.tasks.at("code").result->agent_id, "coder");
    EXPECT_EQ(analyst->calls(), 0);
}

TEST(Orchestrator, SinkGetsEachAcceptedAnswerOnceAndFailuresDoNotStopTheRun) {
    TaskGraph g;
    g.add_task(make_task("a"));
    g.add_task(make_task("b", 0, {"a"}));
    g.add_task(make_task("broken"));

    auto agent = std::make_shared<FakeAgent>("w", [](const TaskSpec& spec, int) -> AgentAnswer {
        if (spec.prompt == "broken") throw AgentUnavailable("no");
        return text_answer("ok " + spec.prompt);
    });
    auto sink = std::make_shared<CollectingSink>();
    auto ctx = fast_context({agent});
    ctx.sink = sink;

    Orchestrator orch;
    orch.run(std::move(g), ctx);
    auto got = sink->got();
    EXPECT_EQ(got.size(), 2u);
    EXPECT_EQ(got["a"].size(), 1u);
    EXPECT_EQ(got["b"].front().payload, "ok b");
    EXPECT_EQ(got.count("broken"), 0u);

    TaskGraph g2;
    g2.add_task(make_task("x"));
    g2.add_task(make_task("y", 0, {"x"}));
    ctx.sink = std::make_shared<ThrowingSink>();
    RunReport r = orch.run(std::move(g2), ctx);
    EXPECT_TRUE(r.all_succeeded());
}

TEST(Orchestrator, CancellationStopsDispatchAndFailsTheRest) {
    TaskGraph g;
    g.add_task(make_task("t1"));
    g.add_task(make_task("t2", 0, {"t1"}));
    g.add_task(make_task("t3", 0, {"t2"}));
    g.add_task(make_task("t4", 0, {"t3"}));

    auto agent = echo_agent("w", 5);
    auto ctx = fast_context({agent});
    ctx.cancel = std::make_shared<CancellationToken>();
    std::uint64_t cancel_seq = 0;
    auto token = ctx.cancel;
    ctx.on_event = [&](const RunEvent& e) {
        if (e.task_id == "t2" && e.status == TaskStatus::Succeeded) {
            token->cancel();
            cancel_seq = e.seq;
        }
    };

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);

    EXPECT_TRUE(r.cancelled);
    ASSERT_GT(cancel_seq, 0u);
    EXPECT_EQ(r.tasks.at("t1").status, TaskStatus::Succeeded);
    EXPECT_EQ(r.tasks.at("t2").status, TaskStatus::Succeeded);
    for (const char* id : {"t3", "t4"}) {
        EXPECT_EQ(r.tasks.at(id).status, TaskStatus::Failed) << id;
        EXPECT_EQ(*r.tasks.at(id).failure, FailureReason::Cancelled) << id;
    }
    for (const auto& e : r.events) {
        if (e.seq > cancel_seq) EXPECT_NE(e.status, TaskStatus::Running) << e.task_id;
    }
    EXPECT_EQ(agent->calls(), 2);
}

TEST(Orchestrator, CancelWhileTasksAreInFlight) {
    TaskGraph g;
    Task keep = make_task("keep", 3);
    keep.spec.role = "keeper";
    g.add_task(std::move(keep));
    Task flaky = make_task("flaky", 2);
    flaky.spec.role = "flaky";
    g.add_task(std::move(flaky));
    Task vote = make_task("vote", 1);
    vote.spec.role = "voter";
    vote.consensus = ConsensusSetting::with_faults(1);
    g.add_task(std::move(vote));
    Task queued = make_task("queued", 0);
    queued.spec.role = "keeper";
    g.add_task(std::move(queued));
    Task later = make_task("later", 5, {"keep"});
    later.spec.role = "keeper";
    g.add_task(std::move(later));

    auto token = std::make_shared<CancellationToken>();
    std::atomic<int> started{0};
    auto wait_for = [](const std::function<bool()>& done) {
        auto until = std::chrono::steady_clock::now() + 2s;
        while (!done() && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(1ms);
    };

    // Cancels once the other three attempts are running, then still succeeds.
    auto keeper = std::make_shared<FakeAgent>("keeper", [&](const TaskSpec&, int) {
        wait_for([&] { return started.load() >= 4; });
        token->cancel();
        std::this_thread::sleep_for(20ms);
        return text_answer("kept");
    }, "keeper");
    auto breaker = std::make_shared<FakeAgent>("breaker", [&](const TaskSpec&, int) -> AgentAnswer {
        ++started;
        wait_for([&] { return token->cancelled(); });
        throw AgentUnavailable("lost connection");
    }, "flaky");
    std::vector<std::shared_ptr<Agent>> agents{keeper, breaker};
    for (const char* id : {"v1", "v2", "v3"}) {
        agents.push_back(std::make_shared<FakeAgent>(id, [&](const TaskSpec&, int) {
            ++started;
            wait_for([&] { return token->cancelled(); });
            return text_answer("yes");
        }, "voter"));
    }

    auto ctx = fast_context(agents, 3);
    ctx.cancel = token;
    std::vector<std::string> ran_after_cancel;
    ctx.on_event = [&](const RunEvent& e) {
        if (e.status == TaskStatus::Running && token->cancelled()) ran_after_cancel.push_back(e.task_id);
    };

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);

    EXPECT_TRUE(r.cancelled);
    EXPECT_TRUE(ran_after_cancel.empty());

    const auto& k = r.tasks.at("keep");
    EXPECT_EQ(k.status, TaskStatus::Succeeded);
    EXPECT_EQ(k.result->payload, "kept");

    const auto& f = r.tasks.at("flaky");
    EXPECT_EQ(f.status, TaskStatus::Failed);
    EXPECT_EQ(*f.failure, FailureReason::Cancelled);
    EXPECT_EQ(f.attempts, 1);
    EXPECT_EQ(breaker->calls(), 1);

    const auto& v = r.tasks.at("vote");
    EXPECT_EQ(v.status, TaskStatus::Succeeded);
    EXPECT_EQ(v.result->payload, "yes");
    EXPECT_TRUE(r.first_seq("vote", TaskStatus::AwaitingConsensus).has_value());

    for (const char* id : {"queued", "later"}) {
        EXPECT_EQ(*r.tasks.at(id).failure, FailureReason::Cancelled) << id;
        EXPECT_EQ(r.tasks.at(id).attempts, 0) << id;
        EXPECT_FALSE(r.first_seq(id, TaskStatus::Running).has_value()) << id;
    }
    EXPECT_EQ(keeper->calls(), 1);
}

TEST(Orchestrator, CancelledBeforeStartRunsNothing) {
    TaskGraph g;
    g.add_task(make_task("a"));
    g.add_task(make_task("b"));
    auto agent = echo_agent("w");
    auto ctx = fast_context({agent});
    ctx.cancel = std::make_shared<CancellationToken>();
    ctx.cancel->cancel();

    Orchestrator orch;
    RunReport r = orch.run(std::move(g), ctx);
    EXPECT_EQ(agent->calls(), 0);
    EXPECT_EQ(r.count(FailureReason::Cancelled), 2u);
}

TEST(Orchestrator, RejectsBadInputBeforeRunning) {
    Orchestrator orch;
    TaskGraph g;
    g.add_task(make_task("a", 0, {"ghost"}));
    EXPECT_THROW(orch.run(g, fast_context({echo_agent("w")})), UnknownDependencyError);

    TaskGraph ok;
    ok.add_task(make_task("a"));
    EXPECT_THROW(orch.run(ok, fast_context({})), ConfigError);

    auto bad = fast_context({echo_agent("w")});
    bad.config.concurrency = 0;
    EXPECT_THROW(orch.run(ok, bad), ConfigError);

    RunReport empty = orch.run(TaskGraph{}, fast_context({}));
    EXPECT_TRUE(empty.tasks.empty());
    EXPECT_TRUE(empty.all_succeeded());
}

TEST(Orchestrator, RandomGraphsAlwaysTerminate) {
    std::mt19937 rng(1234);
    for (int round = 0; round < 5; ++round) {
        TaskGraph g;
        const int n = 25;
        for (int i = 0; i < n; ++i) {
            std::vector<std::string> deps;
            for (int k = 0; k < i; ++k) {
                if (rng() % 6 == 0) deps.push_back("n" + std::to_string(k));
            }
            g.add_task(make_task("n" + std::to_string(i), (int)(rng() % 4), deps));
        }
        std::set<std::string> doomed;
        for (int i = 0; i < n; ++i) {
            if (rng() % 7 == 0) doomed.insert("n" + std::to_string(i));
        }
        auto agent = std::make_shared<FakeAgent>("w", [doomed](const TaskSpec& spec, int) -> AgentAnswer {
            if (doomed.count(spec.prompt)) throw AgentUnavailable("doomed");
            return text_answer(spec.prompt);
        });
        auto ctx = fast_context({agent}, 3);
        ctx.config.max_retries = 0;

        Orchestrator orch;
        RunReport r = orch.run(std::move(g), ctx);
        ASSERT_EQ(r.tasks.size(), (std::size_t)n);
        for (const auto& kv : r.tasks) {
            EXPECT_TRUE(is_terminal(kv.second.status)) << kv.first;
            if (kv.second.status == TaskStatus::Failed) {
                EXPECT_TRUE(kv.second.failure.has_value()) << kv.first;
            }
            if (doomed.count(kv.first) && kv.second.status == TaskStatus::Failed) {
                EXPECT_NE(*kv.second.failure, FailureReason::Cancelled);
            }
        }
        EXPECT_EQ(r.count(FailureReason::AgentFailure) + r.count(FailureReason::UpstreamFailure),
                  r.count(TaskStatus::Failed));
    }
}
