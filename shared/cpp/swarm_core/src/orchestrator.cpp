#include "../include/orchestrator.hpp"
#include "../include/blocking_queue.hpp"
#include "../include/call_ledger.hpp"
#include "../include/consensus.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include "../include/worker_pool.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

// Upper bound on how long the scheduler sleeps before re-checking
// cancellation and retry deadlines.
const std::chrono::milliseconds kSchedulerTick{20};

struct Attempt {
    std::string task_id;
    bool ok{false};
    std::optional<AgentAnswer> answer;
    FailureReason reason{FailureReason::AgentFailure};
    std::string detail;
};

struct WorkerMessage {
    enum class Kind { AwaitingConsensus, Finished };
    Kind kind{Kind::Finished};
    Attempt attempt;
};

struct CallResult {
    bool ok{false};
    AgentAnswer answer;
    std::string error;
};

// One propose() call with its failure modes folded into the result.
CallResult call_agent(Agent& agent, const TaskSpec& spec, const std::string& task_id, CallLedger& ledger) {
    auto t0 = Clock::now();
    CallResult r;
    try {
        r.answer = agent.propose(spec);
        if (r.answer.empty()) r.error = "empty answer";
        else r.ok = true;
    } catch (const AgentTimeout& e) {
        r.error = std::string("timeout: ") + e.what();
    } catch (const AgentUnavailable& e) {
        r.error = std::string("unavailable: ") + e.what();
    } catch (const std::exception& e) {
        r.error = e.what();
    }
    double ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    ledger.record(agent.id(), r.ok, ms);
    if (r.ok) {
        r.answer.task_id = task_id;
        if (r.answer.agent_id.empty()) r.answer.agent_id = agent.id();
        if (r.answer.timestamp == std::chrono::system_clock::time_point{}) {
            r.answer.timestamp = std::chrono::system_clock::now();
        }
    } else {
        log_debug("agent", agent.id() + " failed on task " + task_id + ": " + r.error);
    }
    return r;
}

class RunState {
public:
    RunState(TaskGraph graph, const RunContext& ctx)
        : graph_(std::move(graph)),
          ctx_(ctx),
          run_id_(ctx.run_id.empty() ? gen_id() : ctx.run_id),
          engine_(ConsensusOptions{ctx.config.similarity_threshold}),
          pool_((std::size_t)ctx.config.concurrency) {}

    RunReport execute();

private:
    std::vector<std::shared_ptr<Agent>> pick_agents(const Task& t, std::size_t count, int attempt) const;
    void dispatch_ready();
    void dispatch(const std::string& id);
    Attempt run_single(const Task& task, int attempt);
    Attempt run_consensus(const Task& task, int attempt, int f);
    void apply(const WorkerMessage& m);
    void finish(const Attempt& a);
    void fail_task(const std::string& id, FailureReason reason, const std::string& detail);
    void cancel_remaining();
    void emit(const std::string& id, const std::string& detail = {});
    Clock::time_point next_wake() const;
    long long since_start_ms(Clock::time_point t) const;
    RunReport build_report();

    TaskGraph graph_;
    const RunContext& ctx_;
    std::string run_id_;
    ConsensusEngine engine_;
    CallLedger calls_;
    BlockingQueue<WorkerMessage> inbox_;
    WorkerPool pool_;  // declared last: its threads reference the members above

    std::size_t inflight_{0};
    bool cancel_seen_{false};
    std::map<std::string, Clock::time_point> retry_at_;
    std::map<std::string, int> attempts_;
    std::map<std::string, Clock::time_point> first_dispatch_;
    std::map<std::string, Clock::time_point> finished_at_;
    std::vector<RunEvent> events_;
    std::uint64_t seq_{0};
    Clock::time_point start_;
};

RunReport RunState::execute() {
    start_ = Clock::now();
    log_info("orchestrator", "run " + run_id_ + " started: " + std::to_string(graph_.size()) + " tasks, " +
             std::to_string(ctx_.agents.size()) + " agents, concurrency " + std::to_string(ctx_.config.concurrency));

    for (;;) {
        if (!cancel_seen_ && ctx_.cancel && ctx_.cancel->cancelled()) {
            cancel_seen_ = true;
            log_warn("orchestrator", "run " + run_id_ + " cancelled; waiting for " + std::to_string(inflight_) +
                     " in-flight tasks");
        }
        if (!cancel_seen_) dispatch_ready();

        if (inflight_ == 0) {
            if (cancel_seen_) {
                cancel_remaining();
                break;
            }
            if (graph_.all_terminal()) break;
            if (graph_.ready_tasks().empty()) {
                throw std::logic_error("scheduler stalled: no task is runnable in run " + run_id_);
            }
        }

        if (auto m = inbox_.pop_until(next_wake())) {
            apply(*m);
            while (auto more = inbox_.try_pop()) apply(*more);
        }
    }

    pool_.shutdown();
    calls_.join_all();
    return build_report();
}

std::vector<std::shared_ptr<Agent>> RunState::pick_agents(const Task& t, std::size_t count, int attempt) const {
    std::vector<std::shared_ptr<Agent>> candidates;
    if (!t.spec.role.empty()) {
        for (const auto& a : ctx_.agents) {
            if (a->role() == t.spec.role) candidates.push_back(a);
        }
        if (candidates.empty()) {
            log_debug("orchestrator", "no agent with role " + t.spec.role + " for task " + t.id + ", using all agents");
        }
    }
    if (candidates.empty()) candidates = ctx_.agents;

    std::size_t offset = ctx_.config.agent_rotation == AgentRotation::Rotate ? (std::size_t)attempt * count : 0;
    std::vector<std::shared_ptr<Agent>> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) out.push_back(candidates[(offset + i) % candidates.size()]);
    return out;
}

void RunState::dispatch_ready() {
    auto now = Clock::now();
    for (const auto& id : graph_.ready_tasks()) {
        if (inflight_ >= (std::size_t)ctx_.config.concurrency) break;
        if (ctx_.cancel && ctx_.cancel->cancelled()) break;
        auto it = retry_at_.find(id);
        if (it != retry_at_.end()) {
            if (it->second > now) continue;
            retry_at_.erase(it);
        }
        dispatch(id);
    }
}

void RunState::dispatch(const std::string& id) {
    graph_.mark_running(id);
    int attempt = attempts_[id]++;
    first_dispatch_.emplace(id, Clock::now());
    emit(id);

    Task snapshot = graph_.task(id);
    for (const auto& dep : snapshot.dependencies) {
        const Task& d = graph_.task(dep);
        if (d.result) snapshot.spec.context[dep] = d.result->payload;
    }
    ConsensusSetting setting = ctx_.config.consensus.setting_for(snapshot);
    log_debug("orchestrator", "dispatch " + id + " attempt " + std::to_string(attempt + 1) +
              (setting.required ? " (consensus f=" + std::to_string(setting.f) + ")" : ""));

    ++inflight_;
    bool queued = pool_.submit([this, snapshot, setting, attempt]() {
        Attempt a;
        try {
            if (setting.required) {
                WorkerMessage note;
                note.kind = WorkerMessage::Kind::AwaitingConsensus;
                note.attempt.task_id = snapshot.id;
                inbox_.push(std::move(note));
                a = run_consensus(snapshot, attempt, setting.f);
            } else {
                a = run_single(snapshot, attempt);
            }
        } catch (const std::exception& e) {
            a = Attempt{};
            a.task_id = snapshot.id;
            a.reason = setting.required ? FailureReason::ConsensusFailure : FailureReason::AgentFailure;
            a.detail = e.what();
        }
        WorkerMessage done;
        done.kind = WorkerMessage::Kind::Finished;
        done.attempt = std::move(a);
        inbox_.push(std::move(done));
    });
    if (!queued) throw std::logic_error("worker pool rejected task " + id);
}

Attempt RunState::run_single(const Task& task, int attempt) {
    Attempt a;
    a.task_id = task.id;
    a.reason = FailureReason::AgentFailure;
    auto agent = pick_agents(task, 1, attempt).front();
    CallResult r = call_agent(*agent, task.spec, task.id, calls_);
    if (r.ok) {
        a.ok = true;
        a.answer = std::move(r.answer);
    } else {
        a.detail = agent->id() + ": " + r.error;
    }
    return a;
}

Attempt RunState::run_consensus(const Task& task, int attempt, int f) {
    Attempt a;
    a.task_id = task.id;
    a.reason = FailureReason::ConsensusFailure;

    auto round = engine_.open_round(attempt + 1, f);
    auto deadline = Clock::now() + std::chrono::milliseconds(ctx_.config.consensus_timeout_ms);
    CallLedger* ledger = &calls_;
    for (const auto& agent : pick_agents(task, round->quorum_size(), attempt)) {
        TaskSpec spec = task.spec;
        std::string task_id = task.id;
        calls_.launch([agent, spec, task_id, round, ledger]() {
            CallResult r = call_agent(*agent, spec, task_id, *ledger);
            if (r.ok) round->submit(std::move(r.answer));
            else round->report_failure(agent->id(), r.error);
        });
    }

    ConsensusOutcome outcome = round->await(deadline);
    log_debug("consensus", "task " + task.id + " round " + std::to_string(round->round_number()) + ": " +
              to_string(outcome.status) + " (" + outcome.detail + ")");
    if (outcome.status == ConsensusStatus::Accepted && outcome.accepted) {
        a.ok = true;
        a.answer = std::move(*outcome.accepted);
    } else {
        a.detail = to_string(outcome.status) + ": " + outcome.detail;
    }
    return a;
}

void RunState::apply(const WorkerMessage& m) {
    const std::string& id = m.attempt.task_id;
    if (m.kind == WorkerMessage::Kind::AwaitingConsensus) {
        if (graph_.task(id).status == TaskStatus::Running) {
            graph_.mark_awaiting_consensus(id);
            emit(id);
        }
        return;
    }
    --inflight_;
    finish(m.attempt);
}

void RunState::finish(const Attempt& a) {
    const std::string& id = a.task_id;
    const Task& t = graph_.task(id);
    int attempt_no = t.retry_count + 1;

    if (a.ok) {
        std::vector<std::string> waiting;
        for (const auto& dep : graph_.dependents(id)) {
            if (graph_.contains(dep) && graph_.task(dep).status == TaskStatus::Pending) waiting.push_back(dep);
        }
        graph_.mark_succeeded(id, *a.answer);
        finished_at_[id] = Clock::now();
        emit(id);
        for (const auto& dep : waiting) {
            if (graph_.task(dep).status == TaskStatus::Ready) emit(dep);
        }
        log_info("orchestrator", "task " + id + " succeeded on attempt " + std::to_string(attempt_no) +
                 " (agent " + a.answer->agent_id + ")");
        if (ctx_.sink) {
            try {
                ctx_.sink->accept(id, *a.answer);
            } catch (const std::exception& e) {
                log_warn("orchestrator", "result sink rejected task " + id + ": " + e.what());
            }
        }
        return;
    }

    int max_retries = t.max_retries.value_or(ctx_.config.max_retries);
    if (t.retry_count < max_retries) {
        if (cancel_seen_ || (ctx_.cancel && ctx_.cancel->cancelled())) {
            graph_.mark_cancelled(id);
            finished_at_[id] = Clock::now();
            emit(id);
            return;
        }
        graph_.mark_retry(id);
        auto delay = ctx_.config.retry_backoff.delay_for(graph_.task(id).retry_count);
        retry_at_[id] = Clock::now() + delay;
        emit(id, a.detail);
        log_warn("orchestrator", "task " + id + " attempt " + std::to_string(attempt_no) + " failed (" + a.detail +
                 "); retry in " + std::to_string(delay.count()) + "ms");
        return;
    }
    fail_task(id, a.reason, a.detail);
}

void RunState::fail_task(const std::string& id, FailureReason reason, const std::string& detail) {
    auto propagated = graph_.mark_failed(id, reason, detail);
    auto now = Clock::now();
    finished_at_[id] = now;
    emit(id);
    log_error("orchestrator", "task " + id + " failed: " + to_string(reason) + (detail.empty() ? "" : " (" + detail + ")"));
    for (const auto& p : propagated) {
        finished_at_[p] = now;
        emit(p);
    }
    if (!propagated.empty()) {
        log_warn("orchestrator", std::to_string(propagated.size()) + " dependents of " + id + " will not run");
    }
}

void RunState::cancel_remaining() {
    auto now = Clock::now();
    auto remaining = graph_.non_terminal();
    for (const auto& id : remaining) {
        graph_.mark_cancelled(id);
        finished_at_[id] = now;
        emit(id);
    }
    retry_at_.clear();
    if (!remaining.empty()) {
        log_warn("orchestrator", std::to_string(remaining.size()) + " tasks cancelled in run " + run_id_);
    }
}

void RunState::emit(const std::string& id, const std::string& detail) {
    const Task& t = graph_.task(id);
    RunEvent e;
    e.seq = ++seq_;
    e.task_id = id;
    e.status = t.status;
    e.reason = t.failure;
    e.detail = detail.empty() ? t.failure_detail : detail;
    e.at_ms = since_start_ms(Clock::now());
    events_.push_back(e);
    if (ctx_.on_event) {
        try {
            ctx_.on_event(e);
        } catch (const std::exception& ex) {
            log_warn("orchestrator", std::string("event observer threw: ") + ex.what());
        }
    }
}

Clock::time_point RunState::next_wake() const {
    auto wake = Clock::now() + kSchedulerTick;
    for (const auto& kv : retry_at_) {
        if (kv.second < wake) wake = kv.second;
    }
    return wake;
}

long long RunState::since_start_ms(Clock::time_point t) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t - start_).count();
}

RunReport RunState::build_report() {
    RunReport r;
    r.run_id = run_id_;
    r.cancelled = cancel_seen_;
    r.events = events_;
    r.agents = calls_.stats();
    r.elapsed_ms = since_start_ms(Clock::now());
    for (const auto& id : graph_.ids()) {
        const Task& t = graph_.task(id);
        TaskReport tr;
        tr.id = id;
        tr.status = t.status;
        tr.failure = t.failure;
        tr.detail = t.failure_detail;
        tr.retry_count = t.retry_count;
        tr.attempts = attempts_.count(id) ? attempts_.at(id) : 0;
        tr.result = t.result;
        auto started = first_dispatch_.find(id);
        auto ended = finished_at_.find(id);
        if (started != first_dispatch_.end() && ended != finished_at_.end()) {
            tr.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(ended->second - started->second).count();
        }
        r.tasks.emplace(id, std::move(tr));
    }
    log_info("orchestrator", "run " + run_id_ + " finished in " + std::to_string(r.elapsed_ms) + "ms: " +
             std::to_string(r.count(TaskStatus::Succeeded)) + " succeeded, " +
             std::to_string(r.count(TaskStatus::Failed)) + " failed" + (r.cancelled ? " (cancelled)" : ""));
    return r;
}
}

RunReport Orchestrator::run(TaskGraph graph, const RunContext& ctx) const {
    ctx.config.validate();
    graph.validate();
    if (graph.size() > 0 && ctx.agents.empty()) throw ConfigError("no agents available for the run");
    for (const auto& a : ctx.agents) {
        if (!a) throw ConfigError("agent list contains a null agent");
    }
    RunState state(std::move(graph), ctx);
    return state.execute();
}
