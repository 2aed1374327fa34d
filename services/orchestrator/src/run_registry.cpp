#include "../include/run_registry.hpp"
#include "../../../shared/cpp/swarm_core/include/errors.hpp"
#include "../../../shared/cpp/swarm_core/include/log.hpp"
#include "../../../shared/cpp/swarm_core/include/util.hpp"
#include <utility>

using json = nlohmann::json;

std::string to_string(RunPhase p) {
    switch (p) {
    case RunPhase::Running: return "running";
    case RunPhase::Succeeded: return "succeeded";
    case RunPhase::Failed: return "failed";
    case RunPhase::Cancelled: return "cancelled";
    case RunPhase::Error: return "error";
    }
    return "unknown";
}

RunRegistry::RunRegistry(AgentFactory agents, SinkFactory sinks, std::size_t keep_finished)
    : agents_(std::move(agents)), sinks_(std::move(sinks)), keep_finished_(keep_finished) {
    if (!agents_) throw ConfigError("run registry needs an agent factory");
}

RunRegistry::~RunRegistry() {
    shutdown();
}

std::string RunRegistry::submit(TaskGraph graph, RunConfig config, const json& agents) {
    config.validate();
    graph.validate();

    RunContext ctx;
    ctx.run_id = gen_id();
    ctx.config = std::move(config);
    ctx.agents = agents_(agents);
    if (ctx.agents.empty()) throw ConfigError("no agents configured");
    if (sinks_) ctx.sink = sinks_(ctx.run_id);
    ctx.cancel = std::make_shared<CancellationToken>();

    auto entry = std::make_shared<Entry>();
    entry->id = ctx.run_id;
    entry->cancel = ctx.cancel;
    entry->started = std::chrono::system_clock::now();
    for (const auto& id : graph.ids()) entry->live[id] = graph.task(id).status;

    std::weak_ptr<Entry> weak = entry;
    ctx.on_event = [this, weak](const RunEvent& ev) {
        auto e = weak.lock();
        if (!e) return;
        std::lock_guard<std::mutex> lk(mu_);
        e->live[ev.task_id] = ev.status;
    };

    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lk(mu_);
        reap_locked(finished);
        runs_[entry->id] = entry;
        entry->worker = std::thread(&RunRegistry::execute, this, entry, std::move(graph), std::move(ctx));
        log_info("orchestrator", "run " + entry->id + " submitted with " + std::to_string(entry->live.size()) + " tasks");
    }
    for (auto& t : finished) t.join();
    return entry->id;
}

void RunRegistry::reap_locked(std::vector<std::thread>& finished) {
    for (auto& kv : runs_) {
        Entry& e = *kv.second;
        if (e.phase != RunPhase::Running && e.worker.joinable()) finished.push_back(std::move(e.worker));
    }
    while (finished_order_.size() > keep_finished_) {
        auto it = runs_.find(finished_order_.front());
        if (it != runs_.end()) {
            if (it->second->worker.joinable()) finished.push_back(std::move(it->second->worker));
            log_debug("orchestrator", "forgetting finished run " + it->first);
            runs_.erase(it);
        }
        finished_order_.pop_front();
    }
}

void RunRegistry::execute(std::shared_ptr<Entry> entry, TaskGraph graph, RunContext ctx) {
    std::optional<RunReport> report;
    std::string error;
    try {
        report = orchestrator_.run(std::move(graph), ctx);
    } catch (const std::exception& e) {
        error = e.what();
        log_error("orchestrator", "run " + entry->id + " aborted: " + error);
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (report) {
            for (const auto& kv : report->tasks) entry->live[kv.first] = kv.second.status;
            if (report->cancelled) entry->phase = RunPhase::Cancelled;
            else entry->phase = report->all_succeeded() ? RunPhase::Succeeded : RunPhase::Failed;
            entry->report = std::move(report);
        } else {
            entry->phase = RunPhase::Error;
            entry->error = error;
        }
        finished_order_.push_back(entry->id);
    }
    cv_.notify_all();
}

json RunRegistry::summary(const Entry& e) const {
    json counts = json::object();
    for (const auto& kv : e.live) {
        auto key = to_string(kv.second);
        counts[key] = counts.value(key, 0) + 1;
    }
    json j = {
        {"id", e.id},
        {"state", to_string(e.phase)},
        {"tasks", e.live.size()},
        {"counts", counts},
        {"started_ms", std::chrono::duration_cast<std::chrono::milliseconds>(e.started.time_since_epoch()).count()}
    };
    if (!e.error.empty()) j["error"] = e.error;
    return j;
}

std::optional<json> RunRegistry::describe(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    const Entry& e = *it->second;
    json j = summary(e);
    if (e.report) {
        j["report"] = to_json(*e.report);
    } else {
        json live = json::object();
        for (const auto& kv : e.live) live[kv.first] = to_string(kv.second);
        j["live"] = live;
    }
    return j;
}

json RunRegistry::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    json arr = json::array();
    for (const auto& kv : runs_) arr.push_back(summary(*kv.second));
    return arr;
}

json RunRegistry::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    json by_phase = json::object();
    json by_status = json::object();
    for (const auto& kv : runs_) {
        const Entry& e = *kv.second;
        auto p = to_string(e.phase);
        by_phase[p] = by_phase.value(p, 0) + 1;
        for (const auto& t : e.live) {
            auto s = to_string(t.second);
            by_status[s] = by_status.value(s, 0) + 1;
        }
    }
    return json{{"runs", runs_.size()}, {"runs_by_state", by_phase}, {"tasks_by_status", by_status}};
}

bool RunRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return false;
    it->second->cancel->cancel();
    log_info("orchestrator", "cancel requested for run " + id);
    return true;
}

bool RunRegistry::wait(const std::string& id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return false;
    auto entry = it->second;
    return cv_.wait_for(lk, timeout, [&] { return entry->phase != RunPhase::Running; });
}

std::optional<RunPhase> RunRegistry::phase(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = runs_.find(id);
    if (it == runs_.end()) return std::nullopt;
    return it->second->phase;
}

void RunRegistry::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : runs_) {
            kv.second->cancel->cancel();
            if (kv.second->worker.joinable()) workers.push_back(std::move(kv.second->worker));
        }
    }
    for (auto& t : workers) t.join();
}
