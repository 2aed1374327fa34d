#pragma once
#include "../../../shared/cpp/swarm_core/include/orchestrator.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class RunPhase { Running, Succeeded, Failed, Cancelled, Error };

std::string to_string(RunPhase p);

// Builds the agents for a run from the request's "agents" value (may be null).
using AgentFactory = std::function<std::vector<std::shared_ptr<Agent>>(const nlohmann::json& agents)>;
// Builds the result sink for a run. May return null.
using SinkFactory = std::function<std::shared_ptr<ResultSink>(const std::string& run_id)>;

// Owns the runs started by the service. Each run executes Orchestrator::run
// on its own thread with its own context; live task statuses are kept from the
// run's event stream so they can be reported while the run is in progress.
// Threads of finished runs are joined on the next submit, and only the most
// recent `keep_finished` finished runs stay queryable.
class RunRegistry {
public:
    explicit RunRegistry(AgentFactory agents, SinkFactory sinks = {}, std::size_t keep_finished = 100);
    ~RunRegistry();

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;

    // Starts a run and returns its id. Agent and sink construction errors are
    // thrown here, before any thread starts.
    std::string submit(TaskGraph graph, RunConfig config, const nlohmann::json& agents = nullptr);

    std::optional<nlohmann::json> describe(const std::string& id) const;
    nlohmann::json list() const;
    nlohmann::json stats() const;
    // False when the id is unknown.
    bool cancel(const std::string& id);

    // Blocks until the run leaves Running or the timeout expires.
    bool wait(const std::string& id, std::chrono::milliseconds timeout) const;
    std::optional<RunPhase> phase(const std::string& id) const;

    // Cancels every run and joins their threads.
    void shutdown();

private:
    struct Entry {
        std::string id;
        RunPhase phase{RunPhase::Running};
        std::map<std::string, TaskStatus> live;
        std::optional<RunReport> report;
        std::string error;
        std::shared_ptr<CancellationToken> cancel;
        std::chrono::system_clock::time_point started{};
        std::thread worker;
    };

    void execute(std::shared_ptr<Entry> entry, TaskGraph graph, RunContext ctx);
    // Moves out the threads of finished runs and forgets the oldest finished
    // runs beyond the retention limit. The caller joins the threads.
    void reap_locked(std::vector<std::thread>& finished);
    nlohmann::json summary(const Entry& e) const;

    AgentFactory agents_;
    SinkFactory sinks_;
    std::size_t keep_finished_;
    Orchestrator orchestrator_;
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<Entry>> runs_;
    std::deque<std::string> finished_order_;
};
