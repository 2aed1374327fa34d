#pragma once
#include "agent.hpp"
#include "cancellation.hpp"
#include "result_sink.hpp"
#include "run_config.hpp"
#include "run_report.hpp"
#include "task_graph.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Everything one run needs. Owned by the caller of Orchestrator::run; several
// runs may proceed concurrently in one process, each with its own context.
struct RunContext {
    std::string run_id;  // generated when empty
    RunConfig config;
    std::vector<std::shared_ptr<Agent>> agents;
    std::shared_ptr<ResultSink> sink;            // optional
    std::shared_ptr<CancellationToken> cancel;   // optional
    // Called on the scheduling thread after every status transition.
    std::function<void(const RunEvent&)> on_event;
};

// Runs a task graph to completion on a bounded worker pool.
//
// Only the scheduling thread (the caller of run) changes task status. Workers
// execute one attempt each and post the outcome back; the scheduler then marks
// the task succeeded, schedules a retry after backoff, or fails it together
// with its descendants. Agent failures never escape a task: they are recorded
// in the report. The only exceptions thrown by run are graph and configuration
// errors, raised before the first dispatch.
class Orchestrator {
public:
    RunReport run(TaskGraph graph, const RunContext& ctx) const;
};
