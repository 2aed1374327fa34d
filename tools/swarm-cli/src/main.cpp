#include "../../../shared/cpp/agent_sdk/include/decomposer.hpp"
#include "../../../shared/cpp/agent_sdk/include/ollama_client.hpp"
#include "../../../shared/cpp/agent_sdk/include/role_agent.hpp"
#include "../../../shared/cpp/result_store/include/sqlite_result_sink.hpp"
#include "../../../shared/cpp/swarm_core/include/log.hpp"
#include "../../../shared/cpp/swarm_core/include/orchestrator.hpp"
#include "../../../shared/cpp/swarm_core/include/util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

static void usage() {
    std::cerr << "swarm_cli usage:\n"
              << "  run --graph <file> [--config <file>] [--concurrency N] [--db <dbfile>] [--ollama <url>] [--model <name>] [--out <file>]\n"
              << "  decompose --goal \"...\" [--run] [--config <file>] [--concurrency N] [--db <dbfile>] [--ollama <url>] [--model <name>]\n"
              << "  validate --graph <file>\n"
              << "  status [--ollama <url>]\n";
}

static json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return json::parse(ss.str());
    } catch (const json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

struct RunOptions {
    std::string config_path;
    int concurrency{0};  // 0: keep config value
    std::string db = getenv_or("SWARM_DB_PATH", "");
    std::string out;
};

// Runs the graph and prints the report. Exit code 0 when every task succeeded, 3 otherwise.
static int run_graph(TaskGraph graph, const RunOptions& opts, const OllamaConfig& ocfg) {
    json cfgj = opts.config_path.empty() ? json::object() : read_json_file(opts.config_path);
    RunContext ctx;
    ctx.run_id = gen_id();
    ctx.config = run_config_from_json(cfgj);
    if (opts.concurrency > 0) ctx.config.concurrency = opts.concurrency;

    auto llm = std::make_shared<OllamaClient>(ocfg);
    ctx.agents = agents_from_json(cfgj.value("agents", json()), llm, ocfg);
    if (!opts.db.empty()) ctx.sink = std::make_shared<SqliteResultSink>(opts.db, ctx.run_id);
    ctx.on_event = [](const RunEvent& e) {
        std::string line = e.task_id + " -> " + to_string(e.status);
        if (e.reason) line += " (" + to_string(*e.reason) + ")";
        log_info("swarm_cli", line);
    };

    ctx.cancel = std::make_shared<CancellationToken>();
    RunReport report;
    {
        ScopedSigintCancel on_interrupt(ctx.cancel);
        Orchestrator orch;
        report = orch.run(std::move(graph), ctx);
    }

    json out = to_json(report);
    if (!opts.out.empty()) {
        std::ofstream f(opts.out);
        if (!f) throw std::runtime_error("cannot write " + opts.out);
        f << out.dump(2) << "\n";
    } else {
        std::cout << out.dump(2) << "\n";
    }
    std::cout << "[OK] run " << report.run_id << ": "
              << report.count(TaskStatus::Succeeded) << " succeeded, "
              << report.count(TaskStatus::Failed) << " failed in " << report.elapsed_ms << " ms\n";
    return report.all_succeeded() ? 0 : 3;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        set_log_level(log_level_from_string(getenv_or("SWARM_LOG_LEVEL", "info")));
        OllamaConfig ocfg = ollama_config_from_env();
        RunOptions opts;
        std::string graph_path;
        std::string goal;
        bool then_run = false;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--graph" && i + 1 < argc) graph_path = argv[++i];
            else if (a == "--config" && i + 1 < argc) opts.config_path = argv[++i];
            else if (a == "--concurrency" && i + 1 < argc) opts.concurrency = std::stoi(argv[++i]);
            else if (a == "--db" && i + 1 < argc) opts.db = argv[++i];
            else if (a == "--out" && i + 1 < argc) opts.out = argv[++i];
            else if (a == "--ollama" && i + 1 < argc) ocfg.url = argv[++i];
            else if (a == "--model" && i + 1 < argc) ocfg.chat_model = argv[++i];
            else if (a == "--goal" && i + 1 < argc) goal = argv[++i];
            else if (a == "--run") then_run = true;
            else { std::cerr << "[swarm_cli] Warning: ignoring argument " << a << "\n"; }
        }

        if (cmd == "run") {
            if (graph_path.empty()) { usage(); return 2; }
            TaskGraph graph = task_graph_from_json(read_json_file(graph_path));
            return run_graph(std::move(graph), opts, ocfg);
        } else if (cmd == "decompose") {
            if (goal.empty()) { usage(); return 2; }
            TaskDecomposer decomposer(std::make_shared<OllamaClient>(ocfg), ocfg.chat_model);
            TaskGraph graph = decomposer.decompose(goal);
            std::cout << task_graph_to_json(graph).dump(2) << "\n";
            if (!then_run) return 0;
            return run_graph(std::move(graph), opts, ocfg);
        } else if (cmd == "validate") {
            if (graph_path.empty()) { usage(); return 2; }
            TaskGraph graph = task_graph_from_json(read_json_file(graph_path));
            std::cout << "[OK] " << graph.size() << " tasks, no cycles\n";
            std::cout << "Ready first:";
            for (const auto& id : graph.ready_tasks()) std::cout << " " << id;
            std::cout << "\n";
            return 0;
        } else if (cmd == "status") {
            OllamaClient client(ocfg);
            if (!client.is_healthy()) {
                std::cerr << "[ERROR] Ollama not reachable at " << ocfg.url << "\n";
                return 1;
            }
            std::cout << "[OK] Ollama at " << ocfg.url << "\n";
            for (const auto& m : client.list_models()) std::cout << "  " << m << "\n";
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
