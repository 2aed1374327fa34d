#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "run_registry.hpp"
#include "../../../shared/cpp/agent_sdk/include/ollama_client.hpp"
#include "../../../shared/cpp/agent_sdk/include/role_agent.hpp"
#include "../../../shared/cpp/result_store/include/sqlite_result_sink.hpp"
#include "../../../shared/cpp/swarm_core/include/log.hpp"
#include "../../../shared/cpp/swarm_core/include/util.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static RunRegistry* g_registry = nullptr;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    const std::string runs_prefix = "/runs/";
    const std::string cancel_suffix = "/cancel";
    try {
        if (ci->method == "POST" && path == "/runs") {
            auto j = json::parse(ci->body);
            TaskGraph graph = task_graph_from_json(j.at("graph"));
            RunConfig config = run_config_from_json(j.value("config", json::object()));
            std::string id = g_registry->submit(std::move(graph), std::move(config), j.value("agents", json()));
            return send_response(connection, MHD_HTTP_OK, json({{"id", id}}).dump());
        }
        if (ci->method == "GET" && path == "/runs") {
            return send_response(connection, MHD_HTTP_OK, json({{"runs", g_registry->list()}}).dump());
        }
        if (ci->method == "GET" && path == "/stats") {
            return send_response(connection, MHD_HTTP_OK, g_registry->stats().dump());
        }
        if (ci->method == "POST" && path.rfind(runs_prefix, 0) == 0 && path.size() > runs_prefix.size() + cancel_suffix.size() &&
            path.compare(path.size() - cancel_suffix.size(), cancel_suffix.size(), cancel_suffix) == 0) {
            std::string id = path.substr(runs_prefix.size(), path.size() - runs_prefix.size() - cancel_suffix.size());
            if (!g_registry->cancel(id)) {
                return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error", "unknown run " + id}}).dump());
            }
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
        }
        if (ci->method == "GET" && path.rfind(runs_prefix, 0) == 0) {
            std::string id = path.substr(runs_prefix.size());
            if (id.empty()) {
                json err = {{"error", "id required"}};
                return send_response(connection, MHD_HTTP_BAD_REQUEST, err.dump());
            }
            auto d = g_registry->describe(id);
            if (!d) return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error", "unknown run " + id}}).dump());
            return send_response(connection, MHD_HTTP_OK, d->dump());
        }
        return send_response(connection, MHD_HTTP_NOT_FOUND, json({{"error", "not found"}}).dump());
    } catch (const std::exception& e) {
        json err = {{"error", e.what()}};
        return send_response(connection, MHD_HTTP_BAD_REQUEST, err.dump());
    }
}

int main(int, char**) {
    try {
        set_log_level(log_level_from_string(getenv_or("SWARM_LOG_LEVEL", "info")));

        int port = 7100;
        try {
            port = std::stoi(getenv_or("SWARM_PORT", "7100"));
        } catch (const std::exception&) {
            std::cerr << "[orchestrator] Warning: SWARM_PORT is not a number, using " << port << "\n";
        }

        OllamaConfig ocfg = ollama_config_from_env();
        auto llm = std::make_shared<OllamaClient>(ocfg);
        std::string db_path = getenv_or("SWARM_DB_PATH", "swarm_results.db");
        std::size_t keep_runs = 100;
        try {
            keep_runs = (std::size_t)std::stoul(getenv_or("SWARM_KEEP_RUNS", "100"));
        } catch (const std::exception&) {
            std::cerr << "[orchestrator] Warning: SWARM_KEEP_RUNS is not a number, keeping " << keep_runs << " runs\n";
        }

        RunRegistry registry(
            [llm, ocfg](const json& agents) { return agents_from_json(agents, llm, ocfg); },
            [db_path](const std::string& run_id) -> std::shared_ptr<ResultSink> {
                if (db_path.empty()) return nullptr;
                return std::make_shared<SqliteResultSink>(db_path, run_id);
            },
            keep_runs);
        g_registry = &registry;

        std::cout << "[orchestrator] Starting HTTP server on port " << port << "...\n";
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port, nullptr, nullptr,
                                                &handler, nullptr,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            std::cerr << "[orchestrator] Failed to start HTTP server" << std::endl;
            return 1;
        }
        std::signal(SIGTERM, [](int){});
        std::signal(SIGINT, [](int){});
        pause();
        std::cout << "[orchestrator] Stopping, cancelling active runs" << std::endl;
        MHD_stop_daemon(d);
        registry.shutdown();
        g_registry = nullptr;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
