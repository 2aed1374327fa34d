#pragma once
#include "../../swarm_core/include/result_sink.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct StoredResult {
    std::string run_id;
    std::string task_id;
    std::string agent_id;
    nlohmann::json payload;
    double confidence{0.0};
    std::int64_t created_at_ms{0};
};

nlohmann::json to_json(const StoredResult& r);

// Persists accepted answers for one run into SQLite. Several sinks may point at
// the same file; each writes under its own run id.
class SqliteResultSink : public ResultSink {
public:
    SqliteResultSink(const std::string& db_path, std::string run_id);
    ~SqliteResultSink() override;

    SqliteResultSink(const SqliteResultSink&) = delete;
    SqliteResultSink& operator=(const SqliteResultSink&) = delete;

    void accept(const std::string& task_id, const AgentAnswer& result) override;

    std::optional<StoredResult> load(const std::string& run_id, const std::string& task_id);
    std::vector<StoredResult> list(const std::string& run_id);
    void reset();

    const std::string& run_id() const { return run_id_; }

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    StoredResult read_row(struct sqlite3_stmt* st) const;

    std::string run_id_;
    std::mutex mu_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* load_stmt_ {nullptr};
    struct sqlite3_stmt* list_stmt_ {nullptr};
};
