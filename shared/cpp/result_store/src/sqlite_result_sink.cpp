#include "../include/sqlite_result_sink.hpp"
#include "../../swarm_core/include/log.hpp"
#include <sqlite3.h>
#include <chrono>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

json to_json(const StoredResult& r) {
    return {
        {"run_id", r.run_id},
        {"task_id", r.task_id},
        {"agent_id", r.agent_id},
        {"payload", r.payload},
        {"confidence", r.confidence},
        {"created_at_ms", r.created_at_ms}
    };
}

SqliteResultSink::SqliteResultSink(const std::string& db_path, std::string run_id)
    : run_id_(std::move(run_id)) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        init();
        prepare_statements();
    } catch (const std::exception&) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteResultSink::~SqliteResultSink() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteResultSink::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS results (\n"
         "  run_id TEXT NOT NULL,\n"
         "  task_id TEXT NOT NULL,\n"
         "  agent_id TEXT,\n"
         "  payload TEXT,\n"
         "  confidence REAL,\n"
         "  created_at INTEGER,\n"
         "  PRIMARY KEY (run_id, task_id)\n"
         ");");
}

void SqliteResultSink::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteResultSink::prepare_statements() {
    const char* ins = "INSERT OR REPLACE INTO results \n"
                      "(run_id, task_id, agent_id, payload, confidence, created_at) \n"
                      "VALUES (?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare insert failed");
    }
    const char* one = "SELECT run_id, task_id, agent_id, payload, confidence, created_at FROM results "
                      "WHERE run_id = ? AND task_id = ?;";
    if (sqlite3_prepare_v2(db_, one, -1, &load_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare load failed");
    }
    const char* all = "SELECT run_id, task_id, agent_id, payload, confidence, created_at FROM results "
                      "WHERE run_id = ? ORDER BY created_at, task_id;";
    if (sqlite3_prepare_v2(db_, all, -1, &list_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare list failed");
    }
}

void SqliteResultSink::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (load_stmt_) { sqlite3_finalize(load_stmt_); load_stmt_ = nullptr; }
    if (list_stmt_) { sqlite3_finalize(list_stmt_); list_stmt_ = nullptr; }
}

void SqliteResultSink::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    exec("DELETE FROM results;");
}

void SqliteResultSink::accept(const std::string& task_id, const AgentAnswer& result) {
    auto ts = result.timestamp.time_since_epoch().count() == 0 ? std::chrono::system_clock::now() : result.timestamp;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, run_id_);
    bind_text(insert_stmt_, 2, task_id);
    bind_text(insert_stmt_, 3, result.agent_id);
    bind_text(insert_stmt_, 4, result.payload.dump());
    sqlite3_bind_double(insert_stmt_, 5, result.confidence);
    sqlite3_bind_int64(insert_stmt_, 6, (sqlite3_int64)ms);
    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("insert result failed: " + std::string(sqlite3_errmsg(db_)));
    }
    log_debug("store", "stored " + run_id_ + "/" + task_id);
}

StoredResult SqliteResultSink::read_row(sqlite3_stmt* st) const {
    StoredResult r;
    r.run_id = column_text(st, 0);
    r.task_id = column_text(st, 1);
    r.agent_id = column_text(st, 2);
    std::string payload = column_text(st, 3);
    try {
        r.payload = payload.empty() ? json() : json::parse(payload);
    } catch (const json::exception&) {
        r.payload = payload;
    }
    r.confidence = sqlite3_column_double(st, 4);
    r.created_at_ms = sqlite3_column_int64(st, 5);
    return r;
}

std::optional<StoredResult> SqliteResultSink::load(const std::string& run_id, const std::string& task_id) {
    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_reset(load_stmt_);
    sqlite3_clear_bindings(load_stmt_);
    bind_text(load_stmt_, 1, run_id);
    bind_text(load_stmt_, 2, task_id);
    std::optional<StoredResult> out;
    if (sqlite3_step(load_stmt_) == SQLITE_ROW) out = read_row(load_stmt_);
    sqlite3_reset(load_stmt_);
    return out;
}

std::vector<StoredResult> SqliteResultSink::list(const std::string& run_id) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<StoredResult> out;
    sqlite3_reset(list_stmt_);
    sqlite3_clear_bindings(list_stmt_);
    bind_text(list_stmt_, 1, run_id);
    while (sqlite3_step(list_stmt_) == SQLITE_ROW) out.push_back(read_row(list_stmt_));
    sqlite3_reset(list_stmt_);
    return out;
}
