#include "strata/sqlite_connection.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace strata {

sqlite_connection::sqlite_connection(const std::string& path, open_mode mode, logger log)
    : path_(path), mode_(mode), log_(std::move(log)) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }
    if (path.rfind("file:", 0) == 0) {
        flags |= SQLITE_OPEN_URI;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR(log_, "sqlite", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    try {
        execute("PRAGMA foreign_keys = ON");

        // WAL lets pooled readers proceed while one connection writes
        bool in_memory = path.empty() || path == ":memory:" || path.find("mode=memory") != std::string::npos;
        if (mode == open_mode::read_write && !in_memory) {
            query_all("PRAGMA journal_mode = WAL");
        }
        execute("PRAGMA temp_store = MEMORY");
    } catch (const db_error&) {
        // The destructor does not run for a constructor that throws
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }

    // Set busy timeout to handle lock contention between pooled connections (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG(log_, "sqlite", "Opened database %s", path.c_str());
}

sqlite_connection::~sqlite_connection() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void sqlite_connection::close() {
    if (!db_) return;
    if (mode_ == open_mode::read_write) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    int rc = sqlite3_close_v2(db_);
    db_ = nullptr;
    if (rc != SQLITE_OK) {
        LOG_WARN(log_, "sqlite", "Closing %s returned %d", path_.c_str(), rc);
        throw db_error("Failed to close database: " + path_);
    }
    LOG_DEBUG(log_, "sqlite", "Closed database %s", path_.c_str());
}

sqlite3* sqlite_connection::require_open() const {
    if (!db_) {
        throw db_error("Database connection is closed: " + path_);
    }
    return db_;
}

sqlite3_stmt* sqlite_connection::prepare(const std::string& sql,
                                         const std::vector<column_value_t>& params) {
    sqlite3* db = require_open();
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db));
        LOG_ERROR(log_, "sqlite", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }
    return stmt;
}

exec_result sqlite_connection::execute(const std::string& sql,
                                       const std::vector<column_value_t>& params) {
    sqlite3* db = require_open();
    if (params.empty()) {
        // Fast path for parameterless statements (may contain several)
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR(log_, "sqlite", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
    } else {
        sqlite3_stmt* stmt = prepare(sql, params);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
            auto error = std::string(sqlite3_errmsg(db));
            LOG_ERROR(log_, "sqlite", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("Execution failed: " + error + " (SQL: " + sql + ")");
        }
    }

    exec_result result;
    result.changes = sqlite3_changes(db);
    result.last_insert_id = sqlite3_last_insert_rowid(db);
    return result;
}

std::optional<row_t> sqlite_connection::query_one(const std::string& sql,
                                                  const std::vector<column_value_t>& params) {
    auto rows = run_query(sql, params, 1);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<row_t> sqlite_connection::query_all(const std::string& sql,
                                                const std::vector<column_value_t>& params) {
    return run_query(sql, params, 0);
}

std::vector<row_t> sqlite_connection::run_query(const std::string& sql,
                                                const std::vector<column_value_t>& params,
                                                size_t max_rows) {
    sqlite3_stmt* stmt = prepare(sql, params);

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);
    int rc;

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
        if (max_rows != 0 && results.size() >= max_rows) {
            rc = SQLITE_DONE;
            break;
        }
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR(log_, "sqlite", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Query failed: " + error);
    }

    return results;
}

void sqlite_connection::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t sqlite_connection::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

void sqlite_connection::begin_transaction() {
    sqlite3* db = require_open();
    // IMMEDIATE: take the write lock up front so a batch never fails halfway
    // on lock upgrade; WAL readers on other connections are unaffected.
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the lock
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db));
        LOG_ERROR(log_, "sqlite", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void sqlite_connection::commit() {
    execute("COMMIT");
}

void sqlite_connection::rollback() {
    execute("ROLLBACK");
}

bool sqlite_connection::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

} // namespace strata
