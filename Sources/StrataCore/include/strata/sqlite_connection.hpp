#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "log.hpp"
#include <sqlite3.h>
#include <string>

namespace strata {

/// SQLite binding of the database operation contract.
class sqlite_connection : public connection {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access (for concurrent readers)
    };

    explicit sqlite_connection(const std::string& path,
                               open_mode mode = open_mode::read_write,
                               logger log = {});
    ~sqlite_connection() override;

    // Non-copyable
    sqlite_connection(const sqlite_connection&) = delete;
    sqlite_connection& operator=(const sqlite_connection&) = delete;

    using connection::execute;
    using connection::query_one;
    using connection::query_all;

    exec_result execute(const std::string& sql,
                        const std::vector<column_value_t>& params) override;
    std::optional<row_t> query_one(const std::string& sql,
                                   const std::vector<column_value_t>& params) override;
    std::vector<row_t> query_all(const std::string& sql,
                                 const std::vector<column_value_t>& params) override;

    void begin_transaction() override;
    void commit() override;
    void rollback() override;
    bool is_in_transaction() const override;
    void close() override;

    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    logger log_;

    sqlite3* require_open() const;
    sqlite3_stmt* prepare(const std::string& sql, const std::vector<column_value_t>& params);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    std::vector<row_t> run_query(const std::string& sql,
                                 const std::vector<column_value_t>& params,
                                 size_t max_rows);
};

} // namespace strata

#endif // __cplusplus
