#pragma once

#ifdef __cplusplus

#include "connection_pool.hpp"
#include "db.hpp"
#include "encryption.hpp"
#include "inventory.hpp"
#include "layout_strategy.hpp"
#include "log.hpp"
#include "types.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace strata {

// ============================================================================
// Configuration for storage
// ============================================================================

enum class strategy_kind {
    shared_table,
    table_per_collection
};

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    strategy_kind strategy = strategy_kind::shared_table;

    /// Per-collection indexes and encrypted fields (table_per_collection only).
    collection_config_map collection_config;

    encryption_config encryption;

    /// Open connections through a connection_pool. Ignored for in-memory
    /// databases: every pooled connection would see its own empty database.
    bool use_connection_pool = false;

    /// Pool sizing and timeouts. create_connection is filled in by storage
    /// when left empty.
    pool_options pool;

    /// Allow raw SQL through storage::execute_query.
    bool enable_cross_db_queries = true;

    logger log;

    // Default constructor - in-memory, shared table layout
    configuration() = default;

    // Path only - file-based, shared table layout
    explicit configuration(const std::string& p) : path(p) {}

    // Path + layout
    configuration(const std::string& p, strategy_kind s, collection_config_map c = {})
        : path(p), strategy(s), collection_config(std::move(c)) {}

    bool is_in_memory() const {
        return path.empty() || path == ":memory:" || path.find("mode=memory") != std::string::npos;
    }
};

/// "<dir>/sharedb_<ns>.db"
std::string database_path_for_namespace(const std::string& directory, const std::string& ns);

struct storage_stats {
    bool ready = false;
    std::string strategy;
    std::string inventory_type;
    std::optional<pool_stats> pool;
};

// ============================================================================
// storage - the coordinator
// ============================================================================
//
// Owns one layout strategy and either one connection or a pool. Store names
// are resolved here: "meta" is the metadata store, "docs" is the document
// store with an unknown collection, anything else names a collection.
//
// Every operation except initialize(), close(), is_ready() and stats() throws
// not_ready_error before touching the database when the coordinator is not
// ready.

class storage {
public:
    /// Single connection; calls are serialized on it.
    explicit storage(std::shared_ptr<connection> conn,
                     std::unique_ptr<layout_strategy> strategy = nullptr,
                     logger log = {});

    explicit storage(std::shared_ptr<connection_pool> pool,
                     std::unique_ptr<layout_strategy> strategy = nullptr,
                     logger log = {});

    /// Opens SQLite connections itself.
    explicit storage(configuration config);

    ~storage();

    storage(const storage&) = delete;
    storage& operator=(const storage&) = delete;

    /// Create the schema, then initialize or load the inventory.
    inventory initialize();

    bool is_ready() const { return ready_.load(); }

    void write_records(const record_batch& batch);

    /// Payload of the record, or nullopt when absent.
    std::optional<json> read_record(const std::string& store, const std::string& id);

    std::vector<record> read_all_records(const std::string& store);

    /// Same records as read_record per id, in no particular order.
    std::vector<record> read_records_bulk(const std::string& store, const std::vector<std::string>& ids);

    void delete_record(const std::string& store, const std::string& id);

    /// `op` is "add", "update" or "remove".
    void update_inventory(const std::string& collection,
                          const std::string& doc_id,
                          int64_t version,
                          const std::string& op);

    inventory read_inventory();

    collection_stats stats_for_collection(const std::string& collection);

    /// Raw SQL against the underlying database. Requires enable_cross_db_queries.
    std::vector<row_t> execute_query(const std::string& sql,
                                     const std::vector<column_value_t>& params = {});

    /// Drop every table the strategy owns. The coordinator is not ready
    /// afterwards until initialize() runs again.
    void delete_database();

    /// Mark not ready and release the connection or pool. Connections this
    /// coordinator opened itself are closed.
    void close();

    storage_stats stats() const;

    /// Run `fn(*this)` on a worker thread. Results and exceptions are
    /// delivered through the future.
    template<typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn, storage&>> {
        return std::async(std::launch::async,
                          [this, f = std::forward<Fn>(fn)]() mutable { return f(*this); });
    }

    layout_strategy& strategy() { return *strategy_; }
    const layout_strategy& strategy() const { return *strategy_; }

private:
    struct store_target {
        record_kind kind;
        std::optional<std::string> collection;
    };

    std::shared_ptr<connection> conn_;
    std::shared_ptr<connection_pool> pool_;
    std::unique_ptr<layout_strategy> strategy_;
    logger log_;
    bool cross_db_queries_ = true;
    bool owns_connections_ = false;

    std::atomic<bool> ready_{false};
    mutable std::mutex state_mutex_;   // guards conn_ / pool_
    std::mutex conn_mutex_;            // serializes single-connection use

    static store_target resolve_store(const std::string& store);

    void ensure_ready() const;

    /// Run `fn` on a connection without the readiness check.
    template<typename Fn>
    auto run(Fn&& fn) -> std::invoke_result_t<Fn, connection&>;
};

template<typename Fn>
auto storage::run(Fn&& fn) -> std::invoke_result_t<Fn, connection&> {
    std::shared_ptr<connection_pool> pool;
    std::shared_ptr<connection> conn;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pool = pool_;
        conn = conn_;
    }
    if (pool) {
        return pool->with_connection(std::forward<Fn>(fn));
    }
    if (!conn) {
        throw not_ready_error("storage has been closed");
    }
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return std::forward<Fn>(fn)(*conn);
}

} // namespace strata

#endif // __cplusplus
