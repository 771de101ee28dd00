#include "strata/storage.hpp"
#include "strata/shared_table_strategy.hpp"
#include "strata/sqlite_connection.hpp"
#include "strata/table_per_collection_strategy.hpp"
#include <stdexcept>

namespace strata {

std::string database_path_for_namespace(const std::string& directory, const std::string& ns) {
    std::string path = directory;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return path + "sharedb_" + ns + ".db";
}

storage::storage(std::shared_ptr<connection> conn,
                 std::unique_ptr<layout_strategy> strategy,
                 logger log)
    : conn_(std::move(conn)),
      strategy_(std::move(strategy)),
      log_(std::move(log)) {
    if (!conn_) {
        throw std::invalid_argument("storage requires a connection");
    }
    if (!strategy_) {
        strategy_ = std::make_unique<shared_table_strategy>(encryption_config{}, log_);
    }
}

storage::storage(std::shared_ptr<connection_pool> pool,
                 std::unique_ptr<layout_strategy> strategy,
                 logger log)
    : pool_(std::move(pool)),
      strategy_(std::move(strategy)),
      log_(std::move(log)) {
    if (!pool_) {
        throw std::invalid_argument("storage requires a connection pool");
    }
    if (!strategy_) {
        strategy_ = std::make_unique<shared_table_strategy>(encryption_config{}, log_);
    }
}

storage::storage(configuration config)
    : log_(config.log),
      cross_db_queries_(config.enable_cross_db_queries),
      owns_connections_(true) {
    switch (config.strategy) {
        case strategy_kind::table_per_collection:
            strategy_ = std::make_unique<table_per_collection_strategy>(
                std::move(config.collection_config), config.encryption, log_);
            break;
        case strategy_kind::shared_table:
            if (!config.collection_config.empty()) {
                LOG_WARN(log_, "storage", "collection_config is ignored by the shared table layout");
            }
            strategy_ = std::make_unique<shared_table_strategy>(config.encryption, log_);
            break;
    }

    const bool in_memory = config.is_in_memory();
    if (config.use_connection_pool && in_memory) {
        LOG_WARN(log_, "storage", "Connection pool disabled for in-memory database %s", config.path.c_str());
    }

    if (config.use_connection_pool && !in_memory) {
        pool_options options = std::move(config.pool);
        if (!options.create_connection) {
            options.create_connection = [path = config.path, log = log_]() -> std::shared_ptr<connection> {
                return std::make_shared<sqlite_connection>(path, sqlite_connection::open_mode::read_write, log);
            };
        }
        if (options.log.level == log_level::off) {
            options.log = log_;
        }
        pool_ = std::make_shared<connection_pool>(std::move(options));
    } else {
        conn_ = std::make_shared<sqlite_connection>(config.path, sqlite_connection::open_mode::read_write, log_);
    }

    LOG_INFO(log_, "storage", "Opened %s with %s%s", config.path.c_str(), strategy_->name(),
             pool_ ? " (pooled)" : "");
}

storage::~storage() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR(log_, "storage", "Error closing storage: %s", e.what());
    }
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

void storage::ensure_ready() const {
    if (!ready_.load()) {
        LOG_ERROR(log_, "storage", "storage has not been initialized or has been closed");
        throw not_ready_error("storage has not been initialized or has been closed");
    }
}

storage::store_target storage::resolve_store(const std::string& store) {
    if (store == "meta") {
        return {record_kind::meta, std::nullopt};
    }
    if (store == "docs") {
        return {record_kind::doc, std::nullopt};
    }
    return {record_kind::doc, store};
}

inventory storage::initialize() {
    auto inv = run([&](connection& c) {
        strategy_->initialize_schema(c);
        return strategy_->initialize_inventory(c);
    });
    ready_.store(true);
    LOG_INFO(log_, "storage", "Initialized with %s (%zu inventory entries)", strategy_->name(), inv.size());
    return inv;
}

void storage::close() {
    ready_.store(false);

    std::shared_ptr<connection_pool> pool;
    std::shared_ptr<connection> conn;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pool.swap(pool_);
        conn.swap(conn_);
    }
    if (!pool && !conn) {
        return;
    }

    if (owns_connections_) {
        if (pool) {
            pool->close();
        }
        if (conn) {
            // Wait out an operation still running on it
            std::lock_guard<std::mutex> lock(conn_mutex_);
            conn->close();
        }
    }
    LOG_INFO(log_, "storage", "Closed");
}

void storage::delete_database() {
    ensure_ready();
    run([&](connection& c) { strategy_->delete_all_tables(c); });
    ready_.store(false);
    LOG_INFO(log_, "storage", "Deleted all tables");
}

// ----------------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------------

void storage::write_records(const record_batch& batch) {
    ensure_ready();
    if (batch.empty()) {
        return;
    }
    run([&](connection& c) { strategy_->write_records(c, batch); });
}

std::optional<json> storage::read_record(const std::string& store, const std::string& id) {
    ensure_ready();
    const auto target = resolve_store(store);
    auto rec = run([&](connection& c) {
        return strategy_->read_record(c, target.kind, target.collection, id);
    });
    if (!rec) {
        return std::nullopt;
    }
    return std::move(rec->payload);
}

std::vector<record> storage::read_all_records(const std::string& store) {
    ensure_ready();
    const auto target = resolve_store(store);
    return run([&](connection& c) {
        return strategy_->read_all_records(c, target.kind, target.collection);
    });
}

std::vector<record> storage::read_records_bulk(const std::string& store, const std::vector<std::string>& ids) {
    ensure_ready();
    if (ids.empty()) {
        return {};
    }
    const auto target = resolve_store(store);

    if (strategy_->supports_bulk_read()) {
        return run([&](connection& c) {
            return strategy_->read_records_bulk(c, target.kind, target.collection, ids);
        });
    }

    // No native bulk path: one read per id, first error wins
    return run([&](connection& c) {
        std::vector<record> records;
        for (const auto& id : ids) {
            if (auto rec = strategy_->read_record(c, target.kind, target.collection, id)) {
                records.push_back(std::move(*rec));
            }
        }
        return records;
    });
}

void storage::delete_record(const std::string& store, const std::string& id) {
    ensure_ready();
    const auto target = resolve_store(store);
    run([&](connection& c) {
        strategy_->delete_record(c, target.kind, target.collection, id);
    });
}

// ----------------------------------------------------------------------------
// Inventory
// ----------------------------------------------------------------------------

void storage::update_inventory(const std::string& collection,
                               const std::string& doc_id,
                               int64_t version,
                               const std::string& op) {
    ensure_ready();
    const auto parsed = parse_inventory_op(op);
    run([&](connection& c) {
        strategy_->update_inventory_item(c, collection, doc_id, version, parsed);
    });
}

inventory storage::read_inventory() {
    ensure_ready();
    return run([&](connection& c) { return strategy_->read_inventory(c); });
}

collection_stats storage::stats_for_collection(const std::string& collection) {
    ensure_ready();
    return run([&](connection& c) { return strategy_->stats_for_collection(c, collection); });
}

std::vector<row_t> storage::execute_query(const std::string& sql, const std::vector<column_value_t>& params) {
    ensure_ready();
    if (!cross_db_queries_) {
        throw malformed_input_error("Cross-database queries are disabled");
    }
    return run([&](connection& c) { return c.query_all(sql, params); });
}

storage_stats storage::stats() const {
    storage_stats s;
    s.ready = ready_.load();
    s.strategy = strategy_->name();
    s.inventory_type = strategy_->inventory_type();

    std::shared_ptr<connection_pool> pool;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pool = pool_;
    }
    if (pool) {
        s.pool = pool->stats();
    }
    return s;
}

} // namespace strata
