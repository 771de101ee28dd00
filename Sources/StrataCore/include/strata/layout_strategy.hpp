#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "encryption.hpp"
#include "inventory.hpp"
#include "log.hpp"
#include "types.hpp"
#include <atomic>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata {

// ============================================================================
// Layout strategy - how logical collections map onto physical tables
// ============================================================================
//
// A strategy issues every statement the storage layer runs. It is handed a
// live connection per call and never knows whether that connection came from
// a pool. A collection of nullopt means "unknown": the caller only has an id.

class layout_strategy {
public:
    explicit layout_strategy(encryption_config encryption = {}, logger log = {})
        : encryption_(std::move(encryption)), log_(std::move(log)) {}
    virtual ~layout_strategy() = default;

    layout_strategy(const layout_strategy&) = delete;
    layout_strategy& operator=(const layout_strategy&) = delete;

    virtual const char* name() const = 0;

    /// "json" (single document) or "table" (relational rows)
    virtual const char* inventory_type() const = 0;

    // ------------------------------------------------------------------------
    // Schema
    // ------------------------------------------------------------------------

    /// Create every table and index the strategy needs. Idempotent.
    virtual void initialize_schema(connection& conn) = 0;

    /// True if the minimum required tables exist. Never mutates.
    virtual bool validate_schema(connection& conn) = 0;

    /// Physical table for a logical collection (reserved names included).
    virtual std::string table_name_for(const std::string& collection) const = 0;

    /// Drop every table this strategy owns, and nothing else.
    virtual void delete_all_tables(connection& conn) = 0;

    // ------------------------------------------------------------------------
    // Records
    // ------------------------------------------------------------------------

    /// Write a batch atomically. Every doc must carry payload.collection;
    /// each doc write also upserts its inventory entry.
    virtual void write_records(connection& conn, const record_batch& batch) = 0;

    virtual std::optional<record> read_record(connection& conn,
                                              record_kind kind,
                                              const std::optional<std::string>& collection,
                                              const std::string& id) = 0;

    virtual std::vector<record> read_all_records(connection& conn,
                                                 record_kind kind,
                                                 const std::optional<std::string>& collection) = 0;

    /// Strategies without a native bulk path return false; callers then fall
    /// back to read_record per id.
    virtual bool supports_bulk_read() const { return false; }

    virtual std::vector<record> read_records_bulk(connection& conn,
                                                  record_kind kind,
                                                  const std::optional<std::string>& collection,
                                                  const std::vector<std::string>& ids);

    /// Missing rows and missing tables are no-ops. Deleting a doc also drops
    /// its inventory entry.
    virtual void delete_record(connection& conn,
                               record_kind kind,
                               const std::optional<std::string>& collection,
                               const std::string& id) = 0;

    // ------------------------------------------------------------------------
    // Inventory
    // ------------------------------------------------------------------------

    virtual void update_inventory_item(connection& conn,
                                       const std::string& collection,
                                       const std::string& doc_id,
                                       int64_t version,
                                       inventory_op op) = 0;

    virtual inventory read_inventory(connection& conn) = 0;

    /// Create an empty inventory if none exists; never overwrites.
    virtual inventory initialize_inventory(connection& conn) = 0;

    virtual collection_stats stats_for_collection(connection& conn, const std::string& collection);

    // ------------------------------------------------------------------------
    // Encryption
    // ------------------------------------------------------------------------

    json encrypt_record_for_collection(const record& rec, const std::string& collection) const;
    record decrypt_record_for_collection(const json& stored, const std::string& collection) const;

    const encryption_config& encryption() const { return encryption_; }

    /// Test-only: run write_records without a transaction.
    void set_transactions_enabled(bool enabled) { transactions_enabled_.store(enabled); }
    bool transactions_enabled() const { return transactions_enabled_.load(); }

protected:
    encryption_config encryption_;
    logger log_;

    /// Upper bound on bound parameters per IN (...) statement.
    static constexpr size_t max_bound_parameters = 500;

    /// Fields encrypted individually for a collection; empty = whole payload.
    virtual std::set<std::string> encrypted_fields_for(const std::string& collection) const;

    /// Run `body` in a transaction unless transactions are disabled.
    template<typename Fn>
    void run_batch(connection& conn, Fn&& body) {
        if (transactions_enabled()) {
            conn.transaction(std::forward<Fn>(body));
        } else {
            std::forward<Fn>(body)(conn);
        }
    }

    /// Execute DDL, reporting failures as schema_error.
    void run_ddl(connection& conn, const std::string& sql) const;

    static bool table_exists(connection& conn, const std::string& table);

    /// payload.collection of a doc record; throws malformed_input_error.
    static std::string collection_of(const record& rec);

    /// Parse a stored JSON column; corrupt data is a db_error.
    static json parse_stored(const row_t& row, const std::string& column);

    /// "?, ?, ?" with n placeholders
    static std::string placeholders(size_t n);

    /// Split ids into groups of at most max_bound_parameters.
    static std::vector<std::vector<std::string>> chunk_ids(const std::vector<std::string>& ids,
                                                          size_t reserved = 0);

private:
    std::atomic<bool> transactions_enabled_{true};
};

} // namespace strata

#endif // __cplusplus
