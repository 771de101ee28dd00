#pragma once

#ifdef __cplusplus

#include "layout_strategy.hpp"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata {

/// One table per collection, a relational inventory and a reserved meta table.
///
///   sharedb_meta(id TEXT PRIMARY KEY, data JSON)
///   sharedb_inventory(collection, doc_id, version, updated_at)  PK (collection, doc_id)
///   <table>(id TEXT PRIMARY KEY, collection TEXT, data JSON, <index columns>...)
///
/// Index fields named in a collection's config are copied out of the plaintext
/// payload into their own columns and indexed as `<table>_<column>_idx`.
/// Encrypted fields are never copied out.
class table_per_collection_strategy : public layout_strategy {
public:
    static constexpr const char* meta_table = "sharedb_meta";
    static constexpr const char* inventory_table = "sharedb_inventory";

    explicit table_per_collection_strategy(collection_config_map configs = {},
                                           encryption_config encryption = {},
                                           logger log = {});

    const char* name() const override { return "table_per_collection_strategy"; }
    const char* inventory_type() const override { return "table"; }

    void initialize_schema(connection& conn) override;
    bool validate_schema(connection& conn) override;

    /// Throws malformed_input_error for an empty collection name.
    std::string table_name_for(const std::string& collection) const override;

    void delete_all_tables(connection& conn) override;

    void write_records(connection& conn, const record_batch& batch) override;
    std::optional<record> read_record(connection& conn,
                                      record_kind kind,
                                      const std::optional<std::string>& collection,
                                      const std::string& id) override;
    std::vector<record> read_all_records(connection& conn,
                                         record_kind kind,
                                         const std::optional<std::string>& collection) override;

    bool supports_bulk_read() const override { return true; }
    std::vector<record> read_records_bulk(connection& conn,
                                          record_kind kind,
                                          const std::optional<std::string>& collection,
                                          const std::vector<std::string>& ids) override;

    void delete_record(connection& conn,
                       record_kind kind,
                       const std::optional<std::string>& collection,
                       const std::string& id) override;

    void update_inventory_item(connection& conn,
                               const std::string& collection,
                               const std::string& doc_id,
                               int64_t version,
                               inventory_op op) override;
    inventory read_inventory(connection& conn) override;
    inventory initialize_inventory(connection& conn) override;
    collection_stats stats_for_collection(connection& conn, const std::string& collection) override;

    /// Create the collection's table, columns and indexes unless the registry
    /// already has it. Returns true if DDL was issued.
    bool ensure_table(connection& conn, const std::string& collection);

    /// Docs of `collection` whose indexed `field` equals `value`.
    /// `field` must be one of the collection's configured indexes.
    std::vector<record> read_records_by_index(connection& conn,
                                              const std::string& collection,
                                              const std::string& field,
                                              const json& value);

    /// Column holding an extracted index field ("author.id" -> "author_id").
    static std::string column_name_for(const std::string& field);

    /// True if the registry believes the collection's table exists.
    bool is_collection_registered(const std::string& collection) const;

    const collection_config_map& configs() const { return configs_; }

protected:
    std::set<std::string> encrypted_fields_for(const std::string& collection) const override;

private:
    collection_config_map configs_;

    // Created-table registry. A cache only: DDL is idempotent.
    mutable std::mutex registry_mutex_;
    std::set<std::string> created_collections_;
    std::map<std::string, std::string> table_owners_;   // table -> first collection

    const collection_config* config_for(const std::string& collection) const;

    /// (field, column) for every configured index of `collection`.
    std::vector<std::pair<std::string, std::string>> index_columns_for(const std::string& collection) const;

    /// Extracted column values in index_columns_for order; NULL where the
    /// field is absent, non-scalar or stored encrypted.
    std::vector<column_value_t> index_values_for(const record& rec, const std::string& collection) const;

    void create_collection_table(connection& conn, const std::string& collection, const std::string& table);
    void add_missing_columns(connection& conn,
                             const std::string& table,
                             const std::vector<std::pair<std::string, std::string>>& columns);

    void forget_collections(const std::vector<std::string>& collections);

    /// Every collection this strategy may own a table for.
    std::set<std::string> known_collections(connection& conn);

    std::vector<record> read_collection_bulk(connection& conn,
                                             const std::string& collection,
                                             const std::vector<std::string>& ids);

    record row_to_record(const row_t& row, const std::string& collection) const;
};

} // namespace strata

#endif // __cplusplus
