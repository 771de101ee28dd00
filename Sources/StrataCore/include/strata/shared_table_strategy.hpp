#pragma once

#ifdef __cplusplus

#include "layout_strategy.hpp"

namespace strata {

/// All documents in one `docs` table, metadata in `meta`, the inventory as a
/// single JSON document under the reserved meta id "inventory". Encryption is
/// whole-payload only.
///
///   docs(id TEXT PRIMARY KEY, data JSON)   data = {"id", "payload"} or encrypted form
///   meta(id TEXT PRIMARY KEY, data JSON)   data = payload
class shared_table_strategy : public layout_strategy {
public:
    static constexpr const char* docs_table = "docs";
    static constexpr const char* meta_table = "meta";
    static constexpr const char* inventory_id = "inventory";

    explicit shared_table_strategy(encryption_config encryption = {}, logger log = {})
        : layout_strategy(std::move(encryption), std::move(log)) {}

    const char* name() const override { return "shared_table_strategy"; }
    const char* inventory_type() const override { return "json"; }

    void initialize_schema(connection& conn) override;
    bool validate_schema(connection& conn) override;
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

private:
    // Read-modify-write helpers; callers hold the transaction.
    inventory load_inventory(connection& conn);
    void store_inventory(connection& conn, const inventory& inv);

    record row_to_record(const row_t& row, record_kind kind, const std::string& id) const;
};

} // namespace strata

#endif // __cplusplus
