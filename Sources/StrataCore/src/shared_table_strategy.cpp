#include "strata/shared_table_strategy.hpp"

namespace strata {

void shared_table_strategy::initialize_schema(connection& conn) {
    run_ddl(conn, "CREATE TABLE IF NOT EXISTS docs (id TEXT PRIMARY KEY, data JSON)");
    run_ddl(conn, "CREATE TABLE IF NOT EXISTS meta (id TEXT PRIMARY KEY, data JSON)");
    LOG_INFO(log_, name(), "Schema initialized");
}

bool shared_table_strategy::validate_schema(connection& conn) {
    return table_exists(conn, docs_table) && table_exists(conn, meta_table);
}

std::string shared_table_strategy::table_name_for(const std::string& collection) const {
    // The inventory lives inside meta
    if (collection == meta_collection || collection == inventory_collection) {
        return meta_table;
    }
    return docs_table;
}

void shared_table_strategy::delete_all_tables(connection& conn) {
    conn.execute("DROP TABLE IF EXISTS docs");
    conn.execute("DROP TABLE IF EXISTS meta");
    LOG_INFO(log_, name(), "Deleted all tables");
}

// ----------------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------------

void shared_table_strategy::write_records(connection& conn, const record_batch& batch) {
    // Validate the whole batch before touching the database
    std::vector<std::pair<std::string, const record*>> docs;
    docs.reserve(batch.docs.size());
    for (const auto& rec : batch.docs) {
        docs.emplace_back(collection_of(rec), &rec);
    }
    for (const auto& rec : batch.meta) {
        if (rec.id == inventory_id) {
            throw malformed_input_error("Meta record id 'inventory' is reserved");
        }
    }

    run_batch(conn, [&](connection& c) {
        if (!docs.empty()) {
            auto inv = load_inventory(c);
            for (const auto& [collection, rec] : docs) {
                json stored = encrypt_record_for_collection(*rec, collection);
                c.execute("INSERT OR REPLACE INTO docs (id, data) VALUES (?, ?)",
                          {rec->id, stored.dump()});
                inv.upsert(collection, rec->id, payload_version(rec->payload));
            }
            store_inventory(c, inv);
        }

        // Meta records are never encrypted
        for (const auto& rec : batch.meta) {
            c.execute("INSERT OR REPLACE INTO meta (id, data) VALUES (?, ?)",
                      {rec.id, rec.payload.dump()});
        }
    });

    LOG_INFO(log_, name(), "Wrote %zu records", batch.size());
}

record shared_table_strategy::row_to_record(const row_t& row, record_kind kind, const std::string& id) const {
    json stored = parse_stored(row, "data");
    if (kind == record_kind::meta) {
        return record{id, std::move(stored)};
    }
    record rec = decrypt_record_for_collection(stored, stored.value("collection", std::string()));
    rec.id = id;
    return rec;
}

std::optional<record> shared_table_strategy::read_record(connection& conn,
                                                         record_kind kind,
                                                         const std::optional<std::string>&,
                                                         const std::string& id) {
    const std::string table = kind == record_kind::meta ? meta_table : docs_table;
    auto row = conn.query_one("SELECT data FROM " + table + " WHERE id = ?", {id});
    if (!row) {
        return std::nullopt;
    }
    return row_to_record(*row, kind, id);
}

std::vector<record> shared_table_strategy::read_all_records(connection& conn,
                                                            record_kind kind,
                                                            const std::optional<std::string>& collection) {
    std::vector<record> records;
    if (kind == record_kind::meta) {
        auto rows = conn.query_all("SELECT id, data FROM meta WHERE id != ?", {std::string(inventory_id)});
        for (const auto& row : rows) {
            records.push_back(row_to_record(row, kind, detail::column_text(row, "id").value_or("")));
        }
        return records;
    }

    // Collection membership is only known after decryption
    auto rows = conn.query_all("SELECT id, data FROM docs");
    for (const auto& row : rows) {
        auto rec = row_to_record(row, kind, detail::column_text(row, "id").value_or(""));
        if (collection) {
            auto c = rec.payload.is_object() ? rec.payload.find("collection") : rec.payload.end();
            if (c == rec.payload.end() || *c != *collection) continue;
        }
        records.push_back(std::move(rec));
    }
    return records;
}

std::vector<record> shared_table_strategy::read_records_bulk(connection& conn,
                                                             record_kind kind,
                                                             const std::optional<std::string>&,
                                                             const std::vector<std::string>& ids) {
    std::vector<record> records;
    if (ids.empty()) {
        return records;
    }

    const std::string table = kind == record_kind::meta ? meta_table : docs_table;
    for (const auto& chunk : chunk_ids(ids)) {
        std::vector<column_value_t> params(chunk.begin(), chunk.end());
        auto rows = conn.query_all(
            "SELECT id, data FROM " + table + " WHERE id IN (" + placeholders(chunk.size()) + ")",
            params);
        for (const auto& row : rows) {
            records.push_back(row_to_record(row, kind, detail::column_text(row, "id").value_or("")));
        }
    }

    LOG_DEBUG(log_, name(), "Bulk read %zu/%zu records from %s", records.size(), ids.size(), table.c_str());
    return records;
}

void shared_table_strategy::delete_record(connection& conn,
                                          record_kind kind,
                                          const std::optional<std::string>& collection,
                                          const std::string& id) {
    if (kind == record_kind::meta) {
        if (id == inventory_id) {
            throw malformed_input_error("Meta record id 'inventory' is reserved");
        }
        conn.execute("DELETE FROM meta WHERE id = ?", {id});
        LOG_DEBUG(log_, name(), "Deleted meta record %s", id.c_str());
        return;
    }

    conn.transaction([&](connection& c) {
        c.execute("DELETE FROM docs WHERE id = ?", {id});

        auto inv = load_inventory(c);
        bool changed = false;
        if (collection && inv.contains(*collection, id)) {
            changed = inv.remove(*collection, id);
        } else {
            // Collection unknown: drop the id wherever the inventory has it
            std::vector<std::string> owners;
            for (const auto& [owner, docs] : inv.collections) {
                if (docs.count(id)) owners.push_back(owner);
            }
            for (const auto& owner : owners) {
                changed = inv.remove(owner, id) || changed;
            }
        }
        if (changed) {
            store_inventory(c, inv);
        }
    });

    LOG_DEBUG(log_, name(), "Deleted record %s from docs", id.c_str());
}

// ----------------------------------------------------------------------------
// Inventory
// ----------------------------------------------------------------------------

inventory shared_table_strategy::load_inventory(connection& conn) {
    auto row = conn.query_one("SELECT data FROM meta WHERE id = ?", {std::string(inventory_id)});
    if (!row) {
        return {};
    }
    return inventory::from_json(parse_stored(*row, "data"));
}

void shared_table_strategy::store_inventory(connection& conn, const inventory& inv) {
    conn.execute("INSERT OR REPLACE INTO meta (id, data) VALUES (?, ?)",
                 {std::string(inventory_id), inv.to_json().dump()});
}

void shared_table_strategy::update_inventory_item(connection& conn,
                                                  const std::string& collection,
                                                  const std::string& doc_id,
                                                  int64_t version,
                                                  inventory_op op) {
    conn.transaction([&](connection& c) {
        auto inv = load_inventory(c);
        switch (op) {
            case inventory_op::add:
            case inventory_op::update:
                inv.upsert(collection, doc_id, version);
                break;
            case inventory_op::remove:
                inv.remove(collection, doc_id);
                break;
        }
        store_inventory(c, inv);
    });

    LOG_DEBUG(log_, name(), "Inventory %s %s/%s", to_string(op), collection.c_str(), doc_id.c_str());
}

inventory shared_table_strategy::read_inventory(connection& conn) {
    return load_inventory(conn);
}

inventory shared_table_strategy::initialize_inventory(connection& conn) {
    conn.execute("INSERT OR IGNORE INTO meta (id, data) VALUES (?, ?)",
                 {std::string(inventory_id), inventory{}.to_json().dump()});
    return load_inventory(conn);
}

} // namespace strata
