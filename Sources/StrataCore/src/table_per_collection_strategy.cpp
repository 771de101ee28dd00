#include "strata/table_per_collection_strategy.hpp"
#include <algorithm>
#include <cctype>

namespace strata {

namespace {

// Every char outside [A-Za-z0-9_] becomes '_'
std::string sanitize_identifier(const std::string& name) {
    std::string out = name;
    for (auto& ch : out) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') {
            ch = '_';
        }
    }
    return out;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Sanitized identifiers are safe to quote verbatim
std::string quote(const std::string& identifier) {
    return "\"" + identifier + "\"";
}

// Follow a dotted path through nested objects
const json* find_path(const json& payload, const std::string& path) {
    const json* node = &payload;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) return nullptr;
        auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &*it;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return node;
}

} // namespace

table_per_collection_strategy::table_per_collection_strategy(collection_config_map configs,
                                                             encryption_config encryption,
                                                             logger log)
    : layout_strategy(std::move(encryption), std::move(log)),
      configs_(std::move(configs)) {}

// ----------------------------------------------------------------------------
// Naming
// ----------------------------------------------------------------------------

std::string table_per_collection_strategy::table_name_for(const std::string& collection) const {
    if (collection == meta_collection) return meta_table;
    if (collection == inventory_collection) return inventory_table;
    if (collection.empty()) {
        throw malformed_input_error("Collection name must not be empty");
    }

    std::string table = sanitize_identifier(collection);
    const std::string lower = lowercase(table);
    if (std::isdigit(static_cast<unsigned char>(table[0])) ||
        lower.rfind("sqlite_", 0) == 0 ||
        lower == meta_table || lower == inventory_table) {
        table = "c_" + table;
    }
    return table;
}

std::string table_per_collection_strategy::column_name_for(const std::string& field) {
    std::string column = sanitize_identifier(field);
    const std::string lower = lowercase(column);
    if (column.empty() ||
        std::isdigit(static_cast<unsigned char>(column[0])) ||
        lower == "id" || lower == "collection" || lower == "data") {
        column = "f_" + column;
    }
    return column;
}

const collection_config* table_per_collection_strategy::config_for(const std::string& collection) const {
    auto it = configs_.find(collection);
    return it == configs_.end() ? nullptr : &it->second;
}

std::set<std::string> table_per_collection_strategy::encrypted_fields_for(const std::string& collection) const {
    const auto* config = config_for(collection);
    return config ? config->encrypted_fields : std::set<std::string>{};
}

std::vector<std::pair<std::string, std::string>>
table_per_collection_strategy::index_columns_for(const std::string& collection) const {
    std::vector<std::pair<std::string, std::string>> columns;
    const auto* config = config_for(collection);
    if (!config) return columns;

    std::set<std::string> seen;
    for (const auto& field : config->indexes) {
        auto column = column_name_for(field);
        // "a.b" and "a_b" land in the same column; first one wins
        if (seen.insert(lowercase(column)).second) {
            columns.emplace_back(field, std::move(column));
        }
    }
    return columns;
}

std::vector<column_value_t> table_per_collection_strategy::index_values_for(const record& rec,
                                                                            const std::string& collection) const {
    const auto columns = index_columns_for(collection);
    const auto encrypted = encrypted_fields_for(collection);
    const bool whole_payload = encryption_.can_encrypt() && encrypted.empty();

    std::vector<column_value_t> values;
    values.reserve(columns.size());
    for (const auto& [field, _] : columns) {
        const std::string top = field.substr(0, field.find('.'));
        if (whole_payload || (encryption_.can_encrypt() && encrypted.count(top))) {
            values.emplace_back(nullptr);
            continue;
        }
        const json* node = find_path(rec.payload, field);
        values.push_back(node ? detail::json_scalar_to_column(*node) : column_value_t(nullptr));
    }
    return values;
}

// ----------------------------------------------------------------------------
// Schema
// ----------------------------------------------------------------------------

void table_per_collection_strategy::initialize_schema(connection& conn) {
    run_ddl(conn, "CREATE TABLE IF NOT EXISTS sharedb_meta (id TEXT PRIMARY KEY, data JSON)");
    run_ddl(conn,
        "CREATE TABLE IF NOT EXISTS sharedb_inventory ("
        "collection TEXT NOT NULL, "
        "doc_id TEXT NOT NULL, "
        "version INTEGER, "
        "updated_at INTEGER, "
        "PRIMARY KEY (collection, doc_id))");
    run_ddl(conn, "CREATE INDEX IF NOT EXISTS idx_inventory_collection ON sharedb_inventory (collection)");
    run_ddl(conn, "CREATE INDEX IF NOT EXISTS idx_inventory_updated ON sharedb_inventory (updated_at)");

    for (const auto& [collection, _] : configs_) {
        ensure_table(conn, collection);
    }

    LOG_INFO(log_, name(), "Schema initialized with %zu configured collections", configs_.size());
}

bool table_per_collection_strategy::validate_schema(connection& conn) {
    return table_exists(conn, meta_table) && table_exists(conn, inventory_table);
}

bool table_per_collection_strategy::ensure_table(connection& conn, const std::string& collection) {
    const std::string table = table_name_for(collection);
    {
        std::unique_lock<std::mutex> lock(registry_mutex_);
        if (created_collections_.count(collection)) {
            lock.unlock();
            if (table_exists(conn, table)) {
                return false;
            }
            // Dropped by a rollback this strategy never saw
            LOG_WARN(log_, name(), "Table %s for collection %s is missing, recreating",
                     table.c_str(), collection.c_str());
            forget_collections({collection});
            lock.lock();
        }
        auto owner = table_owners_.find(table);
        if (owner != table_owners_.end() && owner->second != collection) {
            LOG_WARN(log_, name(), "Collections '%s' and '%s' both map to table %s",
                     owner->second.c_str(), collection.c_str(), table.c_str());
        }
    }

    create_collection_table(conn, collection, table);

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        created_collections_.insert(collection);
        table_owners_.emplace(table, collection);
    }
    LOG_DEBUG(log_, name(), "Created table %s for collection %s", table.c_str(), collection.c_str());
    return true;
}

void table_per_collection_strategy::create_collection_table(connection& conn,
                                                            const std::string& collection,
                                                            const std::string& table) {
    const auto columns = index_columns_for(collection);

    std::string sql = "CREATE TABLE IF NOT EXISTS " + quote(table) +
                      " (id TEXT NOT NULL, collection TEXT NOT NULL, data JSON";
    for (const auto& [_, column] : columns) {
        sql += ", " + quote(column);
    }
    // Colliding collections share the table, so the key includes the collection
    sql += ", PRIMARY KEY (collection, id))";
    run_ddl(conn, sql);

    // The table may predate a newly configured index
    add_missing_columns(conn, table, columns);

    for (const auto& [_, column] : columns) {
        run_ddl(conn, "CREATE INDEX IF NOT EXISTS " + quote(table + "_" + column + "_idx") +
                      " ON " + quote(table) + " (" + quote(column) + ")");
    }
}

void table_per_collection_strategy::add_missing_columns(connection& conn,
                                                        const std::string& table,
                                                        const std::vector<std::pair<std::string, std::string>>& columns) {
    if (columns.empty()) return;

    auto existing_columns = [&]() {
        std::set<std::string> names;
        for (const auto& row : conn.query_all("PRAGMA table_info(" + quote(table) + ")")) {
            if (auto n = detail::column_text(row, "name")) names.insert(lowercase(*n));
        }
        return names;
    };

    auto existing = existing_columns();
    for (const auto& [_, column] : columns) {
        if (existing.count(lowercase(column))) continue;
        try {
            conn.execute("ALTER TABLE " + quote(table) + " ADD COLUMN " + quote(column));
        } catch (const db_error& e) {
            // Another connection may have added it first
            existing = existing_columns();
            if (!existing.count(lowercase(column))) {
                LOG_ERROR(log_, name(), "Failed to add column %s to %s: %s", column.c_str(), table.c_str(), e.what());
                throw schema_error("Failed to add column " + column + " to " + table + ": " + e.what());
            }
        }
    }
}

bool table_per_collection_strategy::is_collection_registered(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return created_collections_.count(collection) > 0;
}

void table_per_collection_strategy::forget_collections(const std::vector<std::string>& collections) {
    if (collections.empty()) return;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& collection : collections) {
        created_collections_.erase(collection);
        auto owner = table_owners_.find(table_name_for(collection));
        if (owner != table_owners_.end() && owner->second == collection) {
            table_owners_.erase(owner);
        }
    }
}

std::set<std::string> table_per_collection_strategy::known_collections(connection& conn) {
    std::set<std::string> collections;
    if (table_exists(conn, inventory_table)) {
        for (const auto& row : conn.query_all("SELECT DISTINCT collection FROM sharedb_inventory")) {
            if (auto c = detail::column_text(row, "collection")) collections.insert(*c);
        }
    }
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        collections.insert(created_collections_.begin(), created_collections_.end());
    }
    for (const auto& [collection, _] : configs_) {
        collections.insert(collection);
    }
    collections.erase(std::string());
    return collections;
}

void table_per_collection_strategy::delete_all_tables(connection& conn) {
    std::set<std::string> tables;
    for (const auto& collection : known_collections(conn)) {
        tables.insert(table_name_for(collection));
    }

    for (const auto& table : tables) {
        conn.execute("DROP TABLE IF EXISTS " + quote(table));
    }
    conn.execute("DROP TABLE IF EXISTS sharedb_meta");
    conn.execute("DROP TABLE IF EXISTS sharedb_inventory");

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        created_collections_.clear();
        table_owners_.clear();
    }
    LOG_INFO(log_, name(), "Dropped %zu collection tables", tables.size());
}

// ----------------------------------------------------------------------------
// Records
// ----------------------------------------------------------------------------

void table_per_collection_strategy::write_records(connection& conn, const record_batch& batch) {
    std::map<std::string, std::vector<const record*>> by_collection;
    for (const auto& rec : batch.docs) {
        by_collection[collection_of(rec)].push_back(&rec);
    }
    // Reject unusable collection names before any I/O
    for (const auto& [collection, _] : by_collection) {
        table_name_for(collection);
    }

    // Tables created inside a rolled-back transaction are gone again
    std::vector<std::string> created;
    try {
        run_batch(conn, [&](connection& c) {
            const int64_t now = now_millis();
            for (const auto& [collection, records] : by_collection) {
                if (ensure_table(c, collection)) {
                    created.push_back(collection);
                }

                const std::string table = table_name_for(collection);
                const auto columns = index_columns_for(collection);
                std::string sql = "INSERT OR REPLACE INTO " + quote(table) + " (id, collection, data";
                for (const auto& [_, column] : columns) {
                    sql += ", " + quote(column);
                }
                sql += ") VALUES (" + placeholders(3 + columns.size()) + ")";

                for (const record* rec : records) {
                    json stored = encrypt_record_for_collection(*rec, collection);
                    std::vector<column_value_t> params{rec->id, collection, stored.dump()};
                    auto values = index_values_for(*rec, collection);
                    params.insert(params.end(), values.begin(), values.end());
                    c.execute(sql, params);

                    c.execute("INSERT OR REPLACE INTO sharedb_inventory (collection, doc_id, version, updated_at) "
                              "VALUES (?, ?, ?, ?)",
                              {collection, rec->id, payload_version(rec->payload), now});
                }
            }

            for (const auto& rec : batch.meta) {
                c.execute("INSERT OR REPLACE INTO sharedb_meta (id, data) VALUES (?, ?)",
                          {rec.id, rec.payload.dump()});
            }
        });
    } catch (const std::exception& e) {
        LOG_ERROR(log_, name(), "Batch of %zu records failed: %s", batch.size(), e.what());
        forget_collections(created);
        throw;
    }

    LOG_INFO(log_, name(), "Wrote %zu records across %zu collections", batch.size(), by_collection.size());
}

record table_per_collection_strategy::row_to_record(const row_t& row, const std::string& collection) const {
    record rec = decrypt_record_for_collection(parse_stored(row, "data"), collection);
    if (auto id = detail::column_text(row, "id")) {
        rec.id = *id;
    }
    return rec;
}

std::optional<record> table_per_collection_strategy::read_record(connection& conn,
                                                                 record_kind kind,
                                                                 const std::optional<std::string>& collection,
                                                                 const std::string& id) {
    if (kind == record_kind::meta) {
        auto row = conn.query_one("SELECT data FROM sharedb_meta WHERE id = ?", {id});
        if (!row) return std::nullopt;
        return record{id, parse_stored(*row, "data")};
    }

    std::string owner;
    if (collection) {
        owner = *collection;
    } else {
        auto found = conn.query_one("SELECT collection FROM sharedb_inventory WHERE doc_id = ?", {id});
        if (!found) {
            return std::nullopt;
        }
        owner = detail::column_text(*found, "collection").value_or("");
        if (owner.empty()) return std::nullopt;
        LOG_DEBUG(log_, name(), "Inventory places %s in %s", id.c_str(), owner.c_str());
    }

    const std::string table = table_name_for(owner);
    if (!table_exists(conn, table)) {
        return std::nullopt;
    }
    auto row = conn.query_one("SELECT id, data FROM " + quote(table) + " WHERE id = ? AND collection = ?",
                              {id, owner});
    if (!row) {
        return std::nullopt;
    }
    return row_to_record(*row, owner);
}

std::vector<record> table_per_collection_strategy::read_all_records(connection& conn,
                                                                    record_kind kind,
                                                                    const std::optional<std::string>& collection) {
    std::vector<record> records;
    if (kind == record_kind::meta) {
        for (const auto& row : conn.query_all("SELECT id, data FROM sharedb_meta")) {
            records.push_back(record{detail::column_text(row, "id").value_or(""), parse_stored(row, "data")});
        }
        return records;
    }

    if (!collection) {
        for (const auto& c : known_collections(conn)) {
            auto part = read_all_records(conn, kind, c);
            records.insert(records.end(),
                           std::make_move_iterator(part.begin()),
                           std::make_move_iterator(part.end()));
        }
        return records;
    }

    const std::string table = table_name_for(*collection);
    if (!table_exists(conn, table)) {
        return records;
    }
    for (const auto& row : conn.query_all("SELECT id, data FROM " + quote(table) + " WHERE collection = ?",
                                          {*collection})) {
        records.push_back(row_to_record(row, *collection));
    }
    return records;
}

std::vector<record> table_per_collection_strategy::read_collection_bulk(connection& conn,
                                                                        const std::string& collection,
                                                                        const std::vector<std::string>& ids) {
    std::vector<record> records;
    const std::string table = table_name_for(collection);
    if (!table_exists(conn, table)) {
        return records;
    }

    for (const auto& chunk : chunk_ids(ids, 1)) {
        std::vector<column_value_t> params;
        params.reserve(chunk.size() + 1);
        params.emplace_back(collection);
        params.insert(params.end(), chunk.begin(), chunk.end());

        auto rows = conn.query_all("SELECT id, data FROM " + quote(table) +
                                   " WHERE collection = ? AND id IN (" + placeholders(chunk.size()) + ")",
                                   params);
        for (const auto& row : rows) {
            records.push_back(row_to_record(row, collection));
        }
    }

    LOG_DEBUG(log_, name(), "Bulk read %zu/%zu records from %s", records.size(), ids.size(), table.c_str());
    return records;
}

std::vector<record> table_per_collection_strategy::read_records_bulk(connection& conn,
                                                                     record_kind kind,
                                                                     const std::optional<std::string>& collection,
                                                                     const std::vector<std::string>& ids) {
    std::vector<record> records;
    if (ids.empty()) {
        return records;
    }

    if (kind == record_kind::meta) {
        for (const auto& chunk : chunk_ids(ids)) {
            std::vector<column_value_t> params(chunk.begin(), chunk.end());
            auto rows = conn.query_all(
                "SELECT id, data FROM sharedb_meta WHERE id IN (" + placeholders(chunk.size()) + ")", params);
            for (const auto& row : rows) {
                records.push_back(record{detail::column_text(row, "id").value_or(""), parse_stored(row, "data")});
            }
        }
        return records;
    }

    if (collection) {
        return read_collection_bulk(conn, *collection, ids);
    }

    // Unknown collection: group the ids by the collection the inventory names
    std::map<std::string, std::vector<std::string>> by_collection;
    for (const auto& chunk : chunk_ids(ids)) {
        std::vector<column_value_t> params(chunk.begin(), chunk.end());
        auto rows = conn.query_all(
            "SELECT collection, doc_id FROM sharedb_inventory WHERE doc_id IN (" + placeholders(chunk.size()) + ")",
            params);
        for (const auto& row : rows) {
            auto c = detail::column_text(row, "collection");
            auto d = detail::column_text(row, "doc_id");
            if (c && d && !c->empty()) by_collection[*c].push_back(*d);
        }
    }
    for (const auto& [c, owned] : by_collection) {
        auto part = read_collection_bulk(conn, c, owned);
        records.insert(records.end(),
                       std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
    }
    return records;
}

std::vector<record> table_per_collection_strategy::read_records_by_index(connection& conn,
                                                                         const std::string& collection,
                                                                         const std::string& field,
                                                                         const json& value) {
    const auto columns = index_columns_for(collection);
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&](const auto& c) { return c.first == field; });
    if (it == columns.end()) {
        throw malformed_input_error("Field " + field + " is not indexed for collection " + collection);
    }

    const auto encrypted = encrypted_fields_for(collection);
    if (encryption_.can_encrypt() &&
        (encrypted.empty() || encrypted.count(field.substr(0, field.find('.'))))) {
        throw malformed_input_error("Field " + field + " of collection " + collection + " is stored encrypted");
    }
    if (value.is_null() || value.is_object() || value.is_array()) {
        throw malformed_input_error("Index lookups need a scalar value");
    }

    std::vector<record> records;
    const std::string table = table_name_for(collection);
    if (!table_exists(conn, table)) {
        return records;
    }
    ensure_table(conn, collection);

    auto rows = conn.query_all("SELECT id, data FROM " + quote(table) +
                               " WHERE collection = ? AND " + quote(it->second) + " = ?",
                               {collection, detail::json_scalar_to_column(value)});
    for (const auto& row : rows) {
        records.push_back(row_to_record(row, collection));
    }
    return records;
}

void table_per_collection_strategy::delete_record(connection& conn,
                                                  record_kind kind,
                                                  const std::optional<std::string>& collection,
                                                  const std::string& id) {
    if (kind == record_kind::meta) {
        if (table_exists(conn, meta_table)) {
            conn.execute("DELETE FROM sharedb_meta WHERE id = ?", {id});
        }
        return;
    }

    conn.transaction([&](connection& c) {
        std::vector<std::string> owners;
        if (collection) {
            owners.push_back(*collection);
        } else {
            for (const auto& row : c.query_all("SELECT collection FROM sharedb_inventory WHERE doc_id = ?", {id})) {
                if (auto owner = detail::column_text(row, "collection")) owners.push_back(*owner);
            }
        }

        for (const auto& owner : owners) {
            const std::string table = table_name_for(owner);
            if (table_exists(c, table)) {
                c.execute("DELETE FROM " + quote(table) + " WHERE id = ? AND collection = ?", {id, owner});
            }
            c.execute("DELETE FROM sharedb_inventory WHERE collection = ? AND doc_id = ?", {owner, id});
        }
    });

    LOG_DEBUG(log_, name(), "Deleted record %s", id.c_str());
}

// ----------------------------------------------------------------------------
// Inventory
// ----------------------------------------------------------------------------

void table_per_collection_strategy::update_inventory_item(connection& conn,
                                                          const std::string& collection,
                                                          const std::string& doc_id,
                                                          int64_t version,
                                                          inventory_op op) {
    switch (op) {
        case inventory_op::add:
        case inventory_op::update:
            conn.execute("INSERT OR REPLACE INTO sharedb_inventory (collection, doc_id, version, updated_at) "
                         "VALUES (?, ?, ?, ?)",
                         {collection, doc_id, version, now_millis()});
            break;
        case inventory_op::remove:
            conn.execute("DELETE FROM sharedb_inventory WHERE collection = ? AND doc_id = ?",
                         {collection, doc_id});
            break;
    }
    LOG_DEBUG(log_, name(), "Inventory %s %s/%s", to_string(op), collection.c_str(), doc_id.c_str());
}

inventory table_per_collection_strategy::read_inventory(connection& conn) {
    inventory inv;
    auto rows = conn.query_all(
        "SELECT collection, doc_id, version FROM sharedb_inventory ORDER BY collection, doc_id");
    for (const auto& row : rows) {
        auto c = detail::column_text(row, "collection");
        auto d = detail::column_text(row, "doc_id");
        if (!c || !d) continue;
        inv.upsert(*c, *d, detail::column_int(row, "version").value_or(1));
    }
    return inv;
}

inventory table_per_collection_strategy::initialize_inventory(connection& conn) {
    // The table itself comes from initialize_schema
    return read_inventory(conn);
}

collection_stats table_per_collection_strategy::stats_for_collection(connection& conn,
                                                                     const std::string& collection) {
    collection_stats stats;
    auto row = conn.query_one(
        "SELECT COUNT(*) AS count, MAX(version) AS max_version FROM sharedb_inventory WHERE collection = ?",
        {collection});
    if (row) {
        stats.document_count = detail::column_int(*row, "count").value_or(0);
        stats.max_version = detail::column_int(*row, "max_version").value_or(0);
    }
    return stats;
}

} // namespace strata
