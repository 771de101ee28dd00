#include "strata/layout_strategy.hpp"
#include <algorithm>
#include <stdexcept>

namespace strata {

std::vector<record> layout_strategy::read_records_bulk(connection&,
                                                       record_kind,
                                                       const std::optional<std::string>&,
                                                       const std::vector<std::string>&) {
    throw std::logic_error(std::string(name()) + " has no bulk read path");
}

collection_stats layout_strategy::stats_for_collection(connection& conn, const std::string& collection) {
    collection_stats stats;
    auto inv = read_inventory(conn);
    auto it = inv.collections.find(collection);
    if (it == inv.collections.end()) return stats;

    stats.document_count = static_cast<int64_t>(it->second.size());
    for (const auto& [_, version] : it->second) {
        stats.max_version = std::max(stats.max_version, version);
    }
    return stats;
}

std::set<std::string> layout_strategy::encrypted_fields_for(const std::string&) const {
    return {};
}

json layout_strategy::encrypt_record_for_collection(const record& rec, const std::string& collection) const {
    return encrypt_record(rec, encrypted_fields_for(collection), encryption_, collection);
}

record layout_strategy::decrypt_record_for_collection(const json& stored, const std::string&) const {
    return decrypt_record(stored, encryption_);
}

void layout_strategy::run_ddl(connection& conn, const std::string& sql) const {
    try {
        conn.execute(sql);
    } catch (const db_error& e) {
        LOG_ERROR(log_, name(), "Schema statement failed: %s", e.what());
        throw schema_error(std::string("Schema statement failed: ") + e.what());
    }
}

bool layout_strategy::table_exists(connection& conn, const std::string& table) {
    auto row = conn.query_one("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {table});
    return row.has_value();
}

std::string layout_strategy::collection_of(const record& rec) {
    if (rec.payload.is_object()) {
        auto it = rec.payload.find("collection");
        if (it != rec.payload.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    throw malformed_input_error("Record missing required collection field in payload: " + rec.id);
}

json layout_strategy::parse_stored(const row_t& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        throw db_error("Stored row has no " + column + " column");
    }
    // JSON columns have numeric affinity: a bare number comes back converted
    if (auto* i = std::get_if<int64_t>(&it->second)) return json(*i);
    if (auto* d = std::get_if<double>(&it->second)) return json(*d);

    auto text = detail::column_text(row, column);
    if (!text) {
        throw db_error("Stored " + column + " is not text");
    }
    try {
        return json::parse(*text);
    } catch (const json::parse_error& e) {
        throw db_error("Stored " + column + " is not valid JSON: " + e.what());
    }
}

std::string layout_strategy::placeholders(size_t n) {
    std::string out;
    out.reserve(n * 3);
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out += ", ";
        out += "?";
    }
    return out;
}

std::vector<std::vector<std::string>> layout_strategy::chunk_ids(const std::vector<std::string>& ids,
                                                                size_t reserved) {
    const size_t chunk = max_bound_parameters > reserved ? max_bound_parameters - reserved : 1;
    std::vector<std::vector<std::string>> chunks;
    for (size_t i = 0; i < ids.size(); i += chunk) {
        auto end = std::min(ids.size(), i + chunk);
        chunks.emplace_back(ids.begin() + static_cast<std::ptrdiff_t>(i),
                            ids.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

} // namespace strata
