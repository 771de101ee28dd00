#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strata {

using json = nlohmann::json;

// Milliseconds since Unix epoch
using timestamp_t = std::chrono::system_clock::time_point;

inline int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One result row, keyed by column name
using row_t = std::unordered_map<std::string, column_value_t>;

// Result of a non-query statement
struct exec_result {
    int64_t changes = 0;
    int64_t last_insert_id = 0;
};

// ============================================================================
// Records
// ============================================================================

enum class record_kind {
    doc,
    meta
};

inline const char* to_string(record_kind kind) {
    return kind == record_kind::meta ? "meta" : "docs";
}

/// The atomic persisted unit. For documents `id` is conventionally
/// "<collection>/<docId>" and `payload` carries a "collection" member.
struct record {
    std::string id;
    json payload = json::object();

    bool operator==(const record& other) const {
        return id == other.id && payload == other.payload;
    }
    bool operator!=(const record& other) const { return !(*this == other); }
};

/// A write batch grouped by kind.
struct record_batch {
    std::vector<record> docs;
    std::vector<record> meta;

    bool empty() const { return docs.empty() && meta.empty(); }
    size_t size() const { return docs.size() + meta.size(); }
};

/// Per-collection layout options.
struct collection_config {
    /// Payload field paths to extract and index ("author.id" follows nesting).
    std::set<std::string> indexes;

    /// Top-level payload fields encrypted individually. Empty with encryption
    /// enabled = whole payload encrypted.
    std::set<std::string> encrypted_fields;
};

using collection_config_map = std::map<std::string, collection_config>;

// Reserved logical collection names
inline constexpr const char* meta_collection = "__meta__";
inline constexpr const char* inventory_collection = "__inventory__";

// ============================================================================
// Column value helpers
// ============================================================================

namespace detail {
    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const char* v) { return std::string(v); }

    /// Text value of a column, or nullopt for NULL / non-text.
    inline std::optional<std::string> column_text(const row_t& row, const std::string& name) {
        auto it = row.find(name);
        if (it == row.end()) return std::nullopt;
        if (auto* s = std::get_if<std::string>(&it->second)) return *s;
        return std::nullopt;
    }

    /// Integer value of a column; REAL is truncated, anything else is nullopt.
    inline std::optional<int64_t> column_int(const row_t& row, const std::string& name) {
        auto it = row.find(name);
        if (it == row.end()) return std::nullopt;
        if (auto* i = std::get_if<int64_t>(&it->second)) return *i;
        if (auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
        return std::nullopt;
    }

    /// Scalar JSON value as a bindable column value. Objects and arrays are
    /// not scalar and map to NULL.
    inline column_value_t json_scalar_to_column(const json& v) {
        if (v.is_boolean()) return static_cast<int64_t>(v.get<bool>() ? 1 : 0);
        if (v.is_number_integer()) return v.get<int64_t>();
        if (v.is_number_float()) return v.get<double>();
        if (v.is_string()) return v.get<std::string>();
        return nullptr;
    }
} // namespace detail

} // namespace strata

#endif // __cplusplus
