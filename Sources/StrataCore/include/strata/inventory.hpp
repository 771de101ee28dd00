#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace strata {

/// collection -> (document id -> version)
struct inventory {
    using documents_t = std::map<std::string, int64_t>;
    std::map<std::string, documents_t> collections;

    bool contains(const std::string& collection, const std::string& doc_id) const;
    std::optional<int64_t> version_of(const std::string& collection, const std::string& doc_id) const;

    /// Total number of documents across all collections.
    size_t size() const;
    bool empty() const { return collections.empty(); }

    void upsert(const std::string& collection, const std::string& doc_id, int64_t version);

    /// Remove one entry; an emptied collection is pruned. Returns false if absent.
    bool remove(const std::string& collection, const std::string& doc_id);

    /// Serialized shape: {"collections": {collection: {docId: version}}}
    json to_json() const;
    static inventory from_json(const json& j);

    bool operator==(const inventory& other) const { return collections == other.collections; }
    bool operator!=(const inventory& other) const { return !(*this == other); }
};

enum class inventory_op {
    add,
    update,
    remove
};

/// Parse "add" / "update" / "remove"; anything else throws malformed_input_error.
inventory_op parse_inventory_op(const std::string& op);
const char* to_string(inventory_op op);

struct collection_stats {
    int64_t document_count = 0;
    int64_t max_version = 0;
};

/// Version carried by a document payload ("v"), 1 when absent or not numeric.
int64_t payload_version(const json& payload);

} // namespace strata

#endif // __cplusplus
