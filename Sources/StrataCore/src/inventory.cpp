#include "strata/inventory.hpp"
#include "strata/errors.hpp"

namespace strata {

bool inventory::contains(const std::string& collection, const std::string& doc_id) const {
    return version_of(collection, doc_id).has_value();
}

std::optional<int64_t> inventory::version_of(const std::string& collection,
                                             const std::string& doc_id) const {
    auto c = collections.find(collection);
    if (c == collections.end()) return std::nullopt;
    auto d = c->second.find(doc_id);
    if (d == c->second.end()) return std::nullopt;
    return d->second;
}

size_t inventory::size() const {
    size_t total = 0;
    for (const auto& [_, docs] : collections) {
        total += docs.size();
    }
    return total;
}

void inventory::upsert(const std::string& collection, const std::string& doc_id, int64_t version) {
    collections[collection][doc_id] = version;
}

bool inventory::remove(const std::string& collection, const std::string& doc_id) {
    auto c = collections.find(collection);
    if (c == collections.end()) return false;
    bool erased = c->second.erase(doc_id) > 0;
    if (c->second.empty()) {
        collections.erase(c);
    }
    return erased;
}

json inventory::to_json() const {
    json cols = json::object();
    for (const auto& [collection, docs] : collections) {
        json entries = json::object();
        for (const auto& [doc_id, version] : docs) {
            entries[doc_id] = version;
        }
        cols[collection] = std::move(entries);
    }
    return json{{"collections", std::move(cols)}};
}

inventory inventory::from_json(const json& j) {
    inventory inv;
    if (!j.is_object()) return inv;
    auto cols = j.find("collections");
    if (cols == j.end() || !cols->is_object()) return inv;

    for (auto c = cols->begin(); c != cols->end(); ++c) {
        if (!c.value().is_object()) continue;
        auto& docs = inv.collections[c.key()];
        for (auto d = c.value().begin(); d != c.value().end(); ++d) {
            docs[d.key()] = d.value().is_number() ? d.value().get<int64_t>() : 1;
        }
    }
    return inv;
}

inventory_op parse_inventory_op(const std::string& op) {
    if (op == "add") return inventory_op::add;
    if (op == "update") return inventory_op::update;
    if (op == "remove") return inventory_op::remove;
    throw malformed_input_error("Invalid inventory operation: " + op);
}

const char* to_string(inventory_op op) {
    switch (op) {
        case inventory_op::add: return "add";
        case inventory_op::update: return "update";
        case inventory_op::remove: return "remove";
    }
    return "unknown";
}

int64_t payload_version(const json& payload) {
    if (!payload.is_object()) return 1;
    auto v = payload.find("v");
    if (v == payload.end() || !v->is_number()) return 1;
    int64_t version = v->get<int64_t>();
    return version != 0 ? version : 1;
}

} // namespace strata
