#pragma once

#include <StrataCore.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_support {

// ============================================================================
// counting_connection - forwards to a real connection, counts every call and
// can be armed to fail a matching statement
// ============================================================================

class counting_connection : public strata::connection {
public:
    explicit counting_connection(std::shared_ptr<strata::connection> inner)
        : inner_(std::move(inner)) {}

    using strata::connection::execute;
    using strata::connection::query_one;
    using strata::connection::query_all;

    strata::exec_result execute(const std::string& sql,
                                const std::vector<strata::column_value_t>& params) override {
        ++calls;
        ++statements;
        if (!fail_on.empty() && sql.find(fail_on) != std::string::npos) {
            if (matched_++ >= fail_after) {
                throw strata::db_error("injected failure: " + sql);
            }
        }
        return inner_->execute(sql, params);
    }

    std::optional<strata::row_t> query_one(const std::string& sql,
                                           const std::vector<strata::column_value_t>& params) override {
        ++calls;
        ++statements;
        return inner_->query_one(sql, params);
    }

    std::vector<strata::row_t> query_all(const std::string& sql,
                                         const std::vector<strata::column_value_t>& params) override {
        ++calls;
        ++statements;
        return inner_->query_all(sql, params);
    }

    void begin_transaction() override { ++calls; inner_->begin_transaction(); }
    void commit() override { ++calls; inner_->commit(); }
    void rollback() override { ++calls; inner_->rollback(); }

    bool is_in_transaction() const override {
        ++calls;
        return inner_->is_in_transaction();
    }

    void close() override {
        ++calls;
        inner_->close();
    }

    /// Fail the (after+1)-th execute whose SQL contains `needle`.
    void arm(const std::string& needle, int after = 0) {
        fail_on = needle;
        fail_after = after;
        matched_ = 0;
    }
    void disarm() { fail_on.clear(); }

    strata::connection& inner() { return *inner_; }

    mutable std::atomic<int> calls{0};
    std::atomic<int> statements{0};

private:
    std::shared_ptr<strata::connection> inner_;
    std::string fail_on;
    int fail_after = 0;
    int matched_ = 0;
};

inline std::shared_ptr<counting_connection> memory_connection() {
    return std::make_shared<counting_connection>(std::make_shared<strata::sqlite_connection>(":memory:"));
}

// ============================================================================
// Helpers
// ============================================================================

inline void remove_database(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

/// Fresh path under the temp directory; any old file is removed.
inline std::string temp_database(const std::string& name) {
    auto path = (std::filesystem::temp_directory_path() / ("strata_" + name + ".db")).string();
    remove_database(path);
    return path;
}

/// True if `fn` throws E. Other exceptions propagate.
template<typename E, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

/// Reversible toy cipher: "enc:" + reversed plaintext.
inline strata::encryption_config reversing_encryption() {
    return strata::encryption_config(
        [](const std::string& plaintext) {
            return "enc:" + std::string(plaintext.rbegin(), plaintext.rend());
        },
        [](const std::string& ciphertext) {
            if (ciphertext.rfind("enc:", 0) != 0) {
                throw std::runtime_error("not produced by this cipher");
            }
            auto body = ciphertext.substr(4);
            return std::string(body.rbegin(), body.rend());
        });
}

inline strata::record make_doc(const std::string& collection,
                               const std::string& doc_id,
                               int64_t version,
                               strata::json extra = strata::json::object()) {
    strata::json payload = std::move(extra);
    payload["collection"] = collection;
    payload["id"] = doc_id;
    payload["v"] = version;
    return strata::record{collection + "/" + doc_id, std::move(payload)};
}

inline std::vector<std::string> ids_of(const std::vector<strata::record>& records) {
    std::vector<std::string> ids;
    for (const auto& r : records) ids.push_back(r.id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

inline bool table_exists(strata::connection& conn, const std::string& table) {
    return conn.query_one("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {table}).has_value();
}

} // namespace test_support
