#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata {

// ============================================================================
// Database operation contract
// ============================================================================
//
// Everything above this interface (strategies, pool, coordinator) talks to the
// embedded database only through these operations. A vendor binding is an
// adapter implementing them; sqlite_connection is the one that ships here.
//
// Failures are reported by throwing db_error.

class connection {
public:
    virtual ~connection() = default;

    /// Run a statement that returns no rows.
    virtual exec_result execute(const std::string& sql,
                                const std::vector<column_value_t>& params) = 0;

    /// First row of the result, or nullopt when there is none.
    virtual std::optional<row_t> query_one(const std::string& sql,
                                           const std::vector<column_value_t>& params) = 0;

    virtual std::vector<row_t> query_all(const std::string& sql,
                                         const std::vector<column_value_t>& params) = 0;

    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool is_in_transaction() const = 0;

    /// Release the underlying handle. Further calls throw db_error.
    virtual void close() {}

    // Parameterless convenience overloads
    exec_result execute(const std::string& sql) { return execute(sql, {}); }
    std::optional<row_t> query_one(const std::string& sql) { return query_one(sql, {}); }
    std::vector<row_t> query_all(const std::string& sql) { return query_all(sql, {}); }

    /// Run `body(*this)` inside BEGIN/COMMIT, rolling back if it throws.
    /// When a transaction is already open the body joins it.
    template<typename Fn>
    auto transaction(Fn&& body) -> std::invoke_result_t<Fn, connection&>;
};

// RAII transaction guard
class scoped_transaction {
public:
    explicit scoped_transaction(connection& conn) : conn_(conn) {
        conn_.begin_transaction();
    }

    ~scoped_transaction() {
        if (!completed_) {
            try {
                conn_.rollback();
            } catch (const std::exception&) {
                // Connection already gone; nothing left to undo
            }
        }
    }

    scoped_transaction(const scoped_transaction&) = delete;
    scoped_transaction& operator=(const scoped_transaction&) = delete;

    void commit() {
        conn_.commit();
        completed_ = true;
    }

    void rollback() {
        conn_.rollback();
        completed_ = true;
    }

private:
    connection& conn_;
    bool completed_ = false;
};

template<typename Fn>
auto connection::transaction(Fn&& body) -> std::invoke_result_t<Fn, connection&> {
    using result_t = std::invoke_result_t<Fn, connection&>;
    if (is_in_transaction()) {
        return std::forward<Fn>(body)(*this);
    }
    scoped_transaction tx(*this);
    if constexpr (std::is_void_v<result_t>) {
        std::forward<Fn>(body)(*this);
        tx.commit();
    } else {
        result_t result = std::forward<Fn>(body)(*this);
        tx.commit();
        return result;
    }
}

} // namespace strata

#endif // __cplusplus
