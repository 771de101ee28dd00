#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "log.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace strata {

struct pool_options {
    size_t max_connections = 5;
    size_t min_connections = 2;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds create_timeout{10000};
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds reap_interval{1000};
    bool test_on_borrow = true;
    bool test_on_return = true;

    /// Required. May throw; failures are counted and retried.
    std::function<std::shared_ptr<connection>()> create_connection;

    /// Defaults to connection::close().
    std::function<void(connection&)> destroy_connection;

    /// Defaults to "SELECT 1 AS test" returning 1. Throwing counts as invalid.
    std::function<bool(connection&)> validate_connection;

    logger log;
};

struct pool_stats {
    size_t size = 0;
    size_t available = 0;
    size_t borrowed = 0;
    size_t pending = 0;

    uint64_t connections_created = 0;
    uint64_t connections_destroyed = 0;
    uint64_t creation_failures = 0;
    uint64_t validation_successes = 0;
    uint64_t validation_failures = 0;
    uint64_t acquire_successes = 0;
    uint64_t acquire_failures = 0;

    int health_score = 0;
    bool is_healthy = false;
};

// ============================================================================
// connection_pool - bounded set of validated connections
// ============================================================================
//
// Connections are created by the caller's factory, validated on checkout and
// on return, and evicted by a reaper thread once idle for longer than
// idle_timeout (never below min_connections). All bookkeeping happens under
// one mutex; factory, validator and destroyer always run outside it.

class connection_pool {
public:
    using connection_ptr = std::shared_ptr<connection>;

    /// Pre-creates min_connections and starts the reaper.
    /// Throws std::invalid_argument without a create_connection factory.
    explicit connection_pool(pool_options options);
    ~connection_pool();

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    /// Acquire, run `op(conn)`, always release. Returns or rethrows op's result.
    template<typename Fn>
    auto with_connection(Fn&& op) -> std::invoke_result_t<Fn, connection&>;

    /// Manual checkout; pair with release_connection().
    /// Throws acquire_error when no valid connection can be produced in time.
    connection_ptr get_connection();

    void release_connection(const connection_ptr& conn);

    pool_stats stats() const;

    /// True once the pool holds at least min_connections.
    bool is_ready() const;

    /// Refuse new checkouts, wait for borrowed connections to come back,
    /// destroy everything and stop the reaper. Idempotent.
    void close();
    bool is_closed() const;

    const pool_options& options() const { return options_; }

private:
    using clock = std::chrono::steady_clock;

    struct idle_entry {
        connection_ptr conn;
        clock::time_point last_used;
    };

    pool_options options_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;        // idle connection, free slot, or return
    std::condition_variable reaper_wakeup_;
    std::deque<idle_entry> idle_;            // front = least recently used
    std::unordered_set<const connection*> borrowed_;
    size_t creating_ = 0;                    // slots reserved by in-flight creations
    size_t pending_ = 0;                     // callers inside get_connection()
    bool closing_ = false;
    bool closed_ = false;

    uint64_t created_ = 0;
    uint64_t destroyed_ = 0;
    uint64_t creation_failures_ = 0;
    uint64_t validation_successes_ = 0;
    uint64_t validation_failures_ = 0;
    uint64_t acquire_successes_ = 0;
    uint64_t acquire_failures_ = 0;

    std::thread reaper_;

    connection_ptr acquire();

    /// nullptr on failure (counted as a creation failure).
    connection_ptr create_one();
    bool validate_one(connection& conn);
    void destroy_one(const connection_ptr& conn);
    void dispose(connection& conn);

    void reaper_loop();
    void reap_once();

    size_t size_locked() const { return idle_.size() + borrowed_.size(); }
    int health_score_locked() const;
};

template<typename Fn>
auto connection_pool::with_connection(Fn&& op) -> std::invoke_result_t<Fn, connection&> {
    connection_ptr conn = get_connection();
    struct release_guard {
        connection_pool& pool;
        const connection_ptr& conn;
        ~release_guard() { pool.release_connection(conn); }
    } guard{*this, conn};
    return std::forward<Fn>(op)(*conn);
}

} // namespace strata

#endif // __cplusplus
