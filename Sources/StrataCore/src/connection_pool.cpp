#include "strata/connection_pool.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace strata {

namespace {

bool default_validate(connection& conn) {
    auto row = conn.query_one("SELECT 1 AS test");
    return row && detail::column_int(*row, "test") == 1;
}

} // namespace

connection_pool::connection_pool(pool_options options)
    : options_(std::move(options)) {
    if (!options_.create_connection) {
        throw std::invalid_argument("connection_pool requires a create_connection factory");
    }
    if (options_.max_connections == 0) {
        throw std::invalid_argument("connection_pool requires max_connections > 0");
    }
    if (options_.min_connections > options_.max_connections) {
        throw std::invalid_argument("connection_pool min_connections exceeds max_connections");
    }

    for (size_t i = 0; i < options_.min_connections; ++i) {
        if (auto conn = create_one()) {
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back({std::move(conn), clock::now()});
        }
    }

    LOG_INFO(options_.log, "pool", "Initialized with %zu connections (min %zu, max %zu)",
             idle_.size(), options_.min_connections, options_.max_connections);

    reaper_ = std::thread([this] { reaper_loop(); });
}

connection_pool::~connection_pool() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR(options_.log, "pool", "Error closing pool: %s", e.what());
    }
}

// ----------------------------------------------------------------------------
// Connection lifecycle
// ----------------------------------------------------------------------------

connection_pool::connection_ptr connection_pool::create_one() {
    const auto started = clock::now();
    connection_ptr conn;
    try {
        conn = options_.create_connection();
    } catch (const std::exception& e) {
        LOG_ERROR(options_.log, "pool", "Failed to create connection: %s", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++creation_failures_;
        return nullptr;
    }

    if (!conn) {
        LOG_ERROR(options_.log, "pool", "Connection factory returned null");
        std::lock_guard<std::mutex> lock(mutex_);
        ++creation_failures_;
        return nullptr;
    }

    if (clock::now() - started > options_.create_timeout) {
        LOG_WARN(options_.log, "pool", "Connection creation exceeded %lld ms",
                 static_cast<long long>(options_.create_timeout.count()));
        dispose(*conn);
        std::lock_guard<std::mutex> lock(mutex_);
        ++creation_failures_;
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++created_;
    LOG_DEBUG(options_.log, "pool", "Created connection (%llu total)", static_cast<unsigned long long>(created_));
    return conn;
}

bool connection_pool::validate_one(connection& conn) {
    bool valid = false;
    try {
        valid = options_.validate_connection ? options_.validate_connection(conn) : default_validate(conn);
    } catch (const std::exception& e) {
        LOG_WARN(options_.log, "pool", "Connection validation error: %s", e.what());
        valid = false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (valid) {
        ++validation_successes_;
    } else {
        ++validation_failures_;
    }
    return valid;
}

void connection_pool::dispose(connection& conn) {
    try {
        if (options_.destroy_connection) {
            options_.destroy_connection(conn);
        } else {
            conn.close();
        }
    } catch (const std::exception& e) {
        // The connection is dropped either way
        LOG_ERROR(options_.log, "pool", "Failed to destroy connection: %s", e.what());
    }
}

void connection_pool::destroy_one(const connection_ptr& conn) {
    dispose(*conn);
    std::lock_guard<std::mutex> lock(mutex_);
    ++destroyed_;
}

// ----------------------------------------------------------------------------
// Checkout
// ----------------------------------------------------------------------------

connection_pool::connection_ptr connection_pool::acquire() {
    const auto deadline = clock::now() + options_.acquire_timeout;
    size_t attempts = 0;

    std::unique_lock<std::mutex> lock(mutex_);
    ++pending_;
    struct pending_guard {
        std::unique_lock<std::mutex>& lock;
        size_t& pending;
        std::condition_variable& changed;
        ~pending_guard() {
            if (!lock.owns_lock()) lock.lock();
            --pending;
            changed.notify_all();   // close() waits for pending == 0
        }
    } guard{lock, pending_, changed_};

    while (true) {
        if (closing_) {
            throw acquire_error("Connection pool is closed");
        }
        if (attempts >= options_.max_connections) {
            throw acquire_error("No valid connection after " + std::to_string(attempts) + " attempts");
        }

        connection_ptr conn;
        if (!idle_.empty()) {
            conn = std::move(idle_.back().conn);
            idle_.pop_back();
        } else if (size_locked() + creating_ < options_.max_connections) {
            ++creating_;
            lock.unlock();
            conn = create_one();
            lock.lock();
            --creating_;
            if (!conn) {
                ++attempts;
                changed_.notify_all();
                continue;
            }
            if (closing_) {
                lock.unlock();
                destroy_one(conn);
                lock.lock();
                changed_.notify_all();
                continue;
            }
        } else {
            if (changed_.wait_until(lock, deadline) == std::cv_status::timeout &&
                idle_.empty() && size_locked() + creating_ >= options_.max_connections) {
                throw acquire_error("Timed out after " +
                                    std::to_string(options_.acquire_timeout.count()) +
                                    " ms waiting for a connection");
            }
            continue;
        }

        // Hold the slot while validating outside the lock
        borrowed_.insert(conn.get());
        if (options_.test_on_borrow) {
            lock.unlock();
            bool valid = validate_one(*conn);
            lock.lock();
            if (!valid) {
                borrowed_.erase(conn.get());
                ++attempts;
                lock.unlock();
                destroy_one(conn);
                lock.lock();
                changed_.notify_all();
                continue;
            }
        }
        return conn;
    }
}

connection_pool::connection_ptr connection_pool::get_connection() {
    try {
        auto conn = acquire();
        std::lock_guard<std::mutex> lock(mutex_);
        ++acquire_successes_;
        return conn;
    } catch (const acquire_error& e) {
        LOG_WARN(options_.log, "pool", "Acquire failed: %s", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        ++acquire_failures_;
        throw;
    }
}

void connection_pool::release_connection(const connection_ptr& conn) {
    if (!conn) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!borrowed_.count(conn.get())) {
            LOG_WARN(options_.log, "pool", "Released a connection this pool did not lend");
            return;
        }
    }

    const bool valid = !options_.test_on_return || validate_one(*conn);

    bool keep = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        borrowed_.erase(conn.get());
        keep = valid && !closing_;
        if (keep) {
            idle_.push_back({conn, clock::now()});
        }
    }
    if (!keep) {
        destroy_one(conn);
    }
    changed_.notify_all();
}

// ----------------------------------------------------------------------------
// Maintenance
// ----------------------------------------------------------------------------

void connection_pool::reaper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!closing_) {
        reaper_wakeup_.wait_for(lock, options_.reap_interval, [this] { return closing_; });
        if (closing_) break;
        lock.unlock();
        reap_once();
        lock.lock();
    }
}

void connection_pool::reap_once() {
    std::vector<connection_ptr> evicted;
    size_t missing = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();
        while (!idle_.empty() &&
               size_locked() > options_.min_connections &&
               now - idle_.front().last_used > options_.idle_timeout) {
            evicted.push_back(std::move(idle_.front().conn));
            idle_.pop_front();
        }
        const size_t current = size_locked() + creating_;
        missing = current < options_.min_connections ? options_.min_connections - current : 0;
        creating_ += missing;
    }

    for (const auto& conn : evicted) {
        destroy_one(conn);
    }
    if (!evicted.empty()) {
        LOG_DEBUG(options_.log, "pool", "Evicted %zu idle connections", evicted.size());
    }

    for (size_t i = 0; i < missing; ++i) {
        auto conn = create_one();
        bool orphaned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --creating_;
            if (conn && !closing_) {
                idle_.push_back({conn, clock::now()});
            } else {
                orphaned = conn != nullptr;
            }
        }
        if (orphaned) {
            destroy_one(conn);
        }
        changed_.notify_all();
    }
}

void connection_pool::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closing_) {
        // Another caller is closing or has closed
        changed_.wait(lock, [this] { return closed_; });
        return;
    }
    closing_ = true;
    LOG_INFO(options_.log, "pool", "Closing pool...");
    changed_.notify_all();
    reaper_wakeup_.notify_all();
    lock.unlock();

    if (reaper_.joinable()) {
        reaper_.join();
    }

    lock.lock();
    changed_.wait(lock, [this] { return borrowed_.empty() && creating_ == 0 && pending_ == 0; });

    std::deque<idle_entry> remaining;
    remaining.swap(idle_);
    lock.unlock();

    for (const auto& entry : remaining) {
        destroy_one(entry.conn);
    }

    lock.lock();
    closed_ = true;
    lock.unlock();
    changed_.notify_all();
    LOG_INFO(options_.log, "pool", "Pool closed");
}

bool connection_pool::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ----------------------------------------------------------------------------
// Statistics
// ----------------------------------------------------------------------------

int connection_pool::health_score_locked() const {
    const uint64_t validations = validation_successes_ + validation_failures_;
    const uint64_t acquisitions = acquire_successes_ + acquire_failures_;

    const double validation_score = validations > 0
        ? static_cast<double>(validation_successes_) / static_cast<double>(validations) * 100.0
        : 100.0;
    const double acquisition_score = acquisitions > 0
        ? static_cast<double>(acquire_successes_) / static_cast<double>(acquisitions) * 100.0
        : 100.0;

    // 50% utilization is optimal
    double utilization_score = 0.0;
    const size_t size = size_locked();
    if (size > 0) {
        const double u = static_cast<double>(borrowed_.size()) / static_cast<double>(size);
        utilization_score = u <= 0.5 ? u * 100.0 : (1.0 - u) * 100.0;
    }

    return static_cast<int>(std::lround(validation_score * 0.4 + acquisition_score * 0.4 + utilization_score * 0.2));
}

pool_stats connection_pool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_stats s;
    s.size = size_locked();
    s.available = idle_.size();
    s.borrowed = borrowed_.size();
    s.pending = pending_;
    s.connections_created = created_;
    s.connections_destroyed = destroyed_;
    s.creation_failures = creation_failures_;
    s.validation_successes = validation_successes_;
    s.validation_failures = validation_failures_;
    s.acquire_successes = acquire_successes_;
    s.acquire_failures = acquire_failures_;
    s.health_score = health_score_locked();
    s.is_healthy = s.health_score >= 80 && s.size > 0 && s.pending < s.size;
    return s;
}

bool connection_pool::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closing_ && size_locked() >= options_.min_connections;
}

} // namespace strata
