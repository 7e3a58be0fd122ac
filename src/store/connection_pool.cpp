#include "store/connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace kvguard {

ConnectionPool::ConnectionPool(const PoolConfig& config, std::shared_ptr<IConnectionFactory> factory)
    : config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    if (!factory_) {
        throw ConfigurationError("ConnectionPool requires a connection factory");
    }
    if (config_.max_connections == 0) {
        throw ConfigurationError("ConnectionPool max_connections must be at least 1");
    }

    utils::log::debug(std::format("ConnectionPool created for {} (max={})",
        config_.connection.address.redacted(), config_.max_connections));
}

ConnectionPool::~ConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    std::unique_ptr<IStoreConnection> conn;
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        while (!idle_connections_.empty() && !conn) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (conn && !conn->is_connected()) {
                // Dropped by the server while idle
                last_used_.erase(conn.get());
                total_connections_.fetch_sub(1, std::memory_order_relaxed);
                conn.reset();
                continue;
            }
            if (conn) {
                const auto it = last_used_.find(conn.get());
                if (it != last_used_.end()) last_used = it->second;
            }
        }
    }

    try {
        if (conn && std::chrono::steady_clock::now() - last_used > config_.idle_check) {
            bool alive = false;
            try {
                alive = conn->ping();
            } catch (const StoreError& e) {
                utils::log::debug(std::format("Idle connection ping failed: {}", e.what()));
            }
            if (!alive) {
                health_check_failures_.fetch_add(1, std::memory_order_relaxed);
                destroy_connection(std::move(conn));
            }
        }

        if (!conn) {
            conn = create_connection();
        }
    } catch (...) {
        // Factory failure: give the slot back, let the caller classify the error
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    return std::make_unique<PooledConnection>(std::move(conn), shared_from_this());
}

PoolStats ConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.max_connections = config_.max_connections;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections >= stats.idle_connections
        ? stats.total_connections - stats.idle_connections
        : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    return stats;
}

void ConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    last_used_.clear();

    utils::log::debug(std::format("ConnectionPool drained for {}",
        config_.connection.address.redacted()));
}

std::unique_ptr<IStoreConnection> ConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection);
    if (!conn) {
        throw ConnectionError(std::format("Connection factory returned no connection for {}",
            config_.connection.address.redacted()));
    }
    total_connections_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
    }
    return conn;
}

void ConnectionPool::destroy_connection(std::unique_ptr<IStoreConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void ConnectionPool::return_connection(std::unique_ptr<IStoreConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!reusable || shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

// PooledConnection

PooledConnection::PooledConnection(std::unique_ptr<IStoreConnection> conn,
                                   std::shared_ptr<ConnectionPool> pool)
    : conn_(std::move(conn)), pool_(std::move(pool)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release(true);
        conn_ = std::move(other.conn_);
        pool_ = std::move(other.pool_);
    }
    return *this;
}

void PooledConnection::release(bool reusable) {
    if (!pool_) return;
    auto pool = std::move(pool_);
    if (conn_ && !reusable) {
        conn_->close();
    }
    pool->return_connection(std::move(conn_), reusable);
}

} // namespace kvguard
