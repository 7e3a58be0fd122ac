#pragma once

#include "store/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <unordered_map>

namespace kvguard {

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    ConnectionOptions connection;
    size_t max_connections = 50;
    std::chrono::milliseconds idle_check{30000};  // Ping connections idle longer than this
};

class ConnectionPool;

/**
 * @brief A checked-out connection; holds one pool slot until destroyed
 *
 * Going out of scope hands the connection back for reuse. After an I/O error
 * the owner calls discard(): the socket is closed, the slot is freed and the
 * pool opens a fresh connection on a later acquire. Either way the slot is
 * released exactly once, and the handle keeps its pool alive until then.
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<IStoreConnection> conn, std::shared_ptr<ConnectionPool> pool);
    ~PooledConnection() { release(true); }

    PooledConnection(PooledConnection&& other) noexcept = default;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IStoreConnection* get() const { return conn_.get(); }
    IStoreConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    void discard() { release(false); }

private:
    void release(bool reusable);

    std::unique_ptr<IStoreConnection> conn_;
    std::shared_ptr<ConnectionPool> pool_;
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t max_connections = 0;
    size_t total_connections = 0;    // Created and not yet closed
    size_t idle_connections = 0;
    size_t active_connections = 0;   // Checked out
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
};

/**
 * @brief Bounded store connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: connections idle longer than idle_check are pinged before reuse
 * - Thread-safe: mutex protects deque, semaphore prevents oversubscription
 * - RAII: PooledConnection gives its slot back on destruction or discard()
 *
 * Must be owned by shared_ptr: outstanding PooledConnections keep the pool alive.
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    /**
     * @param config Pool configuration
     * @param factory Connection factory (creates IStoreConnection instances)
     */
    ConnectionPool(const PoolConfig& config, std::shared_ptr<IConnectionFactory> factory);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for a free slot
     * @return RAII connection handle, or nullptr on timeout / after drain()
     * @throws whatever the factory throws when a new connection cannot be opened
     */
    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] PoolStats get_stats() const;

    /**
     * @brief Drain pool - close all idle connections, refuse further acquires
     */
    void drain();

    [[nodiscard]] bool is_drained() const { return shutdown_.load(std::memory_order_acquire); }

private:
    /**
     * @brief Create new connection via factory
     */
    std::unique_ptr<IStoreConnection> create_connection();

    /**
     * @brief Close and forget a connection (caller must release its slot)
     */
    void destroy_connection(std::unique_ptr<IStoreConnection> conn);

    friend class PooledConnection;

    /**
     * @brief Take a checked-out connection back and free its slot
     * @param reusable false drops the connection instead of queuing it as idle
     */
    void return_connection(std::unique_ptr<IStoreConnection> conn, bool reusable);

    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IStoreConnection>> idle_connections_;
    std::unordered_map<IStoreConnection*, std::chrono::steady_clock::time_point> last_used_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};
};

} // namespace kvguard
