#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "store/connection_pool.hpp"
#include "store/store_client.hpp"
#include <atomic>
#include <memory>

namespace kvguard {

/**
 * @brief Owns the connection pool and the client built on it
 *
 * Created only through initialize(), which builds the pool and runs one
 * liveness PING before handing the handle out. Never throws from initialize:
 * failures come back as an error Result with the classified category.
 */
class ClientHandle {
public:
    [[nodiscard]] static Result<std::shared_ptr<ClientHandle>> initialize(
        const StoreConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~ClientHandle();

    ClientHandle(const ClientHandle&) = delete;
    ClientHandle& operator=(const ClientHandle&) = delete;

    [[nodiscard]] const std::shared_ptr<StoreClient>& client() const { return client_; }
    [[nodiscard]] PoolStats pool_stats() const { return pool_->get_stats(); }

    /**
     * @brief Liveness probe through the pool
     * @throws TransientStoreError subclasses on I/O trouble
     */
    [[nodiscard]] bool ping();

    /**
     * @brief Drain the pool (idempotent)
     */
    void close();

    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }

private:
    ClientHandle(std::shared_ptr<ConnectionPool> pool, std::shared_ptr<StoreClient> client);

    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<StoreClient> client_;
    std::atomic<bool> closed_{false};
};

} // namespace kvguard
