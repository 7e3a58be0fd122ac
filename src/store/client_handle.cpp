#include "store/client_handle.hpp"
#include "core/utils.hpp"
#include <format>

namespace kvguard {

ClientHandle::ClientHandle(std::shared_ptr<ConnectionPool> pool, std::shared_ptr<StoreClient> client)
    : pool_(std::move(pool)), client_(std::move(client)) {}

ClientHandle::~ClientHandle() {
    close();
}

Result<std::shared_ptr<ClientHandle>> ClientHandle::initialize(
    const StoreConfig& config,
    std::shared_ptr<IConnectionFactory> factory) {

    try {
        PoolConfig pool_config;
        pool_config.connection.address = StoreAddress::parse(config.url);
        pool_config.connection.connect_timeout = config.connect_timeout;
        pool_config.connection.socket_timeout = config.socket_timeout;
        pool_config.max_connections = config.max_connections;
        pool_config.idle_check = config.pool_idle_check;

        auto pool = std::make_shared<ConnectionPool>(pool_config, std::move(factory));
        // Pool acquisition is bounded by the same budget as one socket round trip
        auto client = std::make_shared<StoreClient>(pool, config.socket_timeout);

        if (!client->ping()) {
            pool->drain();
            return Result<std::shared_ptr<ClientHandle>>::error(
                ErrorCategory::CONNECTION_ERROR,
                std::format("PING to {} was not answered", pool_config.connection.address.redacted()));
        }

        utils::log::info(std::format("Store connection pool initialized: {} (max_connections={})",
            pool_config.connection.address.redacted(), config.max_connections));

        return Result<std::shared_ptr<ClientHandle>>::ok(
            std::shared_ptr<ClientHandle>(new ClientHandle(std::move(pool), std::move(client))));
    } catch (const std::exception& e) {
        return Result<std::shared_ptr<ClientHandle>>::error(classify(e), e.what());
    }
}

bool ClientHandle::ping() {
    return client_->ping();
}

void ClientHandle::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pool_->drain();
}

} // namespace kvguard
