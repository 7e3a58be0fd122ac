#pragma once

#include "store/iconnection_factory.hpp"
#include "store/istore_connection.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace kvguard {

/**
 * @brief One Boost.Redis connection driven synchronously
 *
 * Each instance owns an io_context and the thread that runs it; calls block
 * the caller until the reply arrives or socket_timeout elapses. The
 * constructor finishes the RESP3 handshake (HELLO/AUTH/SELECT) and a PING
 * within connect_timeout or throws.
 *
 * Error mapping:
 * - refused / reset / EOF / not connected   -> ConnectionError
 * - connect or reply deadline exceeded      -> TimeoutError
 * - handshake rejected (bad credentials)    -> AuthenticationError
 * - error replies                           -> classify_server_error()
 */
class RedisConnection : public IStoreConnection {
public:
    explicit RedisConnection(const ConnectionOptions& options);
    ~RedisConnection() override;

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    [[nodiscard]] StoreReply execute(const std::vector<std::string>& args) override;
    [[nodiscard]] bool ping() override;
    [[nodiscard]] bool is_connected() const override;
    void close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Creates RedisConnection instances
 */
class RedisConnectionFactory : public IConnectionFactory {
public:
    [[nodiscard]] std::unique_ptr<IStoreConnection> create(const ConnectionOptions& options) override;
};

} // namespace kvguard
