#pragma once

#include "store/istore_connection.hpp"
#include "store/store_address.hpp"
#include <chrono>
#include <memory>

namespace kvguard {

struct ConnectionOptions {
    StoreAddress address;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds socket_timeout{5000};
};

/**
 * @brief Abstract factory for creating store connections
 *
 * Each backend provides its own factory that wraps the native client.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new connection
     * @return Connected instance, never nullptr
     * @throws ConnectionError / TimeoutError / AuthenticationError on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IStoreConnection> create(
        const ConnectionOptions& options) = 0;
};

} // namespace kvguard
