#pragma once

#include <cstdint>
#include <string>

namespace kvguard {

/**
 * @brief Parsed backing store URL
 *
 * redis://[[username]:password@]host[:port][/db]
 * rediss://...  (TLS)
 */
struct StoreAddress {
    std::string host;
    uint16_t port = 6379;
    std::string username;
    std::string password;
    int database = 0;
    bool use_tls = false;

    /**
     * @throws ConfigurationError on malformed URL
     */
    [[nodiscard]] static StoreAddress parse(const std::string& url);

    /// URL with the password masked, safe for logs
    [[nodiscard]] std::string redacted() const;
};

} // namespace kvguard
