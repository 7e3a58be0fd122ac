#include "store/store_address.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <string_view>

namespace kvguard {

namespace {

constexpr std::string_view kPlainScheme = "redis://";
constexpr std::string_view kTlsScheme = "rediss://";

} // anonymous namespace

StoreAddress StoreAddress::parse(const std::string& url) {
    StoreAddress addr;
    std::string_view rest(url);

    if (utils::starts_with_ci(rest, kTlsScheme)) {
        addr.use_tls = true;
        rest.remove_prefix(kTlsScheme.size());
    } else if (utils::starts_with_ci(rest, kPlainScheme)) {
        rest.remove_prefix(kPlainScheme.size());
    } else {
        throw ConfigurationError(std::format("Unsupported store URL scheme: '{}'", url));
    }

    // Database index
    if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
        const auto db_str = rest.substr(slash + 1);
        if (!db_str.empty()) {
            const auto db = utils::try_parse_int<int>(db_str);
            if (!db || *db < 0) {
                throw ConfigurationError(std::format("Invalid database index in store URL: '{}'", db_str));
            }
            addr.database = *db;
        }
        rest = rest.substr(0, slash);
    }

    // Credentials (last '@' so passwords may contain '@')
    if (const auto at = rest.rfind('@'); at != std::string_view::npos) {
        const auto userinfo = rest.substr(0, at);
        rest = rest.substr(at + 1);
        if (const auto colon = userinfo.find(':'); colon != std::string_view::npos) {
            addr.username = std::string(userinfo.substr(0, colon));
            addr.password = std::string(userinfo.substr(colon + 1));
        } else {
            addr.password = std::string(userinfo);
        }
    }

    // Host and port
    std::string_view host = rest;
    if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        host = rest.substr(0, colon);
        const auto port_str = rest.substr(colon + 1);
        const auto port = utils::try_parse_int<int>(port_str);
        if (!port || !utils::in_range<1, 65535>(*port)) {
            throw ConfigurationError(std::format("Invalid port in store URL: '{}'", port_str));
        }
        addr.port = static_cast<uint16_t>(*port);
    }

    if (host.empty()) {
        throw ConfigurationError(std::format("Missing host in store URL: '{}'", url));
    }
    addr.host = std::string(host);
    return addr;
}

std::string StoreAddress::redacted() const {
    std::string credentials;
    if (!password.empty()) {
        credentials = std::format("{}:***@", username);
    } else if (!username.empty()) {
        credentials = std::format("{}@", username);
    }
    return std::format("{}{}{}:{}/{}",
        use_tls ? kTlsScheme : kPlainScheme, credentials, host, port, database);
}

} // namespace kvguard
