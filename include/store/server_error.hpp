#pragma once

#include "core/error.hpp"
#include <string_view>

namespace kvguard {

/**
 * @brief Map a store error reply ("WRONGPASS invalid username-password pair", "LOADING ...")
 *        to an error category by its leading code
 *
 * NOAUTH, WRONGPASS, NOPERM                        -> AUTHENTICATION_ERROR
 * LOADING, BUSY, MASTERDOWN, TRYAGAIN, CLUSTERDOWN -> BACKEND_ERROR (transient, not retried)
 * anything else (ERR, WRONGTYPE, ...)              -> RESPONSE_ERROR
 */
[[nodiscard]] ErrorCategory classify_server_error(std::string_view message);

/**
 * @brief Throw the StoreError subclass matching a store error reply
 */
[[noreturn]] void throw_server_error(std::string_view message);

} // namespace kvguard
