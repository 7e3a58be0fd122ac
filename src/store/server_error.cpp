#include "store/server_error.hpp"
#include "core/utils.hpp"

#include <array>
#include <string>

namespace kvguard {

namespace {

constexpr std::array<std::string_view, 3> kAuthCodes = {"NOAUTH", "WRONGPASS", "NOPERM"};
// Server-side conditions: the store is up but cannot serve this request right now
constexpr std::array<std::string_view, 9> kBusyCodes = {
    "LOADING", "BUSY", "MASTERDOWN", "TRYAGAIN", "CLUSTERDOWN",
    "READONLY", "OOM", "MISCONF", "NOREPLICAS"};

std::string_view leading_code(std::string_view message) {
    // RESP errors may carry the '-' marker when passed through verbatim
    if (!message.empty() && message.front() == '-') {
        message.remove_prefix(1);
    }
    const auto end = message.find(' ');
    return end == std::string_view::npos ? message : message.substr(0, end);
}

} // namespace

ErrorCategory classify_server_error(std::string_view message) {
    const std::string code = utils::to_lower(leading_code(message));

    for (const auto c : kAuthCodes) {
        if (code == utils::to_lower(c)) return ErrorCategory::AUTHENTICATION_ERROR;
    }
    for (const auto c : kBusyCodes) {
        if (code == utils::to_lower(c)) return ErrorCategory::BACKEND_ERROR;
    }
    return ErrorCategory::RESPONSE_ERROR;
}

void throw_server_error(std::string_view message) {
    throw_store_error(classify_server_error(message), std::string(message));
}

} // namespace kvguard
