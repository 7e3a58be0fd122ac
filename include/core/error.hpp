#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace kvguard {

/**
 * @brief Error categories for store operations
 *
 * Transient: CONNECTION_ERROR, TIMEOUT_ERROR, BACKEND_ERROR
 *   (only CONNECTION_ERROR and TIMEOUT_ERROR are retried)
 * Non-transient: AUTHENTICATION_ERROR, RESPONSE_ERROR,
 *   CONFIGURATION_ERROR, INTERNAL_ERROR
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,
    TIMEOUT_ERROR,
    BACKEND_ERROR,
    AUTHENTICATION_ERROR,
    RESPONSE_ERROR,
    CONFIGURATION_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::CONNECTION_ERROR:     return "connection_error";
        case ErrorCategory::TIMEOUT_ERROR:        return "timeout_error";
        case ErrorCategory::BACKEND_ERROR:        return "backend_error";
        case ErrorCategory::AUTHENTICATION_ERROR: return "authentication_error";
        case ErrorCategory::RESPONSE_ERROR:       return "response_error";
        case ErrorCategory::CONFIGURATION_ERROR:  return "configuration_error";
        case ErrorCategory::INTERNAL_ERROR:       return "internal_error";
    }
    return "unknown";
}

[[nodiscard]] inline constexpr bool is_transient(ErrorCategory c) {
    return c == ErrorCategory::CONNECTION_ERROR ||
           c == ErrorCategory::TIMEOUT_ERROR ||
           c == ErrorCategory::BACKEND_ERROR;
}

[[nodiscard]] inline constexpr bool is_retryable(ErrorCategory c) {
    return c == ErrorCategory::CONNECTION_ERROR || c == ErrorCategory::TIMEOUT_ERROR;
}

// ============================================================================
// Exception hierarchy
// ============================================================================

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// Store is down, slow or temporarily refusing work.
class TransientStoreError : public StoreError {
public:
    explicit TransientStoreError(const std::string& message)
        : StoreError(ErrorCategory::BACKEND_ERROR, message) {}

protected:
    TransientStoreError(ErrorCategory category, const std::string& message)
        : StoreError(category, message) {}
};

class ConnectionError : public TransientStoreError {
public:
    explicit ConnectionError(const std::string& message)
        : TransientStoreError(ErrorCategory::CONNECTION_ERROR, message) {}
};

class TimeoutError : public TransientStoreError {
public:
    explicit TimeoutError(const std::string& message)
        : TransientStoreError(ErrorCategory::TIMEOUT_ERROR, message) {}
};

/// Request or deployment is wrong; retrying will not help.
class NonTransientStoreError : public StoreError {
protected:
    NonTransientStoreError(ErrorCategory category, const std::string& message)
        : StoreError(category, message) {}
};

class AuthenticationError : public NonTransientStoreError {
public:
    explicit AuthenticationError(const std::string& message)
        : NonTransientStoreError(ErrorCategory::AUTHENTICATION_ERROR, message) {}
};

class ResponseError : public NonTransientStoreError {
public:
    explicit ResponseError(const std::string& message)
        : NonTransientStoreError(ErrorCategory::RESPONSE_ERROR, message) {}
};

class ConfigurationError : public NonTransientStoreError {
public:
    explicit ConfigurationError(const std::string& message)
        : NonTransientStoreError(ErrorCategory::CONFIGURATION_ERROR, message) {}
};

/**
 * @brief Map any exception to its category (non-store exceptions are INTERNAL_ERROR)
 */
[[nodiscard]] inline ErrorCategory classify(const std::exception& e) noexcept {
    if (const auto* se = dynamic_cast<const StoreError*>(&e)) {
        return se->category();
    }
    return ErrorCategory::INTERNAL_ERROR;
}

/**
 * @brief Raise the exception type matching a category
 */
[[noreturn]] inline void throw_store_error(ErrorCategory category, const std::string& message) {
    switch (category) {
        case ErrorCategory::CONNECTION_ERROR:     throw ConnectionError(message);
        case ErrorCategory::TIMEOUT_ERROR:        throw TimeoutError(message);
        case ErrorCategory::BACKEND_ERROR:        throw TransientStoreError(message);
        case ErrorCategory::AUTHENTICATION_ERROR: throw AuthenticationError(message);
        case ErrorCategory::RESPONSE_ERROR:       throw ResponseError(message);
        case ErrorCategory::CONFIGURATION_ERROR:  throw ConfigurationError(message);
        case ErrorCategory::NONE:
        case ErrorCategory::INTERNAL_ERROR:
            break;
    }
    throw std::runtime_error(message);
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace kvguard
