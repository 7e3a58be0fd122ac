#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace kvguard::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);

    return std::format("{}.{:03d}{}", time_buf, static_cast<int>(ms.count()), tz_buf);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/// Epoch means "never happened"; rendered as JSON null.
inline std::string timestamp_or_null(const std::chrono::system_clock::time_point& tp) {
    if (tp.time_since_epoch().count() == 0) return "null";
    return std::format("\"{}\"", format_timestamp(tp));
}

template<typename Rep, typename Period>
[[nodiscard]] inline double to_seconds(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration<double>(d).count();
}

[[nodiscard]] inline std::chrono::milliseconds from_seconds(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Type-Safe Range Check (eliminates impossible comparisons at compile time)
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    bool below = false;
    bool above = false;
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) >= static_cast<Common>(Lo)) {
        (void)value; // T can never be below Lo
    } else {
        below = static_cast<Common>(value) < static_cast<Common>(Lo);
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) <= static_cast<Common>(Hi)) {
        (void)value; // T can never exceed Hi
    } else {
        above = static_cast<Common>(value) > static_cast<Common>(Hi);
    }
    return !below && !above;
}

// ============================================================================
// Numeric Parsing (std::from_chars, no exceptions or locale)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline bool starts_with_ci(std::string_view str, std::string_view prefix) {
    if (str.size() < prefix.size()) return false;
    return to_lower(str.substr(0, prefix.size())) == to_lower(prefix);
}

/**
 * @brief Escape a string for safe embedding in a JSON string value.
 * Handles: " \ \n \r \t
 */
[[nodiscard]] inline std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

/// "debug" | "info" | "warn" | "warning" | "error"; nullopt if unrecognized
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace kvguard::utils
