#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kvguard {

// ============================================================================
// Configuration Types
// ============================================================================

inline constexpr const char* kDefaultStoreUrl = "redis://localhost:6379/0";

/**
 * @brief Retry delay schedule: min(base * multiplier^attempt, max), ±25% jitter
 */
struct BackoffConfig {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 2.0;
    bool jitter_enabled = true;
};

/**
 * @brief Backing store connection manager settings (immutable after construction)
 */
struct StoreConfig {
    std::string url;
    size_t max_connections;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds socket_timeout;
    std::chrono::milliseconds pool_idle_check;   // Ping idle connections older than this before reuse

    // Circuit breaker
    uint32_t failure_threshold;
    std::chrono::milliseconds recovery_timeout;

    // Retry
    uint32_t max_retry_attempts;
    BackoffConfig backoff;

    // Health monitor
    bool enable_health_monitoring;
    std::chrono::milliseconds health_check_interval;
    std::chrono::milliseconds monitor_join_timeout;   // Warn if the monitor has not exited by then

    StoreConfig()
        : url(kDefaultStoreUrl),
          max_connections(50),
          connect_timeout(5000),
          socket_timeout(5000),
          pool_idle_check(30000),
          failure_threshold(5),
          recovery_timeout(60000),
          max_retry_attempts(3),
          enable_health_monitoring(true),
          health_check_interval(30000),
          monitor_join_timeout(5000) {}
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// KvGuardConfig - Complete parsed configuration
// ============================================================================

struct KvGuardConfig {
    StoreConfig store;
    LoggingConfig logging;
};

} // namespace kvguard
