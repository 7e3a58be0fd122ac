#pragma once

#include "core/types.hpp"
#include "store/connection_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kvguard {

/**
 * @brief Result of one synchronous liveness probe
 */
struct HealthStatus {
    bool is_healthy = false;
    CircuitState circuit_state = CircuitState::CLOSED;
    uint64_t failure_count = 0;
    std::chrono::system_clock::time_point last_failure{};  // epoch = never
    bool pool_created = false;
    bool client_created = false;
    bool ping_successful = false;
    std::optional<std::string> ping_error;
    std::chrono::system_clock::time_point timestamp{};

    [[nodiscard]] std::string to_json() const;
};

struct PoolInfo {
    bool initialized = false;
    PoolStats stats;
};

struct RetryStatistics {
    uint32_t max_attempts = 0;
    uint64_t total_retries = 0;        // Every attempt, first ones included
    uint64_t successful_retries = 0;   // Successes after at least one failed attempt
    double retry_success_rate = 0.0;   // successful_retries / total_retries * 100, 0 if none
};

struct HealthMonitoringInfo {
    bool enabled = false;
    bool running = false;
    std::chrono::milliseconds interval{0};
    std::chrono::system_clock::time_point last_check{};  // epoch = never
    uint64_t consecutive_failures = 0;
    uint64_t consecutive_successes = 0;
    std::optional<std::chrono::microseconds> avg_response_time;
    std::optional<std::chrono::microseconds> last_response_time;
    uint64_t checks_performed = 0;
    uint64_t auto_recoveries = 0;
};

/**
 * @brief Point-in-time snapshot of the connection manager
 */
struct StoreStatistics {
    // Monotonic counters
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    uint64_t circuit_opens = 0;
    uint64_t circuit_closes = 0;
    uint64_t fallback_activations = 0;
    uint64_t health_check_count = 0;
    std::string last_error;
    std::chrono::system_clock::time_point last_health_check{};  // epoch = never

    // Current state
    CircuitState circuit_state = CircuitState::CLOSED;
    uint64_t failure_count = 0;
    bool is_healthy = false;
    double success_rate = 100.0;   // successful / total * 100, capped at 100, 100 if no requests

    PoolInfo pool;
    RetryStatistics retry;
    HealthMonitoringInfo health_monitoring;

    [[nodiscard]] std::string to_json() const;
};

/**
 * @brief successful / total as a percentage (100 when total is zero)
 *
 * Health probes add to successful but not to total, so the ratio is capped at 100.
 */
[[nodiscard]] inline double success_rate_percent(uint64_t successful, uint64_t total) {
    if (total == 0) return 100.0;
    return std::min(100.0, static_cast<double>(successful) / static_cast<double>(total) * 100.0);
}

} // namespace kvguard
