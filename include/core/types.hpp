#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace kvguard {

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing fast, no calls reach the store
    HALF_OPEN       // Trial window to test recovery
};

/**
 * @brief Failure classification for circuit breaker accounting
 *
 * Only INFRASTRUCTURE failures (store down, unreachable, timing out) count
 * toward the trip threshold. APPLICATION failures (bad request, auth) are
 * recorded for observability only.
 */
enum class FailureCategory {
    INFRASTRUCTURE,
    APPLICATION
};

[[nodiscard]] inline constexpr const char* circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

struct CircuitBreakerStats {
    CircuitState state;
    uint64_t failure_count;
    uint64_t successful_requests;
    uint64_t failed_requests;
    uint64_t infrastructure_failures;
    uint64_t application_failures;
    uint64_t circuit_opens;
    uint64_t circuit_closes;
    std::string last_error;
    std::chrono::system_clock::time_point last_failure;     // epoch = never
    std::chrono::system_clock::time_point half_open_since;  // epoch = never

    CircuitBreakerStats()
        : state(CircuitState::CLOSED), failure_count(0), successful_requests(0),
          failed_requests(0), infrastructure_failures(0), application_failures(0),
          circuit_opens(0), circuit_closes(0) {}
};

} // namespace kvguard
