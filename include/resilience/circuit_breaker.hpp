#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace kvguard {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::system_clock::time_point timestamp;
    std::string breaker_name;
};

/**
 * @brief Circuit Breaker guarding the backing store
 *
 * Three states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests immediately (no store I/O)
 * - HALF_OPEN:  Trial window, requests pass and the next outcome decides
 *
 * State transitions:
 * - CLOSED → OPEN:      failure_count >= failure_threshold
 * - OPEN → HALF_OPEN:   recovery_timeout elapsed since last failure, on an access attempt
 * - HALF_OPEN → CLOSED: any recorded success (resets failure_count)
 * - HALF_OPEN → OPEN:   any recorded failure
 *
 * A success while CLOSED does not reset failure_count; isolated failures keep
 * accumulating toward the threshold until the circuit closes or is reset.
 *
 * All state is guarded by one recursive mutex so nested calls
 * (allow_request → attempt_reset → should_attempt_reset) re-enter safely.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        uint32_t failure_threshold;             // Failures to trip OPEN
        std::chrono::milliseconds recovery_timeout;  // Time before trying HALF_OPEN

        Config()
            : failure_threshold(5),
              recovery_timeout(60000) {}
    };

    explicit CircuitBreaker(std::string name, const Config& config = Config());

    /**
     * @brief Record an infrastructure failure (counts toward the threshold)
     * @param message Stored as last error
     */
    void record_failure(const std::string& message);

    /**
     * @brief Record a failure with classification
     *
     * APPLICATION failures bump failed_requests and last_error only.
     */
    void record_failure(const std::string& message, FailureCategory category);

    /**
     * @brief Record a successful operation (HALF_OPEN → CLOSED)
     */
    void record_success();

    [[nodiscard]] bool is_open() const;

    /**
     * @brief True iff OPEN and recovery_timeout has elapsed since the last failure
     */
    [[nodiscard]] bool should_attempt_reset() const;

    /**
     * @brief OPEN → HALF_OPEN if should_attempt_reset()
     * @return true if this call performed the transition
     */
    bool attempt_reset();

    /**
     * @brief Access gate: attempts reset when OPEN
     * @return false if the circuit is (still) OPEN
     */
    [[nodiscard]] bool allow_request();

    /**
     * @brief Force CLOSED, zero failure_count, clear timestamps
     */
    void reset();

    [[nodiscard]] CircuitState get_state() const;

    [[nodiscard]] uint64_t failure_count() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    const std::string& name() const { return name_; }

    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions (invoked under the breaker lock)
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    void trip();
    void close_circuit();
    void transition(CircuitState to);

    std::string name_;
    Config config_;

    mutable std::recursive_mutex mutex_;

    CircuitState state_ = CircuitState::CLOSED;
    uint64_t failure_count_ = 0;
    bool has_failure_ = false;
    Clock::time_point last_failure_;
    std::chrono::system_clock::time_point last_failure_wall_{};
    std::chrono::system_clock::time_point half_open_since_{};
    std::string last_error_;

    // Monotonic counters
    uint64_t successful_requests_ = 0;
    uint64_t failed_requests_ = 0;
    uint64_t infrastructure_failures_ = 0;
    uint64_t application_failures_ = 0;
    uint64_t circuit_opens_ = 0;
    uint64_t circuit_closes_ = 0;

    // State change events
    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace kvguard
