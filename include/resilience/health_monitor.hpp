#pragma once

#include "resilience/circuit_breaker.hpp"
#include "resilience/health_metrics.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace kvguard {

/**
 * @brief Background liveness probing of the backing store
 *
 * Each cycle runs the probe, records its wall-clock duration into HealthMetrics,
 * and, when the probe succeeds while the breaker is OPEN and its recovery
 * timeout has elapsed, moves the breaker to HALF_OPEN without waiting for
 * the next caller. Sleeps between cycles on a condition variable so stop()
 * wakes it immediately.
 */
class HealthMonitor {
public:
    struct Config {
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds join_timeout{5000};   // Grace period before stop() warns
    };

    /// Returns true if the store answered the liveness probe.
    using Probe = std::function<bool()>;

    HealthMonitor(Probe probe, CircuitBreaker& breaker, HealthMetrics& metrics, Config config);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();

    /**
     * @brief Signal the loop and wait for it to exit
     *
     * join_timeout is a grace period, not a hard limit: past it a warning is
     * logged and the call keeps waiting for the in-flight probe, which is
     * itself bounded by the store's connect and socket timeouts.
     * @return true if the loop exited within join_timeout
     */
    bool stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t checks_performed() const { return checks_performed_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t auto_recoveries() const { return auto_recoveries_.load(std::memory_order_relaxed); }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    void run_loop();
    void run_cycle();

    Probe probe_;
    CircuitBreaker& breaker_;
    HealthMetrics& metrics_;
    Config config_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable exit_cv_;
    bool exited_ = true;

    std::optional<bool> last_healthy_;
    std::atomic<uint64_t> checks_performed_{0};
    std::atomic<uint64_t> auto_recoveries_{0};
};

} // namespace kvguard
