#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "manager/store_statistics.hpp"
#include "resilience/backoff_policy.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/health_metrics.hpp"
#include "resilience/health_monitor.hpp"
#include "resilience/retry_executor.hpp"
#include "store/client_handle.hpp"
#include "store/iconnection_factory.hpp"
#include "store/store_client.hpp"

#include <atomic>
#include <cstddef>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kvguard {

/**
 * @brief Resilient access point to the backing store
 *
 * Composes the client handle (pool + PING), circuit breaker, retry executor
 * and health monitor. This is the only type callers depend on.
 *
 * Locking:
 * - Circuit state lives in CircuitBreaker (its own re-entrant mutex)
 * - mutex_ guards the handle and the health flag, never held across store I/O
 * - init_mutex_ serializes (re)initialization so only one thread dials the store
 *
 * Error policy:
 * - Transient (ConnectionError, TimeoutError, TransientStoreError):
 *   retried where retryable, recorded against the breaker, then fallback or nullopt
 * - Anything else: recorded for statistics only, rethrown unchanged
 */
class ConnectionManager {
public:
    /**
     * @brief Build the manager, open the pool and start the health monitor if enabled
     * @param config Immutable settings
     * @param factory Backend connection factory
     * @param sleeper Retry delay hook (defaults to std::this_thread::sleep_for)
     * @throws AuthenticationError / ConfigurationError if the first initialization fails that way
     */
    ConnectionManager(StoreConfig config,
                      std::shared_ptr<IConnectionFactory> factory,
                      RetryExecutor::Sleeper sleeper = {});

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Get the live client, or nullptr when the circuit is open or the store is unreachable
     *
     * Counts a request. While OPEN, tries OPEN -> HALF_OPEN once the recovery
     * timeout has elapsed and fails fast otherwise (no store I/O).
     * Lazily re-initializes the pool when there is no healthy handle.
     */
    [[nodiscard]] std::shared_ptr<StoreClient> get_client();

    /**
     * @brief Run op(client) with breaker, retry and fallback
     *
     * @param op Callable taking StoreClient&
     * @param fallback Zero-argument callable returning the same type, or nullptr
     * @param operation_name Name for logs
     * @param use_retry Run through the retry executor
     * @return op's result, fallback's result, or nullopt on a transient failure without fallback
     */
    template<typename Op, typename Fallback = std::nullptr_t>
    auto execute_with_fallback(Op&& op,
                               Fallback&& fallback = nullptr,
                               std::string_view operation_name = "store_operation",
                               bool use_retry = true)
        -> std::optional<std::invoke_result_t<Op&, StoreClient&>>;

    /**
     * @brief Synchronous liveness probe; updates breaker, metrics and health flag
     */
    HealthStatus health_check();

    [[nodiscard]] StoreStatistics get_statistics() const;

    /**
     * @brief Operator override: force CLOSED and eagerly re-initialize the pool
     */
    void reset_circuit();

    /**
     * @brief Stop the monitor, release the pool, mark unhealthy (idempotent)
     *
     * Returns once the monitor thread has exited. With a probe in flight that
     * can take up to connect_timeout + socket_timeout; monitor_join_timeout
     * only controls when a slow stop is logged.
     */
    void close();

    [[nodiscard]] bool is_healthy() const;
    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }
    [[nodiscard]] CircuitState circuit_state() const { return breaker_.get_state(); }
    [[nodiscard]] const StoreConfig& config() const { return config_; }

    // Exposed for admin endpoints and tests
    [[nodiscard]] CircuitBreaker& circuit_breaker() { return breaker_; }
    [[nodiscard]] const HealthMonitor* health_monitor() const { return monitor_.get(); }

private:
    /**
     * @brief get_client() body; failed_fast is set when the open circuit refused the request
     */
    std::shared_ptr<StoreClient> acquire_client(bool& failed_fast);

    /**
     * @brief Build a fresh handle, replacing any existing one
     * @param force Rebuild even if a healthy handle exists
     * @return true on success
     * @throws AuthenticationError, ConfigurationError; other failures only mark the manager degraded
     */
    bool initialize_connection(bool force);

    void record_operation_success();
    void record_operation_failure(const std::exception& e, std::string_view operation_name);

    StoreConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    CircuitBreaker breaker_;
    ExponentialBackoff backoff_;
    RetryExecutor retry_;
    HealthMetrics metrics_;
    std::unique_ptr<HealthMonitor> monitor_;

    mutable std::recursive_mutex mutex_;
    std::shared_ptr<ClientHandle> handle_;
    bool healthy_ = false;
    std::chrono::system_clock::time_point last_health_check_{};

    std::mutex init_mutex_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> fallback_activations_{0};
    std::atomic<uint64_t> health_check_count_{0};
    std::atomic<bool> closed_{false};
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename Op, typename Fallback>
auto ConnectionManager::execute_with_fallback(Op&& op,
                                              Fallback&& fallback,
                                              std::string_view operation_name,
                                              bool use_retry)
    -> std::optional<std::invoke_result_t<Op&, StoreClient&>> {
    using R = std::invoke_result_t<Op&, StoreClient&>;
    constexpr bool kHasFallback = !std::is_null_pointer_v<std::remove_cvref_t<Fallback>>;
    static_assert(!std::is_void_v<R>, "store operations must return a value");

    bool failed_fast = false;
    auto client = acquire_client(failed_fast);

    if (!client) {
        if constexpr (kHasFallback) {
            // The fail-fast path already counted its activation
            if (!failed_fast) {
                fallback_activations_.fetch_add(1, std::memory_order_relaxed);
            }
            utils::log::warn(std::format("Store unavailable for {}, using fallback", operation_name));
            return std::optional<R>(fallback());
        } else {
            utils::log::warn(std::format("Store unavailable for {}, no fallback", operation_name));
            return std::nullopt;
        }
    }

    try {
        std::optional<R> result;
        if (use_retry) {
            result.emplace(retry_.run([&]() -> R { return op(*client); }, operation_name));
        } else {
            result.emplace(op(*client));
        }
        record_operation_success();
        return result;
    } catch (const TransientStoreError& e) {
        record_operation_failure(e, operation_name);
        if constexpr (kHasFallback) {
            fallback_activations_.fetch_add(1, std::memory_order_relaxed);
            utils::log::info(std::format("Using fallback for {}", operation_name));
            return std::optional<R>(fallback());
        } else {
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        record_operation_failure(e, operation_name);
        throw;
    }
}

} // namespace kvguard
