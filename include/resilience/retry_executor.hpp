#pragma once

#include "core/error.hpp"
#include "resilience/backoff_policy.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kvguard {

/**
 * @brief Bounded retry of a unit of work with exponential backoff
 *
 * Only CONNECTION_ERROR / TIMEOUT_ERROR are retried. Any other exception
 * (including non-retryable StoreErrors) propagates on the attempt that raised it.
 * The final retryable error is re-thrown once attempts are exhausted.
 * Deciding on a fallback is the caller's job.
 *
 * The sleep between attempts happens on the calling thread with no lock held.
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Stats {
        uint64_t attempts = 0;    // Every invocation of the operation
        uint64_t successes = 0;   // Successes that needed more than one attempt
    };

    /**
     * @param max_attempts Total attempts including the first (values < 1 behave as 1)
     * @param backoff Delay schedule
     * @param sleeper Sleep function; defaults to std::this_thread::sleep_for
     */
    RetryExecutor(uint32_t max_attempts, ExponentialBackoff& backoff, Sleeper sleeper = {});

    template<typename Op>
    auto run(Op&& op, std::string_view operation_name) -> std::invoke_result_t<Op&> {
        using R = std::invoke_result_t<Op&>;
        const uint32_t attempts = std::max<uint32_t>(max_attempts_, 1);

        for (uint32_t attempt = 0;; ++attempt) {
            attempts_.fetch_add(1, std::memory_order_relaxed);
            try {
                if constexpr (std::is_void_v<R>) {
                    op();
                    note_success(attempt, operation_name);
                    return;
                } else {
                    R result = op();
                    note_success(attempt, operation_name);
                    return result;
                }
            } catch (const StoreError& e) {
                if (!is_retryable(e.category())) {
                    note_not_retryable(e, operation_name);
                    throw;
                }
                if (attempt + 1 >= attempts) {
                    note_exhausted(e, attempts, operation_name);
                    throw;
                }
                wait_before_retry(e, attempt, attempts, operation_name);
            }
        }
    }

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] uint32_t max_attempts() const { return max_attempts_; }

private:
    void note_success(uint32_t attempt, std::string_view operation_name);
    void note_not_retryable(const StoreError& e, std::string_view operation_name) const;
    void note_exhausted(const StoreError& e, uint32_t attempts, std::string_view operation_name) const;
    void wait_before_retry(const StoreError& e, uint32_t attempt, uint32_t attempts,
                           std::string_view operation_name);

    uint32_t max_attempts_;
    ExponentialBackoff& backoff_;
    Sleeper sleeper_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> successes_{0};
};

} // namespace kvguard
