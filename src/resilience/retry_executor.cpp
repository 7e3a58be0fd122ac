#include "resilience/retry_executor.hpp"
#include "core/utils.hpp"

#include <format>
#include <thread>

namespace kvguard {

RetryExecutor::RetryExecutor(uint32_t max_attempts, ExponentialBackoff& backoff, Sleeper sleeper)
    : max_attempts_(max_attempts),
      backoff_(backoff),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

RetryExecutor::Stats RetryExecutor::get_stats() const {
    return {
        attempts_.load(std::memory_order_relaxed),
        successes_.load(std::memory_order_relaxed)
    };
}

void RetryExecutor::note_success(uint32_t attempt, std::string_view operation_name) {
    if (attempt == 0) return;
    successes_.fetch_add(1, std::memory_order_relaxed);
    utils::log::info(std::format("Store operation '{}' succeeded after {} attempts",
        operation_name, attempt + 1));
}

void RetryExecutor::note_not_retryable(const StoreError& e, std::string_view operation_name) const {
    utils::log::error(std::format("Non-retryable {} in store operation '{}': {}",
        error_category_to_string(e.category()), operation_name, e.what()));
}

void RetryExecutor::note_exhausted(const StoreError& e, uint32_t attempts,
                                   std::string_view operation_name) const {
    utils::log::error(std::format("Store operation '{}' failed after {} attempts: {}",
        operation_name, attempts, e.what()));
}

void RetryExecutor::wait_before_retry(const StoreError& e, uint32_t attempt, uint32_t attempts,
                                      std::string_view operation_name) {
    const auto delay = backoff_.delay(attempt);
    utils::log::warn(std::format("Store operation '{}' failed (attempt {}/{}), retrying in {}ms: {}",
        operation_name, attempt + 1, attempts, delay.count(), e.what()));
    sleeper_(delay);
}

} // namespace kvguard
