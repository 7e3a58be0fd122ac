#include "resilience/backoff_policy.hpp"

#include <algorithm>
#include <cmath>

namespace kvguard {

ExponentialBackoff::ExponentialBackoff(const BackoffConfig& config)
    : ExponentialBackoff(config, std::random_device{}()) {}

ExponentialBackoff::ExponentialBackoff(const BackoffConfig& config, uint64_t seed)
    : config_(config), rng_(seed) {}

std::chrono::milliseconds ExponentialBackoff::nominal_delay(uint32_t attempt) const {
    const double base_ms = static_cast<double>(config_.base_delay.count());
    const double max_ms = static_cast<double>(config_.max_delay.count());
    const double raw_ms = base_ms * std::pow(config_.multiplier, static_cast<double>(attempt));

    // pow overflows to inf for large attempts; min() still yields max_ms
    const double capped_ms = std::min(raw_ms, max_ms);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(capped_ms)));
}

std::chrono::milliseconds ExponentialBackoff::delay(uint32_t attempt) {
    const auto nominal = nominal_delay(attempt);
    if (!config_.jitter_enabled) {
        return nominal;
    }

    const double nominal_ms = static_cast<double>(nominal.count());
    const double spread = nominal_ms * kJitterFraction;

    double jittered_ms;
    {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(-spread, spread);
        jittered_ms = nominal_ms + dist(rng_);
    }

    const auto result = std::chrono::milliseconds(static_cast<int64_t>(std::llround(jittered_ms)));
    return std::max(result, kMinDelay);
}

} // namespace kvguard
