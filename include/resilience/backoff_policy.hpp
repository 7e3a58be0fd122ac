#pragma once

#include "config/config_types.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace kvguard {

/**
 * @brief Exponential backoff with optional ±25% jitter
 *
 * delay(n) = min(base * multiplier^n, max)
 * With jitter: delay(n) * U(0.75, 1.25), floored at 100ms.
 *
 * Stateless apart from the random engine; thread-safe.
 */
class ExponentialBackoff {
public:
    static constexpr double kJitterFraction = 0.25;
    static constexpr std::chrono::milliseconds kMinDelay{100};

    explicit ExponentialBackoff(const BackoffConfig& config = BackoffConfig());

    /**
     * @brief Construct with a fixed seed (deterministic jitter for tests)
     */
    ExponentialBackoff(const BackoffConfig& config, uint64_t seed);

    /**
     * @brief Delay before retrying after the given 0-based attempt
     */
    [[nodiscard]] std::chrono::milliseconds delay(uint32_t attempt);

    /**
     * @brief Un-jittered delay, min(base * multiplier^attempt, max)
     */
    [[nodiscard]] std::chrono::milliseconds nominal_delay(uint32_t attempt) const;

    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    std::mt19937_64 rng_;
    std::mutex rng_mutex_;
};

} // namespace kvguard
