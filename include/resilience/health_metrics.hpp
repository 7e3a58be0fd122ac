#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace kvguard {

/**
 * @brief Rolling probe timings and consecutive outcome counters
 *
 * Fed by both user operations (outcomes only) and health probes
 * (outcomes + response time). Thread-safe.
 */
class HealthMetrics {
public:
    static constexpr size_t kMaxSamples = 100;

    struct Snapshot {
        uint64_t consecutive_successes = 0;
        uint64_t consecutive_failures = 0;
        size_t sample_count = 0;
        std::optional<std::chrono::microseconds> avg_response_time;
        std::optional<std::chrono::microseconds> last_response_time;
        std::chrono::system_clock::time_point last_check{};  // epoch = never
    };

    void record_success();
    void record_failure();

    /**
     * @brief Append a probe duration (oldest sample dropped beyond kMaxSamples)
     */
    void record_response_time(std::chrono::microseconds elapsed);

    void mark_checked();

    [[nodiscard]] Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::chrono::microseconds> response_times_;
    std::optional<std::chrono::microseconds> last_response_time_;
    uint64_t consecutive_successes_ = 0;
    uint64_t consecutive_failures_ = 0;
    std::chrono::system_clock::time_point last_check_{};
};

} // namespace kvguard
