#include "resilience/health_metrics.hpp"

namespace kvguard {

void HealthMetrics::record_success() {
    std::lock_guard lock(mutex_);
    ++consecutive_successes_;
    consecutive_failures_ = 0;
}

void HealthMetrics::record_failure() {
    std::lock_guard lock(mutex_);
    ++consecutive_failures_;
    consecutive_successes_ = 0;
}

void HealthMetrics::record_response_time(std::chrono::microseconds elapsed) {
    std::lock_guard lock(mutex_);
    response_times_.push_back(elapsed);
    if (response_times_.size() > kMaxSamples) {
        response_times_.pop_front();
    }
    last_response_time_ = elapsed;
}

void HealthMetrics::mark_checked() {
    std::lock_guard lock(mutex_);
    last_check_ = std::chrono::system_clock::now();
}

HealthMetrics::Snapshot HealthMetrics::snapshot() const {
    std::lock_guard lock(mutex_);

    Snapshot snap;
    snap.consecutive_successes = consecutive_successes_;
    snap.consecutive_failures = consecutive_failures_;
    snap.sample_count = response_times_.size();
    snap.last_response_time = last_response_time_;
    snap.last_check = last_check_;

    if (!response_times_.empty()) {
        std::chrono::microseconds total{0};
        for (const auto& t : response_times_) {
            total += t;
        }
        snap.avg_response_time = total / static_cast<int64_t>(response_times_.size());
    }
    return snap;
}

} // namespace kvguard
