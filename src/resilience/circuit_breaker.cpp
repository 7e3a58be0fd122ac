#include "resilience/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace kvguard {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

void CircuitBreaker::record_failure(const std::string& message) {
    record_failure(message, FailureCategory::INFRASTRUCTURE);
}

void CircuitBreaker::record_failure(const std::string& message, FailureCategory category) {
    std::lock_guard lock(mutex_);

    ++failed_requests_;
    last_error_ = message;

    if (category == FailureCategory::APPLICATION) {
        ++application_failures_;
        return;
    }

    ++infrastructure_failures_;
    ++failure_count_;
    has_failure_ = true;
    last_failure_ = Clock::now();
    last_failure_wall_ = std::chrono::system_clock::now();

    if (state_ == CircuitState::HALF_OPEN) {
        // Trial failed → back to OPEN; last_failure_ re-arms the recovery timer
        trip();
    } else if (state_ == CircuitState::CLOSED &&
               failure_count_ >= config_.failure_threshold) {
        trip();
    }
}

void CircuitBreaker::record_success() {
    std::lock_guard lock(mutex_);

    ++successful_requests_;

    if (state_ == CircuitState::HALF_OPEN) {
        close_circuit();
    }
}

bool CircuitBreaker::is_open() const {
    std::lock_guard lock(mutex_);
    return state_ == CircuitState::OPEN;
}

bool CircuitBreaker::should_attempt_reset() const {
    std::lock_guard lock(mutex_);
    if (state_ != CircuitState::OPEN) {
        return false;
    }
    if (!has_failure_) {
        return true;
    }
    return Clock::now() - last_failure_ >= config_.recovery_timeout;
}

bool CircuitBreaker::attempt_reset() {
    std::lock_guard lock(mutex_);
    if (!should_attempt_reset()) {
        return false;
    }

    half_open_since_ = std::chrono::system_clock::now();
    transition(CircuitState::HALF_OPEN);
    utils::log::info(std::format("Circuit breaker '{}' half-open - testing store connection", name_));
    return true;
}

bool CircuitBreaker::allow_request() {
    std::lock_guard lock(mutex_);
    if (state_ == CircuitState::OPEN) {
        attempt_reset();
        return state_ != CircuitState::OPEN;
    }
    return true;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    failure_count_ = 0;
    has_failure_ = false;
    last_failure_ = {};
    last_failure_wall_ = {};
    half_open_since_ = {};

    if (state_ != CircuitState::CLOSED) {
        transition(CircuitState::CLOSED);
    }
    utils::log::info(std::format("Circuit breaker '{}' manually reset", name_));
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t CircuitBreaker::failure_count() const {
    std::lock_guard lock(mutex_);
    return failure_count_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard lock(mutex_);

    CircuitBreakerStats stats;
    stats.state = state_;
    stats.failure_count = failure_count_;
    stats.successful_requests = successful_requests_;
    stats.failed_requests = failed_requests_;
    stats.infrastructure_failures = infrastructure_failures_;
    stats.application_failures = application_failures_;
    stats.circuit_opens = circuit_opens_;
    stats.circuit_closes = circuit_closes_;
    stats.last_error = last_error_;
    stats.last_failure = last_failure_wall_;
    stats.half_open_since = half_open_since_;
    return stats;
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

void CircuitBreaker::trip() {
    if (state_ == CircuitState::OPEN) {
        return;
    }
    ++circuit_opens_;
    transition(CircuitState::OPEN);
    utils::log::warn(std::format("Circuit breaker '{}' opened after {} failures (last error: {})",
        name_, failure_count_, last_error_));
}

void CircuitBreaker::close_circuit() {
    if (state_ == CircuitState::CLOSED) {
        return;
    }
    failure_count_ = 0;
    ++circuit_closes_;
    transition(CircuitState::CLOSED);
    utils::log::info(std::format("Circuit breaker '{}' closed - store connection restored", name_));
}

void CircuitBreaker::transition(CircuitState to) {
    const CircuitState from = state_;
    state_ = to;

    StateChangeEvent event{from, to, std::chrono::system_clock::now(), name_};
    recent_events_.push_back(event);
    if (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    if (on_state_change_) {
        on_state_change_(event);
    }
}

} // namespace kvguard
