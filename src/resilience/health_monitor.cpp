#include "resilience/health_monitor.hpp"
#include "core/utils.hpp"

#include <format>

namespace kvguard {

HealthMonitor::HealthMonitor(Probe probe, CircuitBreaker& breaker,
                             HealthMetrics& metrics, Config config)
    : probe_(std::move(probe)),
      breaker_(breaker),
      metrics_(metrics),
      config_(config) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        utils::log::warn("Health monitor already running");
        return;
    }
    {
        std::lock_guard lock(mutex_);
        exited_ = false;
    }
    worker_ = std::thread([this] { run_loop(); });
    utils::log::info(std::format("Health monitor started (interval={}ms)", config_.interval.count()));
}

bool HealthMonitor::stop() {
    if (!running_.exchange(false)) return true;

    utils::log::info("Stopping health monitor");
    bool exited_in_time;
    {
        std::unique_lock lock(mutex_);
        wake_cv_.notify_all();
        exited_in_time = exit_cv_.wait_for(lock, config_.join_timeout, [this] { return exited_; });
    }

    if (!exited_in_time) {
        // The in-flight probe is bounded by the store socket timeout
        utils::log::warn(std::format("Health monitor did not stop within {}ms; waiting for in-flight probe",
            config_.join_timeout.count()));
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    return exited_in_time;
}

void HealthMonitor::run_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            run_cycle();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Error in health monitor loop: {}", e.what()));
        }

        std::unique_lock lock(mutex_);
        wake_cv_.wait_for(lock, config_.interval,
            [this] { return !running_.load(std::memory_order_acquire); });
    }

    std::lock_guard lock(mutex_);
    exited_ = true;
    exit_cv_.notify_all();
}

void HealthMonitor::run_cycle() {
    utils::Timer timer;
    const bool healthy = probe_();
    metrics_.record_response_time(timer.elapsed_us());
    checks_performed_.fetch_add(1, std::memory_order_relaxed);

    if (last_healthy_.has_value() && *last_healthy_ != healthy) {
        if (healthy) {
            utils::log::info("Store connection recovered - health check successful");
        } else {
            utils::log::warn("Store connection degraded - health check failed");
        }
    }
    last_healthy_ = healthy;

    if (healthy && breaker_.is_open() && breaker_.should_attempt_reset()) {
        utils::log::info("Auto-recovering circuit breaker based on health check");
        if (breaker_.attempt_reset()) {
            auto_recoveries_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

} // namespace kvguard
