#include "manager/connection_manager.hpp"

#include <format>

namespace kvguard {

namespace {

CircuitBreaker::Config breaker_config(const StoreConfig& config) {
    CircuitBreaker::Config cb;
    cb.failure_threshold = config.failure_threshold;
    cb.recovery_timeout = config.recovery_timeout;
    return cb;
}

} // namespace

ConnectionManager::ConnectionManager(StoreConfig config,
                                     std::shared_ptr<IConnectionFactory> factory,
                                     RetryExecutor::Sleeper sleeper)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      breaker_("store", breaker_config(config_)),
      backoff_(config_.backoff),
      retry_(config_.max_retry_attempts, backoff_, std::move(sleeper)) {

    if (!factory_) {
        throw ConfigurationError("ConnectionManager requires a connection factory");
    }

    utils::log::info(std::format(
        "Store connection manager starting: max_connections={} failure_threshold={} recovery_timeout={}ms",
        config_.max_connections, config_.failure_threshold, config_.recovery_timeout.count()));

    // Transient failure leaves the manager degraded; auth/config failures throw
    initialize_connection(false);

    if (config_.enable_health_monitoring) {
        HealthMonitor::Config monitor_config;
        monitor_config.interval = config_.health_check_interval;
        monitor_config.join_timeout = config_.monitor_join_timeout;
        monitor_ = std::make_unique<HealthMonitor>(
            [this] { return health_check().is_healthy; },
            breaker_, metrics_, monitor_config);
        monitor_->start();
    }
}

ConnectionManager::~ConnectionManager() {
    close();
}

std::shared_ptr<StoreClient> ConnectionManager::get_client() {
    bool failed_fast = false;
    return acquire_client(failed_fast);
}

std::shared_ptr<StoreClient> ConnectionManager::acquire_client(bool& failed_fast) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (closed_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (breaker_.is_open()) {
        breaker_.attempt_reset();
        if (breaker_.is_open()) {
            // Fail fast: no store I/O while the circuit is open
            fallback_activations_.fetch_add(1, std::memory_order_relaxed);
            failed_fast = true;
            return nullptr;
        }
    }

    {
        std::lock_guard lock(mutex_);
        if (handle_ && healthy_) {
            return handle_->client();
        }
    }

    if (!initialize_connection(false)) {
        return nullptr;
    }

    std::lock_guard lock(mutex_);
    return handle_ ? handle_->client() : nullptr;
}

bool ConnectionManager::initialize_connection(bool force) {
    std::lock_guard init_lock(init_mutex_);

    if (!force) {
        // Another caller may have finished initializing while we waited
        std::lock_guard lock(mutex_);
        if (handle_ && healthy_) {
            return true;
        }
    }

    auto result = ClientHandle::initialize(config_, factory_);

    std::shared_ptr<ClientHandle> old;
    if (result.is_ok()) {
        std::shared_ptr<ClientHandle> rejected;
        {
            std::lock_guard lock(mutex_);
            if (closed_.load(std::memory_order_acquire)) {
                rejected = result.value();
            } else {
                old = std::move(handle_);
                handle_ = result.value();
                healthy_ = true;
            }
        }
        if (old) old->close();
        if (rejected) {
            rejected->close();
            return false;
        }
        utils::log::info("Store connection manager initialized successfully");
        return true;
    }

    const auto category = result.error_category();
    const auto& message = result.error_message();
    utils::log::error(std::format("Failed to initialize store connection: {}", message));

    {
        std::lock_guard lock(mutex_);
        old = std::move(handle_);
        healthy_ = false;
    }
    if (old) old->close();

    // Only bad credentials or a bad address are fatal; anything else leaves the manager degraded
    if (category == ErrorCategory::AUTHENTICATION_ERROR ||
        category == ErrorCategory::CONFIGURATION_ERROR) {
        breaker_.record_failure(message, FailureCategory::APPLICATION);
        throw_store_error(category, message);
    }

    breaker_.record_failure(message);
    return false;
}

void ConnectionManager::record_operation_success() {
    breaker_.record_success();
    metrics_.record_success();
}

void ConnectionManager::record_operation_failure(const std::exception& e,
                                                 std::string_view operation_name) {
    if (is_transient(classify(e))) {
        utils::log::error(std::format("Store operation '{}' failed: {}", operation_name, e.what()));
        breaker_.record_failure(e.what());
        metrics_.record_failure();
        return;
    }
    utils::log::error(std::format("Unexpected error in store operation '{}': {}", operation_name, e.what()));
    breaker_.record_failure(e.what(), FailureCategory::APPLICATION);
}

HealthStatus ConnectionManager::health_check() {
    health_check_count_.fetch_add(1, std::memory_order_relaxed);

    HealthStatus status;
    status.timestamp = utils::now();

    std::shared_ptr<ClientHandle> handle;
    {
        std::lock_guard lock(mutex_);
        handle = handle_;
        last_health_check_ = status.timestamp;
    }
    metrics_.mark_checked();

    status.pool_created = handle != nullptr;
    status.client_created = handle != nullptr;

    if (handle) {
        // Probe outside the lock: bounded by the socket timeout
        try {
            status.ping_successful = handle->ping();
            if (status.ping_successful) {
                breaker_.record_success();
                metrics_.record_success();
            } else {
                status.ping_error = "PING was not answered";
                breaker_.record_failure(*status.ping_error);
                metrics_.record_failure();
            }
        } catch (const StoreError& e) {
            utils::log::error(std::format("Health check ping failed: {}", e.what()));
            status.ping_error = e.what();
            breaker_.record_failure(e.what(), is_transient(e.category())
                ? FailureCategory::INFRASTRUCTURE
                : FailureCategory::APPLICATION);
            metrics_.record_failure();
        }
        status.is_healthy = status.ping_successful;

        std::lock_guard lock(mutex_);
        if (handle_ == handle) {
            healthy_ = status.is_healthy;
        }
    } else {
        status.ping_error = "Store client not initialized";
    }

    const auto cb = breaker_.get_stats();
    status.circuit_state = cb.state;
    status.failure_count = cb.failure_count;
    status.last_failure = cb.last_failure;
    return status;
}

StoreStatistics ConnectionManager::get_statistics() const {
    StoreStatistics stats;

    const auto cb = breaker_.get_stats();
    stats.total_requests = total_requests_.load(std::memory_order_relaxed);
    stats.successful_requests = cb.successful_requests;
    stats.failed_requests = cb.failed_requests;
    stats.circuit_opens = cb.circuit_opens;
    stats.circuit_closes = cb.circuit_closes;
    stats.fallback_activations = fallback_activations_.load(std::memory_order_relaxed);
    stats.health_check_count = health_check_count_.load(std::memory_order_relaxed);
    stats.last_error = cb.last_error;
    stats.circuit_state = cb.state;
    stats.failure_count = cb.failure_count;
    stats.success_rate = success_rate_percent(stats.successful_requests, stats.total_requests);

    std::shared_ptr<ClientHandle> handle;
    {
        std::lock_guard lock(mutex_);
        handle = handle_;
        stats.is_healthy = healthy_;
        stats.last_health_check = last_health_check_;
    }
    if (handle && !handle->is_closed()) {
        stats.pool.initialized = true;
        stats.pool.stats = handle->pool_stats();
    }

    const auto retry = retry_.get_stats();
    stats.retry.max_attempts = retry_.max_attempts();
    stats.retry.total_retries = retry.attempts;
    stats.retry.successful_retries = retry.successes;
    stats.retry.retry_success_rate = retry.attempts > 0
        ? static_cast<double>(retry.successes) / static_cast<double>(retry.attempts) * 100.0
        : 0.0;

    const auto snap = metrics_.snapshot();
    auto& hm = stats.health_monitoring;
    hm.enabled = config_.enable_health_monitoring;
    hm.running = monitor_ && monitor_->is_running();
    hm.interval = config_.health_check_interval;
    hm.last_check = snap.last_check;
    hm.consecutive_failures = snap.consecutive_failures;
    hm.consecutive_successes = snap.consecutive_successes;
    hm.avg_response_time = snap.avg_response_time;
    hm.last_response_time = snap.last_response_time;
    if (monitor_) {
        hm.checks_performed = monitor_->checks_performed();
        hm.auto_recoveries = monitor_->auto_recoveries();
    }

    return stats;
}

void ConnectionManager::reset_circuit() {
    utils::log::info("Manually resetting circuit breaker");
    breaker_.reset();

    if (closed_.load(std::memory_order_acquire)) {
        return;
    }
    initialize_connection(true);
}

void ConnectionManager::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    if (monitor_) {
        monitor_->stop();
    }

    std::shared_ptr<ClientHandle> old;
    {
        std::lock_guard lock(mutex_);
        old = std::move(handle_);
        healthy_ = false;
    }
    if (old) {
        old->close();
        utils::log::info("Store connection pool closed");
    }
}

bool ConnectionManager::is_healthy() const {
    std::lock_guard lock(mutex_);
    return healthy_;
}

} // namespace kvguard
