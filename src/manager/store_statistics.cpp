#include "manager/store_statistics.hpp"
#include "core/utils.hpp"
#include <format>

namespace kvguard {

namespace {

std::string optional_seconds(const std::optional<std::chrono::microseconds>& us) {
    if (!us) return "null";
    return std::format("{:.6f}", utils::to_seconds(*us));
}

} // namespace

std::string HealthStatus::to_json() const {
    std::string json = std::format(
        R"({{"is_healthy":{},"circuit_state":"{}","failure_count":{},"last_failure_time":{},)"
        R"("connection_pool_created":{},"client_created":{},"ping_successful":{},"timestamp":{})",
        utils::booltostr(is_healthy), circuit_state_to_string(circuit_state), failure_count,
        utils::timestamp_or_null(last_failure), utils::booltostr(pool_created),
        utils::booltostr(client_created), utils::booltostr(ping_successful),
        utils::timestamp_or_null(timestamp));
    if (ping_error) {
        json += std::format(R"(,"ping_error":"{}")", utils::escape_json(*ping_error));
    }
    json += "}";
    return json;
}

std::string StoreStatistics::to_json() const {
    std::string pool_json;
    if (pool.initialized) {
        pool_json = std::format(
            R"({{"max_connections":{},"created_connections":{},"available_connections":{},)"
            R"("in_use_connections":{},"total_acquires":{},"failed_acquires":{},"health_check_failures":{}}})",
            pool.stats.max_connections, pool.stats.total_connections, pool.stats.idle_connections,
            pool.stats.active_connections, pool.stats.total_acquires, pool.stats.failed_acquires,
            pool.stats.health_check_failures);
    } else {
        pool_json = R"({"status":"not_initialized"})";
    }

    const std::string health_json = std::format(
        R"({{"enabled":{},"thread_alive":{},"interval":{:.3f},"last_check":{},"consecutive_failures":{},)"
        R"("consecutive_successes":{},"avg_response_time":{},"last_response_time":{},)"
        R"("checks_performed":{},"auto_recoveries":{}}})",
        utils::booltostr(health_monitoring.enabled), utils::booltostr(health_monitoring.running),
        utils::to_seconds(health_monitoring.interval), utils::timestamp_or_null(health_monitoring.last_check),
        health_monitoring.consecutive_failures, health_monitoring.consecutive_successes,
        optional_seconds(health_monitoring.avg_response_time),
        optional_seconds(health_monitoring.last_response_time),
        health_monitoring.checks_performed, health_monitoring.auto_recoveries);

    const std::string retry_json = std::format(
        R"({{"max_attempts":{},"total_retries":{},"successful_retries":{},"retry_success_rate":{:.2f}}})",
        retry.max_attempts, retry.total_retries, retry.successful_retries, retry.retry_success_rate);

    return std::format(
        R"({{"total_requests":{},"successful_requests":{},"failed_requests":{},"circuit_opens":{},)"
        R"("circuit_closes":{},"fallback_activations":{},"retry_attempts":{},"retry_successes":{},)"
        R"("health_check_count":{},"last_error":{},"last_health_check":{},"circuit_state":"{}",)"
        R"("failure_count":{},"is_healthy":{},"success_rate":{:.2f},"pool_info":{},)"
        R"("health_monitoring":{},"retry_stats":{}}})",
        total_requests, successful_requests, failed_requests, circuit_opens,
        circuit_closes, fallback_activations, retry.total_retries, retry.successful_retries,
        health_check_count,
        last_error.empty() ? std::string("null") : std::format("\"{}\"", utils::escape_json(last_error)),
        utils::timestamp_or_null(last_health_check), circuit_state_to_string(circuit_state),
        failure_count, utils::booltostr(is_healthy), success_rate, pool_json,
        health_json, retry_json);
}

} // namespace kvguard
