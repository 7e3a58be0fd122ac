#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace kvguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads kvguard.toml
 *
 * Layout:
 *   [store]            url, max_connections, connect_timeout_seconds,
 *                      socket_timeout_seconds, pool_idle_check_seconds
 *   [circuit_breaker]  failure_threshold, recovery_timeout_seconds
 *   [retry]            max_attempts, base_delay_seconds, max_delay_seconds,
 *                      multiplier, jitter
 *   [health]           enabled, interval_seconds, join_timeout_seconds
 *   [logging]          level
 *
 * Durations are seconds (integer or float). String values expand ${VAR}.
 * A missing [store] url falls back to $REDIS_URL, then redis://localhost:6379/0.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        KvGuardConfig config;

        static LoadResult ok(KvGuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to kvguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Defaults plus environment (REDIS_URL), used when no file is given
     */
    [[nodiscard]] static KvGuardConfig defaults();

    /**
     * @brief Check semantic constraints
     * @return One message per violation (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const KvGuardConfig& config);

private:
    static KvGuardConfig extract_all_sections(const toml::table& root, std::vector<std::string>& errors);
    static void extract_store(const toml::table& root, StoreConfig& cfg, std::vector<std::string>& errors);
    static void extract_circuit_breaker(const toml::table& root, StoreConfig& cfg, std::vector<std::string>& errors);
    static void extract_retry(const toml::table& root, StoreConfig& cfg, std::vector<std::string>& errors);
    static void extract_health(const toml::table& root, StoreConfig& cfg, std::vector<std::string>& errors);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(KvGuardConfig config, std::vector<std::string> errors);
};

} // namespace kvguard
