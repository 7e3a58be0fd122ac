#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "store/store_address.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace kvguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::string default_store_url() {
    const char* env_url = std::getenv("REDIS_URL");
    if (env_url && *env_url) return env_url;
    return kDefaultStoreUrl;
}

// ---- Extraction helpers ----------------------------------------------------

/**
 * @brief Read a positive-or-zero integer; negative or non-integer values are reported
 */
template<typename T>
void read_count(const toml::table& tbl, std::string_view section, std::string_view key,
                T& out, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;
    const auto v = node.value<int64_t>();
    if (!node.is_integer() || !v) {
        errors.push_back(std::format("{}.{} must be an integer", section, key));
        return;
    }
    if (*v < 0 || static_cast<uint64_t>(*v) > std::numeric_limits<T>::max()) {
        errors.push_back(std::format("{}.{} out of range, got {}", section, key, *v));
        return;
    }
    out = static_cast<T>(*v);
}

/**
 * @brief Read a duration in seconds (integer or float)
 */
void read_seconds(const toml::table& tbl, std::string_view section, std::string_view key,
                  std::chrono::milliseconds& out, std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return;

    std::optional<double> seconds;
    if (const auto* i = node.as_integer()) {
        seconds = static_cast<double>(i->get());
    } else if (const auto* f = node.as_floating_point()) {
        seconds = f->get();
    }
    if (!seconds) {
        errors.push_back(std::format("{}.{} must be a number of seconds", section, key));
        return;
    }
    if (*seconds < 0) {
        errors.push_back(std::format("{}.{} must not be negative, got {}", section, key, *seconds));
        return;
    }
    out = utils::from_seconds(*seconds);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

void ConfigLoader::extract_store(const toml::table& root, StoreConfig& cfg,
                                 std::vector<std::string>& errors) {
    const auto* store = root["store"].as_table();
    if (!store) return;
    const auto& s = *store;

    // An unset ${VAR} expands to "", which keeps the default
    if (const auto* url = s["url"].as_string(); url && !url->get().empty()) {
        cfg.url = url->get();
    }
    read_count(s, "store", "max_connections", cfg.max_connections, errors);
    read_seconds(s, "store", "connect_timeout_seconds", cfg.connect_timeout, errors);
    read_seconds(s, "store", "socket_timeout_seconds", cfg.socket_timeout, errors);
    read_seconds(s, "store", "pool_idle_check_seconds", cfg.pool_idle_check, errors);
}

void ConfigLoader::extract_circuit_breaker(const toml::table& root, StoreConfig& cfg,
                                           std::vector<std::string>& errors) {
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return;

    read_count(*cb, "circuit_breaker", "failure_threshold", cfg.failure_threshold, errors);
    read_seconds(*cb, "circuit_breaker", "recovery_timeout_seconds", cfg.recovery_timeout, errors);
}

void ConfigLoader::extract_retry(const toml::table& root, StoreConfig& cfg,
                                 std::vector<std::string>& errors) {
    const auto* retry = root["retry"].as_table();
    if (!retry) return;
    const auto& r = *retry;

    read_count(r, "retry", "max_attempts", cfg.max_retry_attempts, errors);
    read_seconds(r, "retry", "base_delay_seconds", cfg.backoff.base_delay, errors);
    read_seconds(r, "retry", "max_delay_seconds", cfg.backoff.max_delay, errors);
    cfg.backoff.multiplier = r["multiplier"].value_or(cfg.backoff.multiplier);
    cfg.backoff.jitter_enabled = r["jitter"].value_or(cfg.backoff.jitter_enabled);
}

void ConfigLoader::extract_health(const toml::table& root, StoreConfig& cfg,
                                  std::vector<std::string>& errors) {
    const auto* health = root["health"].as_table();
    if (!health) return;
    const auto& h = *health;

    cfg.enable_health_monitoring = h["enabled"].value_or(cfg.enable_health_monitoring);
    read_seconds(h, "health", "interval_seconds", cfg.health_check_interval, errors);
    read_seconds(h, "health", "join_timeout_seconds", cfg.monitor_join_timeout, errors);
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

KvGuardConfig ConfigLoader::extract_all_sections(const toml::table& tbl,
                                                 std::vector<std::string>& errors) {
    KvGuardConfig config = defaults();
    extract_store(tbl, config.store, errors);
    extract_circuit_breaker(tbl, config.store, errors);
    extract_retry(tbl, config.store, errors);
    extract_health(tbl, config.store, errors);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(KvGuardConfig config,
                                                           std::vector<std::string> errors) {
    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

KvGuardConfig ConfigLoader::defaults() {
    KvGuardConfig config;
    config.store.url = default_store_url();
    return config;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const KvGuardConfig& config) {
    std::vector<std::string> errors;
    const auto& s = config.store;

    try {
        (void)StoreAddress::parse(s.url);
    } catch (const ConfigurationError& e) {
        errors.push_back(std::format("store.url: {}", e.what()));
    }

    if (s.max_connections == 0) {
        errors.push_back("store.max_connections must be at least 1");
    }
    if (s.connect_timeout.count() <= 0) {
        errors.push_back("store.connect_timeout_seconds must be positive");
    }
    if (s.socket_timeout.count() <= 0) {
        errors.push_back("store.socket_timeout_seconds must be positive");
    }
    if (s.failure_threshold == 0) {
        errors.push_back("circuit_breaker.failure_threshold must be at least 1");
    }
    if (s.recovery_timeout.count() <= 0) {
        errors.push_back("circuit_breaker.recovery_timeout_seconds must be positive");
    }
    if (s.max_retry_attempts == 0) {
        errors.push_back("retry.max_attempts must be at least 1");
    }
    if (s.backoff.base_delay.count() <= 0) {
        errors.push_back("retry.base_delay_seconds must be positive");
    }
    if (s.backoff.max_delay < s.backoff.base_delay) {
        errors.push_back(std::format(
            "retry.max_delay_seconds ({}) must be >= base_delay_seconds ({})",
            utils::to_seconds(s.backoff.max_delay), utils::to_seconds(s.backoff.base_delay)));
    }
    if (s.backoff.multiplier < 1.0) {
        errors.push_back(std::format("retry.multiplier must be >= 1.0, got {}", s.backoff.multiplier));
    }
    if (s.enable_health_monitoring && s.health_check_interval.count() <= 0) {
        errors.push_back("health.interval_seconds must be positive");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace kvguard
