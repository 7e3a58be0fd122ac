#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace kvguard;
using namespace std::chrono_literals;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    ::unsetenv("REDIS_URL");
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& s = result.config.store;
    CHECK(s.url == "redis://localhost:6379/0");
    CHECK(s.max_connections == 50);
    CHECK(s.connect_timeout == 5s);
    CHECK(s.socket_timeout == 5s);
    CHECK(s.failure_threshold == 5);
    CHECK(s.recovery_timeout == 60s);
    CHECK(s.max_retry_attempts == 3);
    CHECK(s.backoff.base_delay == 1s);
    CHECK(s.backoff.max_delay == 30s);
    CHECK(s.backoff.multiplier == 2.0);
    CHECK(s.backoff.jitter_enabled);
    CHECK(s.enable_health_monitoring);
    CHECK(s.health_check_interval == 30s);
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("ConfigLoader: all sections parsed", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
        [store]
        url = "rediss://:pw@cache:6380/1"
        max_connections = 8
        connect_timeout_seconds = 2
        socket_timeout_seconds = 0.5
        pool_idle_check_seconds = 10

        [circuit_breaker]
        failure_threshold = 3
        recovery_timeout_seconds = 15

        [retry]
        max_attempts = 4
        base_delay_seconds = 0.25
        max_delay_seconds = 5
        multiplier = 3.0
        jitter = false

        [health]
        enabled = false
        interval_seconds = 12
        join_timeout_seconds = 1

        [logging]
        level = "debug"
    )");
    REQUIRE(result.success);

    const auto& s = result.config.store;
    CHECK(s.url == "rediss://:pw@cache:6380/1");
    CHECK(s.max_connections == 8);
    CHECK(s.connect_timeout == 2s);
    CHECK(s.socket_timeout == 500ms);
    CHECK(s.pool_idle_check == 10s);
    CHECK(s.failure_threshold == 3);
    CHECK(s.recovery_timeout == 15s);
    CHECK(s.max_retry_attempts == 4);
    CHECK(s.backoff.base_delay == 250ms);
    CHECK(s.backoff.max_delay == 5s);
    CHECK(s.backoff.multiplier == 3.0);
    CHECK_FALSE(s.backoff.jitter_enabled);
    CHECK_FALSE(s.enable_health_monitoring);
    CHECK(s.health_check_interval == 12s);
    CHECK(s.monitor_join_timeout == 1s);
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigLoader: env var expansion", "[config][env]") {
    ::setenv("KVGUARD_TEST_URL", "redis://envhost:7000/4", 1);
    const auto result = ConfigLoader::load_from_string(R"(
        [store]
        url = "${KVGUARD_TEST_URL}"
    )");
    ::unsetenv("KVGUARD_TEST_URL");

    REQUIRE(result.success);
    CHECK(result.config.store.url == "redis://envhost:7000/4");
}

TEST_CASE("ConfigLoader: unset env var keeps the default URL", "[config][env]") {
    ::unsetenv("REDIS_URL");
    ::unsetenv("KVGUARD_UNSET_VAR");
    const auto result = ConfigLoader::load_from_string(R"(
        [store]
        url = "${KVGUARD_UNSET_VAR}"
    )");
    REQUIRE(result.success);
    CHECK(result.config.store.url == "redis://localhost:6379/0");
}

TEST_CASE("ConfigLoader: REDIS_URL supplies the default", "[config][env]") {
    ::setenv("REDIS_URL", "redis://fromenv:6390/0", 1);
    CHECK(ConfigLoader::defaults().store.url == "redis://fromenv:6390/0");
    const auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"warn\"\n");
    ::unsetenv("REDIS_URL");

    REQUIRE(result.success);
    CHECK(result.config.store.url == "redis://fromenv:6390/0");
}

TEST_CASE("ConfigLoader: validation collects every violation", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
        [store]
        url = "http://nope"
        max_connections = 0

        [circuit_breaker]
        failure_threshold = 0

        [retry]
        max_attempts = 0
        base_delay_seconds = 10
        max_delay_seconds = 1
        multiplier = 0.5

        [logging]
        level = "verbose"
    )");
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("store.url") != std::string::npos);
    CHECK(msg.find("store.max_connections") != std::string::npos);
    CHECK(msg.find("circuit_breaker.failure_threshold") != std::string::npos);
    CHECK(msg.find("retry.max_attempts") != std::string::npos);
    CHECK(msg.find("retry.max_delay_seconds") != std::string::npos);
    CHECK(msg.find("retry.multiplier") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: type errors reported", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
        [store]
        max_connections = "many"
        socket_timeout_seconds = -1

        [circuit_breaker]
        recovery_timeout_seconds = "soon"
    )");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("store.max_connections must be an integer") != std::string::npos);
    CHECK(result.error_message.find("store.socket_timeout_seconds must not be negative") != std::string::npos);
    CHECK(result.error_message.find("circuit_breaker.recovery_timeout_seconds must be a number") != std::string::npos);
}

TEST_CASE("ConfigLoader: disabled monitor allows zero interval", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
        [health]
        enabled = false
        interval_seconds = 0
    )");
    CHECK(result.success);

    const auto enabled = ConfigLoader::load_from_string(R"(
        [health]
        enabled = true
        interval_seconds = 0
    )");
    CHECK_FALSE(enabled.success);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    const auto result = ConfigLoader::load_from_string("[store\nurl = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from file", "[config][file]") {
    const auto path = std::filesystem::temp_directory_path() / "kvguard_test_config.toml";
    {
        std::ofstream out(path);
        out << "[store]\nurl = \"redis://filehost:6379/0\"\nmax_connections = 3\n";
    }
    const auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(result.success);
    CHECK(result.config.store.url == "redis://filehost:6379/0");
    CHECK(result.config.store.max_connections == 3);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/kvguard.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}
