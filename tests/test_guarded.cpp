#include <catch2/catch_test_macros.hpp>
#include "manager/guarded.hpp"
#include "mocks/mock_store.hpp"

using namespace kvguard;
using namespace kvguard::testing;
using namespace std::chrono_literals;

namespace {

StoreConfig guarded_config() {
    StoreConfig cfg;
    cfg.failure_threshold = 1;
    cfg.recovery_timeout = 60s;
    cfg.max_retry_attempts = 2;
    cfg.enable_health_monitoring = false;
    return cfg;
}

void no_sleep(std::chrono::milliseconds) {}

} // namespace

TEST_CASE("guarded: returns the operation result when the store is up", "[guarded]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionManager manager(guarded_config(), factory, no_sleep);

    const auto n = guarded(manager,
        [](StoreClient& c) { return c.rpush("history", "msg"); },
        [] { return int64_t{0}; }, "append_history");
    CHECK(n == 1);
}

TEST_CASE("guarded: falls back when the store is down", "[guarded]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionManager manager(guarded_config(), factory, no_sleep);
    factory->server().set_mode(MockStoreServer::Mode::REFUSE);

    int fallbacks = 0;
    const auto value = guarded(manager,
        [](StoreClient& c) { return c.get("session:1"); },
        [&] { ++fallbacks; return std::optional<std::string>("local"); });
    CHECK(value == "local");
    CHECK(fallbacks == 1);
    CHECK(manager.circuit_state() == CircuitState::OPEN);

    // Circuit now open: fallback straight away
    const auto again = guarded(manager,
        [](StoreClient& c) { return c.get("session:1"); },
        [&] { ++fallbacks; return std::optional<std::string>("local"); });
    CHECK(again == "local");
    CHECK(fallbacks == 2);
}

TEST_CASE("guarded: non-transient errors still propagate", "[guarded][errors]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionManager manager(guarded_config(), factory, no_sleep);

    CHECK_THROWS_AS(guarded(manager,
        [](StoreClient& c) { return c.command({"NOSUCHCOMMAND"}).integer; },
        [] { return int64_t{0}; }), ResponseError);
}

TEST_CASE("Guard: binds a fixed fallback value", "[guarded]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionManager manager(guarded_config(), factory, no_sleep);

    auto history_length = make_guard(manager, "history_length", int64_t{-1});
    CHECK(history_length.operation_name() == "history_length");

    CHECK(history_length([](StoreClient& c) { return c.llen("history"); }) == 0);
    CHECK(history_length([](StoreClient& c) { return c.rpush("history", "x"); }) == 1);

    factory->server().set_mode(MockStoreServer::Mode::REFUSE);
    CHECK(history_length([](StoreClient& c) { return c.llen("history"); }) == -1);
    CHECK(history_length([](StoreClient& c) { return c.llen("history"); }) == -1);
    CHECK(manager.get_statistics().fallback_activations == 2);
}
