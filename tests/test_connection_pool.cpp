#include <catch2/catch_test_macros.hpp>
#include "store/connection_pool.hpp"
#include "mocks/mock_store.hpp"

#include <thread>

using namespace kvguard;
using namespace kvguard::testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<ConnectionPool> make_pool(std::shared_ptr<MockConnectionFactory> factory,
                                          size_t max_connections = 4,
                                          std::chrono::milliseconds idle_check = 30s) {
    PoolConfig cfg;
    cfg.connection.address = StoreAddress::parse("redis://localhost:6379/0");
    cfg.max_connections = max_connections;
    cfg.idle_check = idle_check;
    return std::make_shared<ConnectionPool>(cfg, std::move(factory));
}

} // namespace

TEST_CASE("ConnectionPool: rejects invalid construction", "[pool]") {
    PoolConfig cfg;
    CHECK_THROWS_AS(std::make_shared<ConnectionPool>(cfg, nullptr), ConfigurationError);

    cfg.max_connections = 0;
    CHECK_THROWS_AS(std::make_shared<ConnectionPool>(cfg, std::make_shared<MockConnectionFactory>()),
                    ConfigurationError);
}

TEST_CASE("ConnectionPool: connections are created lazily and reused", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory);
    CHECK(factory->create_count() == 0);

    {
        auto conn = pool->acquire(100ms);
        REQUIRE(conn != nullptr);
        CHECK(conn->is_valid());
        CHECK(pool->get_stats().active_connections == 1);
    }
    {
        auto conn = pool->acquire(100ms);
        REQUIRE(conn != nullptr);
    }

    CHECK(factory->create_count() == 1);
    const auto stats = pool->get_stats();
    CHECK(stats.total_connections == 1);
    CHECK(stats.idle_connections == 1);
    CHECK(stats.active_connections == 0);
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
}

TEST_CASE("ConnectionPool: bounded by max_connections", "[pool][bounds]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory, 2);

    auto a = pool->acquire(100ms);
    auto b = pool->acquire(100ms);
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);

    auto c = pool->acquire(20ms);
    CHECK(c == nullptr);
    CHECK(pool->get_stats().failed_acquires == 1);
    CHECK(factory->create_count() == 2);
}

TEST_CASE("ConnectionPool: waiter gets a connection when one is released", "[pool][bounds]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory, 1);

    auto held = pool->acquire(100ms);
    REQUIRE(held != nullptr);

    std::thread releaser([&] {
        std::this_thread::sleep_for(20ms);
        held.reset();
    });
    auto waited = pool->acquire(2s);
    releaser.join();

    CHECK(waited != nullptr);
    CHECK(factory->create_count() == 1);
}

TEST_CASE("ConnectionPool: discarded connection is not reused", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory);

    {
        auto conn = pool->acquire(100ms);
        REQUIRE(conn != nullptr);
        conn->discard();
    }
    CHECK(pool->get_stats().total_connections == 0);
    CHECK(pool->get_stats().idle_connections == 0);

    auto again = pool->acquire(100ms);
    REQUIRE(again != nullptr);
    CHECK(factory->create_count() == 2);
}

TEST_CASE("ConnectionPool: factory failure releases the slot", "[pool][errors]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory, 1);

    factory->server().set_mode(MockStoreServer::Mode::REFUSE);
    CHECK_THROWS_AS(pool->acquire(100ms), ConnectionError);
    CHECK(pool->get_stats().failed_acquires == 1);

    factory->server().set_mode(MockStoreServer::Mode::OK);
    auto conn = pool->acquire(100ms);
    CHECK(conn != nullptr);
}

TEST_CASE("ConnectionPool: auth failure propagates unchanged", "[pool][errors]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory);

    factory->server().set_mode(MockStoreServer::Mode::AUTH_FAIL);
    CHECK_THROWS_AS(pool->acquire(100ms), AuthenticationError);
}

TEST_CASE("ConnectionPool: stale idle connection pinged and replaced", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory, 2, 1ms);

    { auto conn = pool->acquire(100ms); }
    std::this_thread::sleep_for(10ms);

    // Ping on reuse fails: connection dropped, a fresh one is opened
    factory->server().fail_next(1);
    auto conn = pool->acquire(100ms);
    REQUIRE(conn != nullptr);
    CHECK(factory->create_count() == 2);
    CHECK(pool->get_stats().health_check_failures == 1);
    CHECK(factory->server().ping_count() == 1);
}

TEST_CASE("ConnectionPool: fresh idle connection skips the ping", "[pool][health]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory, 2, 30s);

    { auto conn = pool->acquire(100ms); }
    { auto conn = pool->acquire(100ms); }
    CHECK(factory->server().ping_count() == 0);
}

TEST_CASE("ConnectionPool: drain refuses acquires and is idempotent", "[pool][shutdown]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory);

    auto outstanding = pool->acquire(100ms);
    { auto idle = pool->acquire(100ms); }
    REQUIRE(pool->get_stats().idle_connections == 1);

    pool->drain();
    pool->drain();
    CHECK(pool->is_drained());
    CHECK(pool->acquire(100ms) == nullptr);
    CHECK(pool->get_stats().idle_connections == 0);

    // Returned after drain: closed instead of pooled
    outstanding.reset();
    CHECK(pool->get_stats().total_connections == 0);
}

TEST_CASE("ConnectionPool: outstanding handle keeps pool alive", "[pool][lifetime]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto pool = make_pool(factory);
    auto conn = pool->acquire(100ms);
    REQUIRE(conn != nullptr);

    pool.reset();
    CHECK((*conn)->execute({"PING"}).str == "PONG");
    conn.reset();
}
