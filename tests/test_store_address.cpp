#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "store/server_error.hpp"
#include "store/store_address.hpp"

using namespace kvguard;

TEST_CASE("StoreAddress: defaults", "[store][address]") {
    const auto a = StoreAddress::parse("redis://localhost");
    CHECK(a.host == "localhost");
    CHECK(a.port == 6379);
    CHECK(a.database == 0);
    CHECK(a.username.empty());
    CHECK(a.password.empty());
    CHECK_FALSE(a.use_tls);
}

TEST_CASE("StoreAddress: full URL", "[store][address]") {
    const auto a = StoreAddress::parse("rediss://app:p@ss@cache.example.com:6380/3");
    CHECK(a.use_tls);
    CHECK(a.username == "app");
    CHECK(a.password == "p@ss");
    CHECK(a.host == "cache.example.com");
    CHECK(a.port == 6380);
    CHECK(a.database == 3);
}

TEST_CASE("StoreAddress: password-only credentials", "[store][address]") {
    const auto a = StoreAddress::parse("redis://:hunter2@10.0.0.5:6379/0");
    CHECK(a.username.empty());
    CHECK(a.password == "hunter2");
    CHECK(a.host == "10.0.0.5");
}

TEST_CASE("StoreAddress: malformed URLs rejected", "[store][address]") {
    CHECK_THROWS_AS(StoreAddress::parse("http://localhost:6379"), ConfigurationError);
    CHECK_THROWS_AS(StoreAddress::parse("redis://"), ConfigurationError);
    CHECK_THROWS_AS(StoreAddress::parse("redis://localhost:0"), ConfigurationError);
    CHECK_THROWS_AS(StoreAddress::parse("redis://localhost:70000"), ConfigurationError);
    CHECK_THROWS_AS(StoreAddress::parse("redis://localhost:port"), ConfigurationError);
    CHECK_THROWS_AS(StoreAddress::parse("redis://localhost/abc"), ConfigurationError);
}

TEST_CASE("StoreAddress: redacted hides the password", "[store][address]") {
    const auto a = StoreAddress::parse("redis://app:topsecret@db:6379/1");
    const auto r = a.redacted();
    CHECK(r == "redis://app:***@db:6379/1");
    CHECK(r.find("topsecret") == std::string::npos);

    CHECK(StoreAddress::parse("rediss://db").redacted() == "rediss://db:6379/0");
}

TEST_CASE("ServerError: classification by leading code", "[store][errors]") {
    CHECK(classify_server_error("NOAUTH Authentication required.") == ErrorCategory::AUTHENTICATION_ERROR);
    CHECK(classify_server_error("WRONGPASS invalid username-password pair") == ErrorCategory::AUTHENTICATION_ERROR);
    CHECK(classify_server_error("-NOPERM this user has no permissions") == ErrorCategory::AUTHENTICATION_ERROR);
    CHECK(classify_server_error("LOADING Redis is loading the dataset in memory") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("BUSY Redis is busy running a script") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("tryagain") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("READONLY You can't write against a read only replica.") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("OOM command not allowed when used memory > 'maxmemory'.") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("MISCONF Redis is configured to save RDB snapshots") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("NOREPLICAS Not enough good replicas to write.") == ErrorCategory::BACKEND_ERROR);
    CHECK(classify_server_error("WRONGTYPE Operation against a key") == ErrorCategory::RESPONSE_ERROR);
    CHECK(classify_server_error("ERR unknown command") == ErrorCategory::RESPONSE_ERROR);
    CHECK(classify_server_error("") == ErrorCategory::RESPONSE_ERROR);
}

TEST_CASE("ServerError: throws the matching exception type", "[store][errors]") {
    CHECK_THROWS_AS(throw_server_error("NOAUTH"), AuthenticationError);
    CHECK_THROWS_AS(throw_server_error("ERR syntax error"), ResponseError);

    try {
        throw_server_error("MASTERDOWN Link with MASTER is down");
        FAIL("expected throw");
    } catch (const TransientStoreError& e) {
        CHECK(e.category() == ErrorCategory::BACKEND_ERROR);
        CHECK_FALSE(is_retryable(e.category()));
        CHECK(is_transient(e.category()));
    }
}

TEST_CASE("Error: classify maps foreign exceptions to INTERNAL_ERROR", "[errors]") {
    CHECK(classify(ConnectionError("x")) == ErrorCategory::CONNECTION_ERROR);
    CHECK(classify(TimeoutError("x")) == ErrorCategory::TIMEOUT_ERROR);
    CHECK(classify(std::runtime_error("x")) == ErrorCategory::INTERNAL_ERROR);
    CHECK_THROWS_AS(throw_store_error(ErrorCategory::INTERNAL_ERROR, "x"), std::runtime_error);
    CHECK_THROWS_AS(throw_store_error(ErrorCategory::TIMEOUT_ERROR, "x"), TimeoutError);
}
