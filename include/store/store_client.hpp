#pragma once

#include "store/connection_pool.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kvguard {

/**
 * @brief Thread-safe command façade over the connection pool
 *
 * Every call checks a connection out, runs one command and returns it.
 * A connection that failed with ConnectionError/TimeoutError is discarded
 * instead of being returned for reuse.
 *
 * Throws TimeoutError when no connection frees up within acquire_timeout,
 * ResponseError when a reply has an unexpected type.
 */
class StoreClient {
public:
    StoreClient(std::shared_ptr<ConnectionPool> pool, std::chrono::milliseconds acquire_timeout);

    [[nodiscard]] bool ping();

    // Strings
    [[nodiscard]] std::optional<std::string> get(const std::string& key);
    bool set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt);
    int64_t del(const std::string& key);
    [[nodiscard]] bool exists(const std::string& key);
    bool expire(const std::string& key, std::chrono::seconds ttl);
    int64_t incr(const std::string& key);
    int64_t incrby(const std::string& key, int64_t amount);

    // Lists
    int64_t lpush(const std::string& key, const std::string& value);
    int64_t rpush(const std::string& key, const std::string& value);
    [[nodiscard]] std::vector<std::string> lrange(const std::string& key, int64_t start, int64_t stop);
    void ltrim(const std::string& key, int64_t start, int64_t stop);
    [[nodiscard]] int64_t llen(const std::string& key);

    // Hashes
    int64_t hset(const std::string& key, const std::string& field, const std::string& value);
    [[nodiscard]] std::optional<std::string> hget(const std::string& key, const std::string& field);
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> hgetall(const std::string& key);

    /**
     * @brief Run an arbitrary command
     * @param args Command name followed by arguments
     */
    StoreReply command(const std::vector<std::string>& args);

    [[nodiscard]] PoolStats pool_stats() const { return pool_->get_stats(); }

private:
    std::unique_ptr<PooledConnection> checkout();
    static int64_t expect_integer(const StoreReply& reply, const char* cmd);
    static bool expect_ok(const StoreReply& reply, const char* cmd);

    std::shared_ptr<ConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace kvguard
