#include "store/store_client.hpp"
#include "core/error.hpp"
#include <format>

namespace kvguard {

StoreClient::StoreClient(std::shared_ptr<ConnectionPool> pool, std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

std::unique_ptr<PooledConnection> StoreClient::checkout() {
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        if (pool_->is_drained()) {
            throw ConnectionError("Connection pool is closed");
        }
        throw TimeoutError(std::format("Timed out after {}ms waiting for a pooled connection",
            acquire_timeout_.count()));
    }
    return conn;
}

StoreReply StoreClient::command(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw ResponseError("Empty command");
    }

    auto conn = checkout();
    try {
        return (*conn)->execute(args);
    } catch (const ConnectionError&) {
        conn->discard();
        throw;
    } catch (const TimeoutError&) {
        // Reply may still arrive on this socket; never reuse it
        conn->discard();
        throw;
    }
}

bool StoreClient::ping() {
    auto conn = checkout();
    try {
        return (*conn)->ping();
    } catch (const TransientStoreError&) {
        conn->discard();
        throw;
    }
}

int64_t StoreClient::expect_integer(const StoreReply& reply, const char* cmd) {
    if (reply.type != StoreReply::Type::INTEGER) {
        throw ResponseError(std::format("{}: expected integer reply", cmd));
    }
    return reply.integer;
}

bool StoreClient::expect_ok(const StoreReply& reply, const char* cmd) {
    if (reply.is_nil()) return false;  // SET NX/XX not applied
    if (reply.type != StoreReply::Type::STATUS) {
        throw ResponseError(std::format("{}: expected status reply", cmd));
    }
    return reply.str == "OK";
}

std::optional<std::string> StoreClient::get(const std::string& key) {
    auto reply = command({"GET", key});
    if (reply.is_nil()) return std::nullopt;
    return std::move(reply.str);
}

bool StoreClient::set(const std::string& key, const std::string& value,
                      std::optional<std::chrono::seconds> ttl) {
    if (ttl) {
        if (ttl->count() <= 0) {
            throw ResponseError(std::format("SET: invalid expire time {}", ttl->count()));
        }
        return expect_ok(command({"SET", key, value, "EX", std::to_string(ttl->count())}), "SET");
    }
    return expect_ok(command({"SET", key, value}), "SET");
}

int64_t StoreClient::del(const std::string& key) {
    return expect_integer(command({"DEL", key}), "DEL");
}

bool StoreClient::exists(const std::string& key) {
    return expect_integer(command({"EXISTS", key}), "EXISTS") > 0;
}

bool StoreClient::expire(const std::string& key, std::chrono::seconds ttl) {
    return expect_integer(command({"EXPIRE", key, std::to_string(ttl.count())}), "EXPIRE") == 1;
}

int64_t StoreClient::incr(const std::string& key) {
    return expect_integer(command({"INCR", key}), "INCR");
}

int64_t StoreClient::incrby(const std::string& key, int64_t amount) {
    return expect_integer(command({"INCRBY", key, std::to_string(amount)}), "INCRBY");
}

int64_t StoreClient::lpush(const std::string& key, const std::string& value) {
    return expect_integer(command({"LPUSH", key, value}), "LPUSH");
}

int64_t StoreClient::rpush(const std::string& key, const std::string& value) {
    return expect_integer(command({"RPUSH", key, value}), "RPUSH");
}

std::vector<std::string> StoreClient::lrange(const std::string& key, int64_t start, int64_t stop) {
    auto reply = command({"LRANGE", key, std::to_string(start), std::to_string(stop)});
    if (reply.is_nil()) return {};
    if (reply.type != StoreReply::Type::ARRAY) {
        throw ResponseError("LRANGE: expected array reply");
    }
    return std::move(reply.elements);
}

void StoreClient::ltrim(const std::string& key, int64_t start, int64_t stop) {
    expect_ok(command({"LTRIM", key, std::to_string(start), std::to_string(stop)}), "LTRIM");
}

int64_t StoreClient::llen(const std::string& key) {
    return expect_integer(command({"LLEN", key}), "LLEN");
}

int64_t StoreClient::hset(const std::string& key, const std::string& field, const std::string& value) {
    return expect_integer(command({"HSET", key, field, value}), "HSET");
}

std::optional<std::string> StoreClient::hget(const std::string& key, const std::string& field) {
    auto reply = command({"HGET", key, field});
    if (reply.is_nil()) return std::nullopt;
    return std::move(reply.str);
}

std::vector<std::pair<std::string, std::string>> StoreClient::hgetall(const std::string& key) {
    auto reply = command({"HGETALL", key});
    if (reply.is_nil()) return {};
    if (reply.type != StoreReply::Type::ARRAY || reply.elements.size() % 2 != 0) {
        throw ResponseError("HGETALL: expected field/value array reply");
    }
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(reply.elements.size() / 2);
    for (size_t i = 0; i + 1 < reply.elements.size(); i += 2) {
        out.emplace_back(std::move(reply.elements[i]), std::move(reply.elements[i + 1]));
    }
    return out;
}

} // namespace kvguard
