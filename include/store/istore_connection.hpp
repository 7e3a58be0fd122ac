#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kvguard {

/**
 * @brief Decoded reply from the backing store
 *
 * Returned by IStoreConnection::execute(). Owns its data.
 */
struct StoreReply {
    enum class Type { NIL, STATUS, STRING, INTEGER, ARRAY };

    Type type = Type::NIL;
    std::string str;                   // STATUS / STRING
    int64_t integer = 0;               // INTEGER
    std::vector<std::string> elements; // ARRAY (flattened, nested aggregates not expanded)

    [[nodiscard]] bool is_nil() const { return type == Type::NIL; }

    static StoreReply nil() { return {}; }

    static StoreReply status(std::string s) {
        StoreReply r;
        r.type = Type::STATUS;
        r.str = std::move(s);
        return r;
    }

    static StoreReply string(std::string s) {
        StoreReply r;
        r.type = Type::STRING;
        r.str = std::move(s);
        return r;
    }

    static StoreReply number(int64_t n) {
        StoreReply r;
        r.type = Type::INTEGER;
        r.integer = n;
        return r;
    }

    static StoreReply array(std::vector<std::string> items) {
        StoreReply r;
        r.type = Type::ARRAY;
        r.elements = std::move(items);
        return r;
    }
};

/**
 * @brief Abstract backing store connection
 *
 * Wraps a single native client connection.
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * execute() and ping() raise the StoreError hierarchy (core/error.hpp):
 * ConnectionError / TimeoutError for I/O trouble, AuthenticationError and
 * ResponseError when the server rejects the command.
 */
class IStoreConnection {
public:
    virtual ~IStoreConnection() = default;

    /**
     * @brief Execute one command
     * @param args Command name followed by arguments (e.g. {"SET", "k", "v"})
     */
    [[nodiscard]] virtual StoreReply execute(const std::vector<std::string>& args) = 0;

    /**
     * @brief Liveness probe (PING)
     * @return true if the server answered PONG
     */
    [[nodiscard]] virtual bool ping() = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace kvguard
