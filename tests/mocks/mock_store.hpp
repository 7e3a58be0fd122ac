#pragma once

#include "core/error.hpp"
#include "store/iconnection_factory.hpp"
#include "store/istore_connection.hpp"
#include "store/server_error.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdint>
#include <deque>
#include <map>
#include <stdexcept>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kvguard::testing {

/**
 * @brief In-process stand-in for the store server, shared by all mock connections
 *
 * Mode applies to new connections (factory) and to commands on open ones:
 * - OK:        commands succeed against in-memory data
 * - REFUSE:    ConnectionError ("connection refused")
 * - TIMEOUT:   TimeoutError
 * - AUTH_FAIL: factory throws AuthenticationError; open connections keep working
 * - BROKEN:    factory throws std::runtime_error; open connections keep working
 */
class MockStoreServer {
public:
    enum class Mode { OK, REFUSE, TIMEOUT, AUTH_FAIL, BROKEN };

    void set_mode(Mode m) { mode_.store(m, std::memory_order_release); }
    [[nodiscard]] Mode mode() const { return mode_.load(std::memory_order_acquire); }

    /// Next n commands (PING included) throw an error of this category
    void fail_next(uint32_t n, ErrorCategory category = ErrorCategory::CONNECTION_ERROR) {
        std::lock_guard lock(mutex_);
        scripted_failures_ = n;
        scripted_category_ = category;
    }

    [[nodiscard]] uint64_t execute_count() const { return execute_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t ping_count() const { return ping_count_.load(std::memory_order_relaxed); }

    StoreReply handle(const std::vector<std::string>& args) {
        execute_count_.fetch_add(1, std::memory_order_relaxed);
        if (!args.empty() && args[0] == "PING") {
            ping_count_.fetch_add(1, std::memory_order_relaxed);
        }

        switch (mode()) {
            case Mode::REFUSE:  throw ConnectionError("Connection refused (mock)");
            case Mode::TIMEOUT: throw TimeoutError("Timed out reading from socket (mock)");
            default: break;
        }

        std::lock_guard lock(mutex_);
        if (scripted_failures_ > 0) {
            --scripted_failures_;
            throw_store_error(scripted_category_, "Scripted failure (mock)");
        }
        return dispatch(args);
    }

private:
    StoreReply dispatch(const std::vector<std::string>& args) {
        if (args.empty()) throw_server_error("ERR empty command");
        const auto& cmd = args[0];

        if (cmd == "PING") return StoreReply::status("PONG");

        if (cmd == "GET") {
            need(args, 2);
            if (lists_.count(args[1]) || hashes_.count(args[1])) wrong_type();
            const auto it = strings_.find(args[1]);
            return it == strings_.end() ? StoreReply::nil() : StoreReply::string(it->second);
        }
        if (cmd == "SET") {
            need(args, 3);
            strings_[args[1]] = args[2];
            return StoreReply::status("OK");
        }
        if (cmd == "DEL") {
            need(args, 2);
            const auto n = strings_.erase(args[1]) + lists_.erase(args[1]) + hashes_.erase(args[1]);
            return StoreReply::number(static_cast<int64_t>(n));
        }
        if (cmd == "EXISTS") {
            need(args, 2);
            return StoreReply::number(exists(args[1]) ? 1 : 0);
        }
        if (cmd == "EXPIRE") {
            need(args, 3);
            return StoreReply::number(exists(args[1]) ? 1 : 0);
        }
        if (cmd == "INCR" || cmd == "INCRBY") {
            need(args, cmd == "INCR" ? 2 : 3);
            const int64_t by = cmd == "INCR" ? 1 : to_int(args[2]);
            auto& slot = strings_[args[1]];
            const int64_t current = slot.empty() ? 0 : to_int(slot);
            slot = std::to_string(current + by);
            return StoreReply::number(current + by);
        }
        if (cmd == "LPUSH" || cmd == "RPUSH") {
            need(args, 3);
            if (strings_.count(args[1])) wrong_type();
            auto& list = lists_[args[1]];
            for (size_t i = 2; i < args.size(); ++i) {
                if (cmd == "LPUSH") list.push_front(args[i]); else list.push_back(args[i]);
            }
            return StoreReply::number(static_cast<int64_t>(list.size()));
        }
        if (cmd == "LRANGE") {
            need(args, 4);
            const auto it = lists_.find(args[1]);
            if (it == lists_.end()) return StoreReply::array({});
            const auto [lo, hi] = clamp_range(it->second.size(), to_int(args[2]), to_int(args[3]));
            std::vector<std::string> out;
            for (int64_t i = lo; i <= hi; ++i) out.push_back(it->second[static_cast<size_t>(i)]);
            return StoreReply::array(std::move(out));
        }
        if (cmd == "LTRIM") {
            need(args, 4);
            const auto it = lists_.find(args[1]);
            if (it != lists_.end()) {
                const auto [lo, hi] = clamp_range(it->second.size(), to_int(args[2]), to_int(args[3]));
                std::deque<std::string> kept;
                for (int64_t i = lo; i <= hi; ++i) kept.push_back(it->second[static_cast<size_t>(i)]);
                it->second = std::move(kept);
            }
            return StoreReply::status("OK");
        }
        if (cmd == "LLEN") {
            need(args, 2);
            const auto it = lists_.find(args[1]);
            return StoreReply::number(it == lists_.end() ? 0 : static_cast<int64_t>(it->second.size()));
        }
        if (cmd == "HSET") {
            need(args, 4);
            auto& hash = hashes_[args[1]];
            const bool added = hash.find(args[2]) == hash.end();
            hash[args[2]] = args[3];
            return StoreReply::number(added ? 1 : 0);
        }
        if (cmd == "HGET") {
            need(args, 3);
            const auto it = hashes_.find(args[1]);
            if (it == hashes_.end()) return StoreReply::nil();
            const auto field = it->second.find(args[2]);
            return field == it->second.end() ? StoreReply::nil() : StoreReply::string(field->second);
        }
        if (cmd == "HGETALL") {
            need(args, 2);
            std::vector<std::string> out;
            const auto it = hashes_.find(args[1]);
            if (it != hashes_.end()) {
                for (const auto& [f, v] : it->second) { out.push_back(f); out.push_back(v); }
            }
            return StoreReply::array(std::move(out));
        }

        throw_server_error("ERR unknown command '" + cmd + "'");
    }

    bool exists(const std::string& key) const {
        return strings_.count(key) || lists_.count(key) || hashes_.count(key);
    }

    static void need(const std::vector<std::string>& args, size_t n) {
        if (args.size() < n) {
            throw_server_error("ERR wrong number of arguments for '" + args[0] + "' command");
        }
    }

    [[noreturn]] static void wrong_type() {
        throw_server_error("WRONGTYPE Operation against a key holding the wrong kind of value");
    }

    static int64_t to_int(const std::string& s) {
        int64_t v = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            throw_server_error("ERR value is not an integer or out of range");
        }
        return v;
    }

    static std::pair<int64_t, int64_t> clamp_range(size_t size, int64_t start, int64_t stop) {
        const auto n = static_cast<int64_t>(size);
        if (start < 0) start += n;
        if (stop < 0) stop += n;
        start = std::max<int64_t>(start, 0);
        stop = std::min<int64_t>(stop, n - 1);
        if (start > stop) return {0, -1};
        return {start, stop};
    }

    std::atomic<Mode> mode_{Mode::OK};
    std::atomic<uint64_t> execute_count_{0};
    std::atomic<uint64_t> ping_count_{0};

    std::mutex mutex_;
    uint32_t scripted_failures_ = 0;
    ErrorCategory scripted_category_ = ErrorCategory::CONNECTION_ERROR;
    std::unordered_map<std::string, std::string> strings_;
    std::unordered_map<std::string, std::deque<std::string>> lists_;
    std::unordered_map<std::string, std::map<std::string, std::string>> hashes_;
};

/**
 * @brief Mock store connection backed by a MockStoreServer
 */
class MockConnection : public IStoreConnection {
public:
    explicit MockConnection(std::shared_ptr<MockStoreServer> server)
        : server_(std::move(server)) {}

    [[nodiscard]] StoreReply execute(const std::vector<std::string>& args) override {
        if (!connected_) throw ConnectionError("Connection closed (mock)");
        return server_->handle(args);
    }

    [[nodiscard]] bool ping() override {
        const auto reply = execute({"PING"});
        return reply.type == StoreReply::Type::STATUS && reply.str == "PONG";
    }

    [[nodiscard]] bool is_connected() const override { return connected_; }
    void close() override { connected_ = false; }

private:
    std::shared_ptr<MockStoreServer> server_;
    bool connected_ = true;
};

/**
 * @brief Mock connection factory; counts create() calls
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    MockConnectionFactory() : server_(std::make_shared<MockStoreServer>()) {}

    [[nodiscard]] std::unique_ptr<IStoreConnection> create(const ConnectionOptions& options) override {
        create_count_.fetch_add(1, std::memory_order_relaxed);
        last_options_ = options;
        switch (server_->mode()) {
            case MockStoreServer::Mode::REFUSE:
                throw ConnectionError("Error connecting to " + options.address.redacted() + ": refused (mock)");
            case MockStoreServer::Mode::TIMEOUT:
                throw TimeoutError("Timed out connecting to " + options.address.redacted() + " (mock)");
            case MockStoreServer::Mode::AUTH_FAIL:
                throw AuthenticationError("WRONGPASS invalid username-password pair (mock)");
            case MockStoreServer::Mode::BROKEN:
                throw std::runtime_error("pool construction failed (mock)");
            case MockStoreServer::Mode::OK:
                break;
        }
        return std::make_unique<MockConnection>(server_);
    }

    [[nodiscard]] MockStoreServer& server() { return *server_; }
    [[nodiscard]] uint64_t create_count() const { return create_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] const ConnectionOptions& last_options() const { return last_options_; }

    /// Every store round trip: connects plus commands
    [[nodiscard]] uint64_t io_count() const { return create_count() + server_->execute_count(); }

private:
    std::shared_ptr<MockStoreServer> server_;
    std::atomic<uint64_t> create_count_{0};
    ConnectionOptions last_options_;
};

} // namespace kvguard::testing
