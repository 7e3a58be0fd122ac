#define BOOST_REDIS_SEPARATE_COMPILATION
#include "store/redis/redis_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "store/server_error.hpp"

#include <boost/redis/src.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/error.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <format>
#include <future>
#include <optional>
#include <thread>

namespace kvguard {

namespace asio = boost::asio;
namespace redis = boost::redis;

namespace {

using redis::resp3::type;

/// One request in flight; shared with the io thread so a timed-out caller can leave early
struct PendingCall {
    redis::request req;
    redis::generic_response resp;
    std::promise<boost::system::error_code> done;
};

StoreReply decode(const std::vector<redis::resp3::node>& nodes) {
    if (nodes.empty()) {
        return StoreReply::nil();
    }

    const auto& head = nodes.front();
    switch (head.data_type) {
        case type::null:
            return StoreReply::nil();
        case type::simple_string:
            return StoreReply::status(head.value);
        case type::blob_string:
        case type::verbatim_string:
        case type::big_number:
        case type::doublean:
            return StoreReply::string(head.value);
        case type::number: {
            const auto n = utils::try_parse_int<int64_t>(head.value);
            if (!n) {
                throw ResponseError(std::format("Malformed integer reply '{}'", head.value));
            }
            return StoreReply::number(*n);
        }
        case type::boolean:
            return StoreReply::number(head.value == "t" ? 1 : 0);
        case type::array:
        case type::set:
        case type::map:
        case type::push: {
            std::vector<std::string> items;
            items.reserve(head.aggregate_size);
            for (size_t i = 1; i < nodes.size(); ++i) {
                // Nested aggregates show up as their (empty) header only
                if (nodes[i].depth == 1) {
                    items.push_back(nodes[i].value);
                }
            }
            return StoreReply::array(std::move(items));
        }
        default:
            throw ResponseError("Unsupported reply type");
    }
}

[[noreturn]] void raise_for(const boost::system::error_code& ec, const std::string& where) {
    if (ec == redis::error::resp3_hello) {
        throw AuthenticationError(std::format("{}: handshake rejected, check credentials", where));
    }
    if (ec == redis::error::connect_timeout || ec == redis::error::resolve_timeout ||
        ec == redis::error::pong_timeout || ec == redis::error::ssl_handshake_timeout ||
        ec == asio::error::timed_out) {
        throw TimeoutError(std::format("{}: {}", where, ec.message()));
    }
    if (ec == redis::error::resp3_simple_error || ec == redis::error::resp3_blob_error) {
        throw ResponseError(std::format("{}: {}", where, ec.message()));
    }
    // Refused, reset, EOF, not connected, cancelled because the connection dropped
    throw ConnectionError(std::format("{}: {}", where, ec.message()));
}

} // namespace

struct RedisConnection::Impl {
    ConnectionOptions options;
    asio::io_context ioc;
    redis::connection conn;
    std::thread io_thread;
    std::atomic<bool> running{false};
    std::atomic<bool> closed{false};
    std::promise<boost::system::error_code> run_promise;
    std::shared_future<boost::system::error_code> run_result;

    explicit Impl(const ConnectionOptions& opts)
        : options(opts),
          conn(ioc),
          run_result(run_promise.get_future().share()) {}

    /**
     * @brief Hand the call to the io thread and wait for completion
     * @throws TimeoutError if no completion within timeout (the request is cancelled)
     */
    boost::system::error_code run_call(const std::shared_ptr<PendingCall>& call,
                                       std::chrono::milliseconds timeout,
                                       std::string_view what) {
        if (!running.load(std::memory_order_acquire)) {
            throw ConnectionError(std::format("{}: connection to {} is not running",
                what, options.address.redacted()));
        }

        auto fut = call->done.get_future();
        asio::post(ioc, [this, call] {
            conn.async_exec(call->req, call->resp,
                [call](boost::system::error_code ec, std::size_t) {
                    call->done.set_value(ec);
                });
        });

        if (fut.wait_for(timeout) == std::future_status::ready) {
            return fut.get();
        }

        asio::post(ioc, [this] { conn.cancel(redis::operation::exec); });
        throw TimeoutError(std::format("{}: no reply from {} within {}ms",
            what, options.address.redacted(), timeout.count()));
    }

    /// Run error if the connection already stopped
    std::optional<boost::system::error_code> run_error() const {
        if (run_result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            return run_result.get();
        }
        return std::nullopt;
    }
};

RedisConnection::RedisConnection(const ConnectionOptions& options)
    : impl_(std::make_unique<Impl>(options)) {

    const auto& addr = options.address;

    redis::config cfg;
    cfg.addr.host = addr.host;
    cfg.addr.port = std::to_string(addr.port);
    if (!addr.username.empty()) {
        cfg.username = addr.username;
    }
    cfg.password = addr.password;
    if (addr.database != 0) {
        cfg.database_index = static_cast<int>(addr.database);
    }
    cfg.use_ssl = addr.use_tls;
    cfg.clientname = "kvguard";
    cfg.resolve_timeout = options.connect_timeout;
    cfg.connect_timeout = options.connect_timeout;
    cfg.ssl_handshake_timeout = options.connect_timeout;
    // The pool owns liveness and reconnection: one session per connection
    cfg.health_check_interval = std::chrono::seconds::zero();
    cfg.reconnect_wait_interval = std::chrono::seconds::zero();

    impl_->running.store(true, std::memory_order_release);
    impl_->conn.async_run(cfg, {}, [impl = impl_.get()](boost::system::error_code ec) {
        impl->running.store(false, std::memory_order_release);
        impl->run_promise.set_value(ec);
    });
    impl_->io_thread = std::thread([impl = impl_.get()] { impl->ioc.run(); });

    // PING waits for HELLO/AUTH/SELECT to finish, so it doubles as the handshake check
    const std::string where = std::format("Connecting to {}", addr.redacted());
    auto call = std::make_shared<PendingCall>();
    call->req.push("PING");

    boost::system::error_code ec;
    try {
        ec = impl_->run_call(call, options.connect_timeout, where);
    } catch (const StoreError&) {
        close();
        throw;
    }

    if (!ec && !call->resp.has_error()) {
        utils::log::debug(std::format("Opened store connection to {}", addr.redacted()));
        return;
    }

    const auto run_ec = impl_->run_error();
    close();
    if (call->resp.has_error()) {
        throw_server_error(call->resp.error().diagnostic);
    }
    raise_for(run_ec && *run_ec ? *run_ec : ec, where);
}

RedisConnection::~RedisConnection() {
    close();
}

StoreReply RedisConnection::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw ResponseError("Empty command");
    }

    auto call = std::make_shared<PendingCall>();
    call->req.get_config().cancel_if_not_connected = true;
    if (args.size() == 1) {
        call->req.push(args.front());
    } else {
        call->req.push_range(args.front(), args.begin() + 1, args.end());
    }

    const auto ec = impl_->run_call(call, impl_->options.socket_timeout, args.front());
    if (call->resp.has_error()) {
        throw_server_error(call->resp.error().diagnostic);
    }
    if (ec) {
        raise_for(ec, args.front());
    }
    return decode(call->resp.value());
}

bool RedisConnection::ping() {
    const auto reply = execute({"PING"});
    return reply.type == StoreReply::Type::STATUS && reply.str == "PONG";
}

bool RedisConnection::is_connected() const {
    return impl_->running.load(std::memory_order_acquire) &&
           !impl_->closed.load(std::memory_order_acquire);
}

void RedisConnection::close() {
    if (!impl_ || impl_->closed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    asio::post(impl_->ioc, [impl = impl_.get()] { impl->conn.cancel(); });
    if (impl_->run_result.wait_for(impl_->options.connect_timeout) != std::future_status::ready) {
        utils::log::warn(std::format("Store connection to {} did not shut down cleanly",
            impl_->options.address.redacted()));
    }
    impl_->ioc.stop();
    if (impl_->io_thread.joinable()) {
        impl_->io_thread.join();
    }
}

std::unique_ptr<IStoreConnection> RedisConnectionFactory::create(const ConnectionOptions& options) {
    return std::make_unique<RedisConnection>(options);
}

} // namespace kvguard
