#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "manager/connection_manager.hpp"
#include "manager/guarded.hpp"
#include "store/redis/redis_connection.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace kvguard;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int /*signal*/) {
    g_stop_requested = 1;
}

constexpr const char* kUsage =
    "Usage: kvguard [--config FILE] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  health                 Run one liveness probe and print the result\n"
    "  stats                  Print connection manager statistics\n"
    "  ping                   PING the store\n"
    "  get KEY                Read a string value\n"
    "  set KEY VALUE [TTL]    Write a string value, optionally expiring after TTL seconds\n"
    "  del KEY                Delete a key\n"
    "  reset                  Force the circuit closed and reconnect\n"
    "  monitor SECONDS        Print statistics every health interval for SECONDS\n";

/**
 * @brief Process-local stand-in used when the store is unavailable
 */
class LocalStore {
public:
    std::optional<std::string> get(const std::string& key) const {
        std::lock_guard lock(mutex_);
        const auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    bool set(const std::string& key, const std::string& value) {
        std::lock_guard lock(mutex_);
        values_[key] = value;
        return true;
    }

    int64_t del(const std::string& key) {
        std::lock_guard lock(mutex_);
        return static_cast<int64_t>(values_.erase(key));
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

int usage_error(const std::string& message) {
    std::fprintf(stderr, "%s\n\n%s", message.c_str(), kUsage);
    return 2;
}

int run_monitor(ConnectionManager& manager, std::chrono::seconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    const auto interval = std::max(manager.config().health_check_interval, std::chrono::milliseconds(100));
    constexpr auto kTick = std::chrono::milliseconds(100);

    auto next_report = std::chrono::steady_clock::now();
    while (!g_stop_requested && std::chrono::steady_clock::now() < deadline) {
        if (std::chrono::steady_clock::now() >= next_report) {
            std::printf("%s\n", manager.get_statistics().to_json().c_str());
            std::fflush(stdout);
            next_report += interval;
        }
        std::this_thread::sleep_for(kTick);
    }
    if (g_stop_requested) {
        utils::log::info("Interrupted, shutting down");
    }
    return 0;
}

int run_command(ConnectionManager& manager, LocalStore& local,
                const std::string& command, const std::vector<std::string>& args) {
    if (command == "health") {
        const auto status = manager.health_check();
        std::printf("%s\n", status.to_json().c_str());
        return status.is_healthy ? 0 : 1;
    }

    if (command == "stats") {
        std::printf("%s\n", manager.get_statistics().to_json().c_str());
        return 0;
    }

    if (command == "ping") {
        const bool pong = guarded(manager,
            [](StoreClient& c) { return c.ping(); },
            [] { return false; }, "ping");
        std::printf("%s\n", pong ? "PONG" : "store unavailable");
        return pong ? 0 : 1;
    }

    if (command == "get") {
        if (args.size() != 1) return usage_error("get expects KEY");
        const auto& key = args[0];
        const auto value = guarded(manager,
            [&key](StoreClient& c) { return c.get(key); },
            [&] { return local.get(key); }, "get");
        std::printf("%s\n", value ? value->c_str() : "(nil)");
        return 0;
    }

    if (command == "set") {
        if (args.size() < 2 || args.size() > 3) return usage_error("set expects KEY VALUE [TTL]");
        const auto& key = args[0];
        const auto& value = args[1];
        std::optional<std::chrono::seconds> ttl;
        if (args.size() == 3) {
            const auto parsed = utils::try_parse_int<int64_t>(args[2]);
            if (!parsed || *parsed <= 0) return usage_error("TTL must be a positive integer");
            ttl = std::chrono::seconds(*parsed);
        }
        const bool stored = guarded(manager,
            [&](StoreClient& c) { return c.set(key, value, ttl); },
            [&] { return local.set(key, value); }, "set");
        std::printf("%s\n", stored ? "OK" : "not stored");
        return stored ? 0 : 1;
    }

    if (command == "del") {
        if (args.size() != 1) return usage_error("del expects KEY");
        const auto& key = args[0];
        const auto removed = guarded(manager,
            [&key](StoreClient& c) { return c.del(key); },
            [&] { return local.del(key); }, "del");
        std::printf("%lld\n", static_cast<long long>(removed));
        return 0;
    }

    if (command == "reset") {
        manager.reset_circuit();
        std::printf("circuit %s, healthy=%s\n",
            circuit_state_to_string(manager.circuit_state()),
            utils::booltostr(manager.is_healthy()));
        return 0;
    }

    if (command == "monitor") {
        if (args.size() != 1) return usage_error("monitor expects SECONDS");
        const auto seconds = utils::try_parse_int<int64_t>(args[0]);
        if (!seconds || *seconds <= 0) return usage_error("SECONDS must be a positive integer");
        return run_monitor(manager, std::chrono::seconds(*seconds));
    }

    return usage_error(std::format("Unknown command '{}'", command));
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Arguments
        std::optional<std::string> config_file;
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config" || arg == "-c") {
                if (i + 1 >= argc) return usage_error("--config expects a file path");
                config_file = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                std::printf("%s", kUsage);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.empty()) {
            return usage_error("Missing command");
        }
        const std::string command = positional.front();
        const std::vector<std::string> args(positional.begin() + 1, positional.end());

        // Configuration
        KvGuardConfig config;
        if (config_file) {
            auto result = ConfigLoader::load_from_file(*config_file);
            if (!result.success) {
                utils::log::error(result.error_message);
                return 1;
            }
            config = std::move(result.config);
        } else {
            config = ConfigLoader::defaults();
            const auto errors = ConfigLoader::validate_config(config);
            if (!errors.empty()) {
                for (const auto& err : errors) utils::log::error(err);
                return 1;
            }
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // Only a long-running command needs the background probe
        if (command != "monitor") {
            config.store.enable_health_monitoring = false;
        }

        LocalStore local;
        ConnectionManager manager(config.store, std::make_shared<RedisConnectionFactory>());

        const int rc = run_command(manager, local, command, args);
        manager.close();
        return rc;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
