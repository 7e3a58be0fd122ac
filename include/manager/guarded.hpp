#pragma once

#include "manager/connection_manager.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kvguard {

/**
 * @brief Run op(client) through the manager; always yields a value
 *
 * Transient store failures and an open circuit resolve to fallback().
 * Non-transient errors still propagate.
 */
template<typename Op, typename Fallback>
auto guarded(ConnectionManager& manager, Op&& op, Fallback&& fallback,
             std::string_view operation_name = "guarded_operation")
    -> std::invoke_result_t<Op&, StoreClient&> {
    auto result = manager.execute_with_fallback(op, fallback, operation_name);
    if (!result) {
        return fallback();
    }
    return std::move(*result);
}

/**
 * @brief Reusable wrapper binding a manager, an operation name and a fixed fallback value
 *
 *   auto cached_len = make_guard(manager, "history_length", int64_t{0});
 *   int64_t n = cached_len([&](StoreClient& c) { return c.llen(key); });
 */
template<typename T>
class Guard {
public:
    Guard(ConnectionManager& manager, std::string operation_name, T fallback_value)
        : manager_(manager),
          operation_name_(std::move(operation_name)),
          fallback_value_(std::move(fallback_value)) {}

    template<typename Op>
    T operator()(Op&& op) const {
        return guarded(manager_,
            [&op](StoreClient& client) -> T { return op(client); },
            [this]() -> T { return fallback_value_; },
            operation_name_);
    }

    [[nodiscard]] const std::string& operation_name() const { return operation_name_; }

private:
    ConnectionManager& manager_;
    std::string operation_name_;
    T fallback_value_;
};

template<typename T>
[[nodiscard]] Guard<std::decay_t<T>> make_guard(ConnectionManager& manager,
                                                std::string operation_name,
                                                T&& fallback_value) {
    return Guard<std::decay_t<T>>(manager, std::move(operation_name), std::forward<T>(fallback_value));
}

} // namespace kvguard
