#pragma once

#include "ferry/runtime/method.hpp"
#include "ferry/runtime/result.hpp"
#include "ferry/runtime/synchronized.hpp"

#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace ferry::runtime
{

/// A named argument. Holds a reference: it must not outlive the call expression.
template <typename Value>
struct Param {
    std::string_view name;
    const Value& value;
};

template <typename Value>
Param<Value> param(std::string_view name, const Value& value)
{
    return Param<Value>{name, value};
}

/**
 * @brief Performs one blocking call.
 *
 * Drives `transport` through begin_call, one add_param per argument in
 * order, finalize and read_response<R>.
 */
template <typename R, typename Transport, typename... Values>
    requires(!is_synchronized_v<Transport>)
Result<R> call(Transport& transport, const MethodId& id, const Param<Values>&... params)
{
    auto state = transport.begin_call(id);
    if (!state) {
        return std::unexpected(state.error());
    }
    Result<void> status;
    ((status = transport.add_param(params.name, params.value, *state)) && ...);
    if (!status) {
        return std::unexpected(status.error());
    }
    auto final_state = transport.finalize(std::move(*state));
    if (!final_state) {
        return std::unexpected(final_state.error());
    }
    return transport.template read_response<R>(std::move(*final_state));
}

/// Same as above with the whole call made under the wrapper's lock.
template <typename R, typename Transport, typename... Values>
Result<R> call(const Synchronized<Transport>& transport, const MethodId& id, const Param<Values>&... params)
{
    return transport.lock([&](Transport& inner) { return call<R>(inner, id, params...); });
}

namespace detail
{

template <typename Transport, typename TxState>
boost::asio::awaitable<Result<void>> async_add_params(Transport&, TxState&)
{
    co_return Result<void>{};
}

template <typename Transport, typename TxState, typename Value, typename... Rest>
boost::asio::awaitable<Result<void>> async_add_params(Transport& transport, TxState& state, Param<Value> first,
                                                      Param<Rest>... rest)
{
    if (auto res = co_await transport.add_param(first.name, first.value, state); !res) {
        co_return res;
    }
    co_return co_await async_add_params(transport, state, rest...);
}

}  // namespace detail

/// Coroutine counterpart of `call`.
template <typename R, typename Transport, typename... Values>
    requires(!is_synchronized_v<Transport>)
boost::asio::awaitable<Result<R>> async_call(Transport& transport, MethodId id, Param<Values>... params)
{
    auto state = co_await transport.begin_call(id);
    if (!state) {
        co_return std::unexpected(state.error());
    }
    if (auto res = co_await detail::async_add_params(transport, *state, params...); !res) {
        co_return std::unexpected(res.error());
    }
    auto final_state = co_await transport.finalize(std::move(*state));
    if (!final_state) {
        co_return std::unexpected(final_state.error());
    }
    co_return co_await transport.template read_response<R>(std::move(*final_state));
}

template <typename R, typename Transport, typename... Values>
boost::asio::awaitable<Result<R>> async_call(const AsyncSynchronized<Transport>& transport, MethodId id,
                                             Param<Values>... params)
{
    co_return co_await transport.lock([&](Transport& inner) { return async_call<R>(inner, id, params...); });
}

/**
 * @brief Folds a transport failure into the application error type.
 *
 * For services whose error type can represent an Error, so that callers
 * handle a single error channel.
 */
template <typename T, typename E>
    requires std::is_constructible_v<E, Error>
std::expected<T, E> flatten(Result<std::expected<T, E>> result)
{
    if (!result) {
        return std::unexpected(E(std::move(result.error())));
    }
    return std::move(*result);
}

}  // namespace ferry::runtime
