#pragma once

#include "ferry/runtime/method.hpp"
#include "ferry/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ferry::runtime
{

/**
 * @brief Serves calls arriving on one server transport.
 *
 * Methods are registered once, before serving starts; each gets the next
 * index in registration order. A handler reads the method's parameters in
 * declaration order, invokes the implementation and sends its return value
 * as the response. Calls are served strictly one after another.
 */
template <typename Transport>
class Server
{
public:
    using RxState = typename Transport::RxState;
    using Handler = std::function<Result<void>(Transport&, RxState&)>;

    explicit Server(Transport transport)
        : transport_(std::move(transport))
    {
    }

    /**
     * @brief Registers the next method.
     *
     * @param name Method name, unique within the server
     * @param param_names One name per parameter of `fn`, in order
     * @param fn Implementation; its return value is the response payload
     * @return The method's identifier, or IllegalState on a duplicate name
     *         or a parameter name count that does not match `fn`
     */
    template <typename Fn>
    Result<MethodId> add_method(std::string name, std::vector<std::string> param_names, Fn fn)
    {
        return add_function(std::move(name), std::move(param_names), std::function{std::move(fn)});
    }

    /// Receives one call and dispatches it. UnknownMethod is returned here and never sent to the peer.
    Result<void> serve_single_call()
    {
        auto received = transport_.begin_receive();
        if (!received) {
            return std::unexpected(received.error());
        }
        auto& [method, state] = *received;
        auto index = methods_.resolve(method);
        if (!index) {
            spdlog::warn("unknown method {}", method.to_string());
            return unexpected_result(ErrorCode::UnknownMethod, fmt::format("unknown method {}", method.to_string()));
        }
        spdlog::debug("serving '{}' (index {})", methods_.at(*index)->name, *index);
        return handlers_[*index](transport_, state);
    }

    /// Serves calls while `keep_going` holds. The condition is checked after each call.
    Result<void> serve_until(const std::function<bool()>& keep_going)
    {
        while (true) {
            if (auto res = serve_single_call(); !res) {
                if (res.error().kind() == ErrorCode::TransportEOF) {
                    spdlog::info("peer disconnected, serve loop stopped");
                }
                return res;
            }
            if (!keep_going()) {
                return {};
            }
        }
    }

    /// Serves until an error occurs, canonically TransportEOF.
    Result<void> serve()
    {
        return serve_until([] { return true; });
    }

    const MethodTable& methods() const
    {
        return methods_;
    }

    Transport& transport()
    {
        return transport_;
    }

private:
    template <typename R, typename... Args>
    Result<MethodId> add_function(std::string name, std::vector<std::string> param_names,
                                  std::function<R(Args...)> fn)
    {
        static_assert(!std::is_void_v<R>, "remote methods must return a value");
        if (param_names.size() != sizeof...(Args)) {
            return unexpected_result<MethodId>(ErrorCode::IllegalState,
                                               fmt::format("method '{}' names {} parameters but takes {}", name,
                                                           param_names.size(), sizeof...(Args)));
        }
        auto id = methods_.add(std::move(name));
        if (!id) {
            return id;
        }
        handlers_.push_back([names = std::move(param_names), fn = std::move(fn)](Transport& transport,
                                                                                 RxState& state) {
            return invoke(transport, state, names, fn, std::index_sequence_for<Args...>{});
        });
        return id;
    }

    template <typename T>
    static Result<void> read_into(Transport& transport, RxState& state, std::string_view name, std::optional<T>& out)
    {
        auto value = transport.template read_param<T>(name, state);
        if (!value) {
            return std::unexpected(value.error());
        }
        out = std::move(*value);
        return {};
    }

    template <typename R, typename... Args, std::size_t... I>
    static Result<void> invoke(Transport& transport, RxState& state, const std::vector<std::string>& names,
                               const std::function<R(Args...)>& fn, std::index_sequence<I...>)
    {
        std::tuple<std::optional<std::decay_t<Args>>...> values;
        Result<void> status;
        ((status = read_into(transport, state, names[I], std::get<I>(values))) && ...);
        if (!status) {
            return status;
        }
        return transport.send_response(fn(std::move(*std::get<I>(values))...));
    }

    Transport transport_;
    MethodTable methods_;
    std::vector<Handler> handlers_;
};

}  // namespace ferry::runtime
