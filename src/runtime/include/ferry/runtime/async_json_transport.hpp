#pragma once

#include "ferry/runtime/async_io.hpp"
#include "ferry/runtime/config.hpp"
#include "ferry/runtime/json_transport.hpp"
#include "ferry/runtime/method.hpp"
#include "ferry/runtime/serialization/json.hpp"
#include "ferry/runtime/serialization/json_stream.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

namespace ferry::runtime
{

/**
 * @brief Coroutine client for the JSON envelope codec.
 *
 * Wire compatible with JsonTransport.
 */
template <typename AsyncStream>
class AsyncJsonTransport
{
public:
    using TxState = JsonTransport::TxState;
    using FinalState = JsonTransport::FinalState;

    explicit AsyncJsonTransport(AsyncStream stream, TransportConfig config = {})
        : stream_(std::move(stream))
        , config_(config)
    {
    }

    boost::asio::awaitable<Result<TxState>> begin_call(MethodId id)
    {
        TxState state;
        state.method = std::string(id.name);
        co_return state;
    }

    template <typename T>
    boost::asio::awaitable<Result<void>> add_param(std::string_view name, const T& value, TxState& state)
    {
        auto json = to_json_value(value);
        if (!json) {
            co_return std::unexpected(json.error());
        }
        state.params[std::string(name)] = std::move(*json);
        co_return Result<void>{};
    }

    boost::asio::awaitable<Result<FinalState>> finalize(TxState state)
    {
        auto text = dump_json_line(make_request_envelope(state.method, std::move(state.params)));
        if (!text) {
            co_return std::unexpected(text.error());
        }
        auto written = co_await async_write_all(
            stream_, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text->data()), text->size()));
        if (!written) {
            co_return std::unexpected(written.error());
        }
        co_return FinalState{};
    }

    template <typename T>
    boost::asio::awaitable<Result<T>> read_response(FinalState)
    {
        auto value = co_await read_value();
        if (!value) {
            co_return std::unexpected(value.error());
        }
        co_return from_json_value<T>(*value);
    }

    AsyncStream& stream()
    {
        return stream_;
    }

    const TransportConfig& config() const
    {
        return config_;
    }

private:
    boost::asio::awaitable<Result<nlohmann::json>> read_value()
    {
        std::vector<std::uint8_t> scratch(config_.read_chunk_size == 0 ? 1 : config_.read_chunk_size);
        while (true) {
            if (auto value = take_json_value(buffer_, false)) {
                co_return std::move(*value);
            }
            auto count = co_await async_read_some(stream_, std::span<std::uint8_t>(scratch));
            if (!count) {
                co_return std::unexpected(count.error());
            }
            if (*count == 0) {
                co_return std::move(*take_json_value(buffer_, true));
            }
            buffer_.append(std::span<const std::uint8_t>(scratch.data(), *count));
        }
    }

    AsyncStream stream_;
    TransportConfig config_;
    JsonValueBuffer buffer_;
};

}  // namespace ferry::runtime
