#pragma once

#include "ferry/runtime/async_io.hpp"
#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/config.hpp"
#include "ferry/runtime/frame.hpp"
#include "ferry/runtime/method.hpp"
#include "ferry/runtime/serialization/hb1.hpp"

#include <array>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>

namespace ferry::runtime
{

/**
 * @brief Coroutine client for the framed HB1 codec.
 *
 * Wire compatible with BinaryTransport. Every operation is a suspension
 * point on the stream's executor. A call cancelled mid-flight leaves the
 * stream in an unknown position and the transport must be discarded.
 */
template <typename AsyncStream>
class AsyncBinaryTransport
{
public:
    using TxState = BinaryTransport::TxState;
    using FinalState = BinaryTransport::FinalState;

    explicit AsyncBinaryTransport(AsyncStream stream, TransportConfig config = {})
        : stream_(std::move(stream))
        , config_(config)
    {
    }

    boost::asio::awaitable<Result<TxState>> begin_call(MethodId id)
    {
        auto payload = hb1::to_bytes(id.index);
        if (!payload) {
            co_return std::unexpected(payload.error());
        }
        co_return TxState{std::move(*payload)};
    }

    template <typename T>
    boost::asio::awaitable<Result<void>> add_param(std::string_view, const T& value, TxState& state)
    {
        VectorSink sink{state.payload};
        hb1::Writer writer{sink};
        co_return hb1::encode(writer, value);
    }

    boost::asio::awaitable<Result<FinalState>> finalize(TxState state)
    {
        auto frame = encode_frame(state.payload);
        if (!frame) {
            co_return std::unexpected(frame.error());
        }
        auto written = co_await async_write_all(stream_, std::span<const std::uint8_t>(*frame));
        if (!written) {
            co_return std::unexpected(written.error());
        }
        co_return FinalState{};
    }

    template <typename T>
    boost::asio::awaitable<Result<T>> read_response(FinalState)
    {
        std::array<std::uint8_t, FrameHeaderSize> header_buffer{};
        if (auto res = co_await async_read_exact(stream_, std::span<std::uint8_t>(header_buffer)); !res) {
            co_return std::unexpected(res.error());
        }
        // Equivalent of Result::and_then, which libstdc++ 12 does not provide.
        auto header = decode_header(header_buffer);
        if (header) {
            if (auto res = check_frame_length(*header, config_.max_frame_length); !res) {
                header = std::unexpected(res.error());
            }
        }
        if (!header) {
            spdlog::warn("rejected frame: {}", header.error().message);
            co_return std::unexpected(header.error());
        }
        std::vector<std::uint8_t> payload(header->length);
        if (!payload.empty()) {
            if (auto res = co_await async_read_exact(stream_, std::span<std::uint8_t>(payload)); !res) {
                co_return std::unexpected(res.error());
            }
        }
        co_return hb1::from_bytes<T>(payload);
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
    AsyncStream stream_;
    TransportConfig config_;
};

}  // namespace ferry::runtime
