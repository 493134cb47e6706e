#pragma once

#include "ferry/runtime/config.hpp"
#include "ferry/runtime/method.hpp"
#include "ferry/runtime/result.hpp"
#include "ferry/runtime/serialization/hb1.hpp"
#include "ferry/runtime/stream.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::runtime
{

/**
 * @brief Framed HB1 codec over a blocking byte stream.
 *
 * A call is one frame holding the method index followed by the parameters
 * in declaration order. A response is one frame holding the encoded result.
 * Parameter names are not transmitted.
 */
class BinaryTransport
{
public:
    struct TxState {
        std::vector<std::uint8_t> payload;
    };

    struct FinalState {
    };

    struct RxState {
        std::vector<std::uint8_t> payload;
        std::size_t offset = 0;
        bool active = false;
    };

    explicit BinaryTransport(std::shared_ptr<ByteStream> stream, TransportConfig config = {});

    // Client side

    Result<TxState> begin_call(const MethodId& id);

    template <typename T>
    Result<void> add_param(std::string_view name, const T& value, TxState& state);

    Result<FinalState> finalize(TxState state);

    template <typename T>
    Result<T> read_response(FinalState state);

    // Server side

    Result<std::pair<PartialMethodId, RxState>> begin_receive();

    template <typename T>
    Result<T> read_param(std::string_view name, RxState& state);

    template <typename T>
    Result<void> send_response(const T& value);

    ByteStream& stream()
    {
        return *stream_;
    }

    const TransportConfig& config() const
    {
        return config_;
    }

private:
    Result<std::vector<std::uint8_t>> read_payload();
    Result<void> write_payload(std::span<const std::uint8_t> payload);

    std::shared_ptr<ByteStream> stream_;
    TransportConfig config_;
};

template <typename T>
Result<void> BinaryTransport::add_param(std::string_view, const T& value, TxState& state)
{
    VectorSink sink{state.payload};
    hb1::Writer writer{sink};
    return hb1::encode(writer, value);
}

template <typename T>
Result<T> BinaryTransport::read_response(FinalState)
{
    auto payload = read_payload();
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return hb1::from_bytes<T>(*payload);
}

template <typename T>
Result<T> BinaryTransport::read_param(std::string_view name, RxState& state)
{
    if (!state.active) {
        return unexpected_result<T>(ErrorCode::IllegalState,
                                    "parameter '" + std::string(name) + "' read outside of a received call");
    }
    SpanSource source{std::span<const std::uint8_t>(state.payload).subspan(state.offset)};
    hb1::Reader reader{source};
    auto before = source.remaining();
    auto value = hb1::decode<T>(reader);
    if (!value) {
        return value;
    }
    state.offset += before - source.remaining();
    return value;
}

template <typename T>
Result<void> BinaryTransport::send_response(const T& value)
{
    auto payload = hb1::to_bytes(value);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return write_payload(*payload);
}

}  // namespace ferry::runtime
