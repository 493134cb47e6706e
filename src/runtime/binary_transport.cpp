#include "ferry/runtime/binary_transport.hpp"

#include "ferry/runtime/frame.hpp"

#include <spdlog/spdlog.h>

namespace ferry::runtime
{

BinaryTransport::BinaryTransport(std::shared_ptr<ByteStream> stream, TransportConfig config)
    : stream_(std::move(stream))
    , config_(config)
{
}

Result<BinaryTransport::TxState> BinaryTransport::begin_call(const MethodId& id)
{
    TxState state;
    VectorSink sink{state.payload};
    hb1::Writer writer{sink};
    if (auto res = hb1::encode(writer, id.index); !res) {
        return std::unexpected(res.error());
    }
    return state;
}

Result<BinaryTransport::FinalState> BinaryTransport::finalize(TxState state)
{
    if (auto res = write_payload(state.payload); !res) {
        return std::unexpected(res.error());
    }
    return FinalState{};
}

Result<std::pair<PartialMethodId, BinaryTransport::RxState>> BinaryTransport::begin_receive()
{
    auto payload = read_payload();
    if (!payload) {
        return std::unexpected(payload.error());
    }

    RxState state;
    state.payload = std::move(*payload);
    SpanSource source{state.payload};
    hb1::Reader reader{source};
    auto index = hb1::decode<std::uint32_t>(reader);
    if (!index) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "cannot decode method index", GenericError{index.error().message}));
    }
    state.offset = state.payload.size() - source.remaining();
    state.active = true;
    return std::pair{PartialMethodId::from_index(*index), std::move(state)};
}

Result<std::vector<std::uint8_t>> BinaryTransport::read_payload()
{
    auto payload = read_frame(*stream_, config_.max_frame_length);
    if (!payload && payload.error().kind() == ErrorCode::SerializationError) {
        spdlog::warn("rejected frame: {}", payload.error().message);
    }
    return payload;
}

Result<void> BinaryTransport::write_payload(std::span<const std::uint8_t> payload)
{
    return write_frame(*stream_, payload);
}

}  // namespace ferry::runtime
