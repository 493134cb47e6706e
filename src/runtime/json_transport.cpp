#include "ferry/runtime/json_transport.hpp"

#include <span>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

namespace ferry::runtime
{

nlohmann::json make_request_envelope(std::string_view method, nlohmann::json params)
{
    thread_local boost::uuids::random_generator generator;
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"method", std::string(method)},
        {"params", std::move(params)},
        {"id", boost::uuids::to_string(generator())},
    };
}

Result<PartialMethodId> request_method(const nlohmann::json& request)
{
    if (!request.is_object()) {
        return unexpected_result<PartialMethodId>(ErrorCode::SerializationError, "json is not expected object");
    }
    auto method = request.find("method");
    if (method == request.end()) {
        return unexpected_result<PartialMethodId>(ErrorCode::SerializationError, "json is not expected object");
    }
    if (!method->is_string()) {
        return unexpected_result<PartialMethodId>(ErrorCode::SerializationError, "json method was not string");
    }
    return PartialMethodId::from_name(method->get<std::string>());
}

Result<const nlohmann::json*> request_param(const nlohmann::json& request, std::string_view name)
{
    auto params = request.find("params");
    if (params == request.end() || !params->is_object()) {
        return unexpected_result<const nlohmann::json*>(ErrorCode::SerializationError, "json is not expected object");
    }
    auto param = params->find(std::string(name));
    if (param == params->end()) {
        return unexpected_result<const nlohmann::json*>(ErrorCode::SerializationError,
                                                        fmt::format("parameters do not contain {}", name));
    }
    return &*param;
}

JsonTransport::JsonTransport(std::shared_ptr<ByteStream> stream, TransportConfig config)
    : stream_(std::move(stream))
    , config_(config)
{
}

Result<JsonTransport::TxState> JsonTransport::begin_call(const MethodId& id)
{
    TxState state;
    state.method = std::string(id.name);
    return state;
}

Result<JsonTransport::FinalState> JsonTransport::finalize(TxState state)
{
    if (auto res = write_value(make_request_envelope(state.method, std::move(state.params))); !res) {
        return std::unexpected(res.error());
    }
    return FinalState{};
}

Result<std::pair<PartialMethodId, JsonTransport::RxState>> JsonTransport::begin_receive()
{
    auto request = read_value();
    if (!request) {
        return std::unexpected(request.error());
    }
    auto method = request_method(*request);
    if (!method) {
        return std::unexpected(method.error());
    }
    RxState state;
    state.request = std::move(*request);
    state.active = true;
    return std::pair{std::move(*method), std::move(state)};
}

Result<nlohmann::json> JsonTransport::read_value()
{
    return read_json_value(*stream_, buffer_, config_.read_chunk_size);
}

Result<void> JsonTransport::write_value(const nlohmann::json& value)
{
    auto text = dump_json_line(value);
    if (!text) {
        return std::unexpected(text.error());
    }
    return stream_->write_all(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text->data()), text->size()));
}

}  // namespace ferry::runtime
