#pragma once

#include "ferry/runtime/config.hpp"
#include "ferry/runtime/method.hpp"
#include "ferry/runtime/result.hpp"
#include "ferry/runtime/serialization/json.hpp"
#include "ferry/runtime/serialization/json_stream.hpp"
#include "ferry/runtime/stream.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace ferry::runtime
{

/// {"jsonrpc":"2.0","method":...,"params":{...},"id":"<uuid>"}
nlohmann::json make_request_envelope(std::string_view method, nlohmann::json params);

/// Extracts the method name. The request must be an object with a string "method".
Result<PartialMethodId> request_method(const nlohmann::json& request);

/// Looks `name` up in the request's "params" object.
Result<const nlohmann::json*> request_param(const nlohmann::json& request, std::string_view name);

/**
 * @brief JSON envelope codec over a blocking byte stream.
 *
 * Requests carry parameters by name; responses are the bare result value.
 * Values are not length prefixed: the reader splits the stream on complete
 * top-level JSON values and keeps any surplus for the next read.
 */
class JsonTransport
{
public:
    struct TxState {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    struct FinalState {
    };

    struct RxState {
        nlohmann::json request;
        bool active = false;
    };

    explicit JsonTransport(std::shared_ptr<ByteStream> stream, TransportConfig config = {});

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
    Result<nlohmann::json> read_value();
    Result<void> write_value(const nlohmann::json& value);

    std::shared_ptr<ByteStream> stream_;
    TransportConfig config_;
    JsonValueBuffer buffer_;
};

template <typename T>
Result<void> JsonTransport::add_param(std::string_view name, const T& value, TxState& state)
{
    auto json = to_json_value(value);
    if (!json) {
        return std::unexpected(json.error());
    }
    state.params[std::string(name)] = std::move(*json);
    return {};
}

template <typename T>
Result<T> JsonTransport::read_response(FinalState)
{
    auto value = read_value();
    if (!value) {
        return std::unexpected(value.error());
    }
    return from_json_value<T>(*value);
}

template <typename T>
Result<T> JsonTransport::read_param(std::string_view name, RxState& state)
{
    if (!state.active) {
        return unexpected_result<T>(ErrorCode::IllegalState,
                                    "parameter '" + std::string(name) + "' read outside of a received call");
    }
    auto param = request_param(state.request, name);
    if (!param) {
        return std::unexpected(param.error());
    }
    return from_json_value<T>(**param);
}

template <typename T>
Result<void> JsonTransport::send_response(const T& value)
{
    auto json = to_json_value(value);
    if (!json) {
        return std::unexpected(json.error());
    }
    return write_value(*json);
}

}  // namespace ferry::runtime
