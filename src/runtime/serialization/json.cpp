#include "ferry/runtime/serialization/json.hpp"

#include <array>
#include <optional>
#include <stdexcept>

namespace ferry::runtime
{
namespace
{

constexpr std::array kErrorCodes{
    ErrorCode::SerializationError, ErrorCode::UnknownMethod, ErrorCode::TransportError,
    ErrorCode::TransportEOF,       ErrorCode::IllegalState,  ErrorCode::Other,
};

std::optional<ErrorCode> error_code_from_name(std::string_view name)
{
    for (auto code : kErrorCodes) {
        if (to_string(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

void cause_to_json(nlohmann::json& j, const std::shared_ptr<const GenericError>& cause)
{
    if (cause) {
        j["cause"] = *cause;
    } else {
        j["cause"] = nullptr;
    }
}

std::shared_ptr<const GenericError> cause_from_json(const nlohmann::json& j)
{
    auto it = j.find("cause");
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return std::make_shared<const GenericError>(it->get<GenericError>());
}

}  // namespace

void to_json(nlohmann::json& j, const GenericError& value)
{
    j = nlohmann::json{{"description", value.description}};
    cause_to_json(j, value.cause);
}

void from_json(const nlohmann::json& j, GenericError& value)
{
    j.at("description").get_to(value.description);
    value.cause = cause_from_json(j);
}

void to_json(nlohmann::json& j, const Error& value)
{
    j = nlohmann::json{{"kind", std::string(to_string(value.kind()))}, {"message", value.message}};
    cause_to_json(j, value.cause);
}

void from_json(const nlohmann::json& j, Error& value)
{
    auto name = j.at("kind").get<std::string>();
    auto code = error_code_from_name(name);
    if (!code) {
        throw std::invalid_argument("unknown error kind '" + name + "'");
    }
    value.code = make_error_code(*code);
    j.at("message").get_to(value.message);
    value.cause = cause_from_json(j);
}

Error json_conversion_error(const std::exception& ex)
{
    return make_error(ErrorCode::SerializationError, "json serialization or deserialization failed",
                      GenericError::from_exception(ex));
}

Result<std::string> dump_json_line(const nlohmann::json& value)
{
    try {
        auto text = value.dump();
        text.push_back('\n');
        return text;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(json_conversion_error(ex));
    }
}

}  // namespace ferry::runtime
