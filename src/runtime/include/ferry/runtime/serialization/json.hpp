#pragma once

#include "ferry/runtime/error.hpp"
#include "ferry/runtime/result.hpp"

#include <expected>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

/**
 * JSON value mapping for the envelope codec.
 *
 * Application types convert through the usual nlohmann `to_json` /
 * `from_json` hooks. `std::expected` is written as `{"Ok": value}` or
 * `{"Err": error}`; the value arm of `std::expected<void, E>` is `null`.
 */
namespace nlohmann
{

template <typename T, typename E>
struct adl_serializer<std::expected<T, E>> {
    static void to_json(json& j, const std::expected<T, E>& value)
    {
        if (!value) {
            j = json{{"Err", value.error()}};
            return;
        }
        if constexpr (std::is_void_v<T>) {
            j = json{{"Ok", nullptr}};
        } else {
            j = json{{"Ok", *value}};
        }
    }

    static void from_json(const json& j, std::expected<T, E>& out)
    {
        if (!j.is_object() || j.size() != 1) {
            throw std::invalid_argument("result must be an object with a single Ok or Err member");
        }
        if (auto err = j.find("Err"); err != j.end()) {
            out = std::unexpected(err->template get<E>());
            return;
        }
        auto ok = j.find("Ok");
        if (ok == j.end()) {
            throw std::invalid_argument("result must be an object with a single Ok or Err member");
        }
        if constexpr (std::is_void_v<T>) {
            out = std::expected<T, E>{};
        } else {
            out = ok->template get<T>();
        }
    }
};

}  // namespace nlohmann

namespace ferry::runtime
{

void to_json(nlohmann::json& j, const GenericError& value);
void from_json(const nlohmann::json& j, GenericError& value);

/// {"kind": "<ErrorCode name>", "message": "...", "cause": {...} | null}
void to_json(nlohmann::json& j, const Error& value);
void from_json(const nlohmann::json& j, Error& value);

/// Wraps an exception raised while converting a value as a SerializationError.
Error json_conversion_error(const std::exception& ex);

template <typename T>
Result<nlohmann::json> to_json_value(const T& value)
{
    try {
        return nlohmann::json(value);
    } catch (const std::exception& ex) {
        return std::unexpected(json_conversion_error(ex));
    }
}

template <typename T>
Result<T> from_json_value(const nlohmann::json& value)
{
    try {
        return value.get<T>();
    } catch (const std::exception& ex) {
        return std::unexpected(json_conversion_error(ex));
    }
}

/// Compact text followed by a newline, so a bare number is terminated.
Result<std::string> dump_json_line(const nlohmann::json& value);

}  // namespace ferry::runtime
