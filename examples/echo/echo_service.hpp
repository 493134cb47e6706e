#pragma once

#include "ferry/runtime/method.hpp"

#include <cstdint>
#include <string>

#include <boost/fusion/include/adapt_struct.hpp>
#include <nlohmann/json.hpp>

namespace sample::echo
{

struct Payload {
    std::string message;
    std::uint32_t sequence = 0;
};

inline void to_json(nlohmann::json& j, const Payload& value)
{
    j = nlohmann::json{{"message", value.message}, {"sequence", value.sequence}};
}

inline void from_json(const nlohmann::json& j, Payload& value)
{
    j.at("message").get_to(value.message);
    j.at("sequence").get_to(value.sequence);
}

inline constexpr ferry::runtime::MethodId ping_method{"ping", 0};

inline const std::string endpoint = "/tmp/ferry-echo.sock";

}  // namespace sample::echo

BOOST_FUSION_ADAPT_STRUCT(sample::echo::Payload, message, sequence)
