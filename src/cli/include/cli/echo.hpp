#pragma once

#include "ferry/runtime/method.hpp"
#include "ferry/runtime/result.hpp"
#include "ferry/runtime/server.hpp"

#include <cstdint>
#include <expected>
#include <string>

#include <boost/fusion/include/adapt_struct.hpp>
#include <nlohmann/json.hpp>

namespace ferry::echo
{

/// Application error returned by `reject`.
struct EchoError {
    std::string reason;
};

bool operator==(const EchoError& lhs, const EchoError& rhs);

void to_json(nlohmann::json& j, const EchoError& value);
void from_json(const nlohmann::json& j, EchoError& value);

inline constexpr runtime::MethodId describe_method{"describe", 0};
inline constexpr runtime::MethodId reject_method{"reject", 1};

/// "{subject} is {value}"
std::string describe(const std::string& subject, std::int32_t value);

/// Always fails with `reason`.
std::expected<std::string, EchoError> reject(const std::string& reason);

/// Registers `describe` and `reject`, in that order.
template <typename Transport>
runtime::Result<void> register_methods(runtime::Server<Transport>& server)
{
    if (auto res = server.add_method(std::string(describe_method.name), {"subject", "value"}, &describe); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = server.add_method(std::string(reject_method.name), {"reason"}, &reject); !res) {
        return std::unexpected(res.error());
    }
    return {};
}

}  // namespace ferry::echo

BOOST_FUSION_ADAPT_STRUCT(ferry::echo::EchoError, reason)
