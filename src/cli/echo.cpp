#include "cli/echo.hpp"

#include <fmt/core.h>

namespace ferry::echo
{

bool operator==(const EchoError& lhs, const EchoError& rhs)
{
    return lhs.reason == rhs.reason;
}

void to_json(nlohmann::json& j, const EchoError& value)
{
    j = nlohmann::json{{"reason", value.reason}};
}

void from_json(const nlohmann::json& j, EchoError& value)
{
    j.at("reason").get_to(value.reason);
}

std::string describe(const std::string& subject, std::int32_t value)
{
    return fmt::format("{} is {}", subject, value);
}

std::expected<std::string, EchoError> reject(const std::string& reason)
{
    return std::unexpected(EchoError{reason});
}

}  // namespace ferry::echo
