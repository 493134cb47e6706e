#include "ferry/runtime/error.hpp"

#include <fmt/core.h>

namespace ferry::runtime
{
namespace
{

std::shared_ptr<const GenericError> nested_cause(const std::exception& ex)
{
    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception& inner) {
        return std::make_shared<const GenericError>(GenericError::from_exception(inner));
    } catch (...) {
        return std::make_shared<const GenericError>("unknown exception");
    }
    return nullptr;
}

void append_chain(std::string& out, const std::shared_ptr<const GenericError>& cause)
{
    for (auto link = cause; link; link = link->cause) {
        out += " caused by:\n ";
        out += link->description;
    }
}

}  // namespace

std::string_view to_string(ErrorCode code)
{
    switch (code) {
        case ErrorCode::SerializationError:
            return "SerializationError";
        case ErrorCode::UnknownMethod:
            return "UnknownMethod";
        case ErrorCode::TransportError:
            return "TransportError";
        case ErrorCode::TransportEOF:
            return "TransportEOF";
        case ErrorCode::IllegalState:
            return "IllegalState";
        case ErrorCode::Other:
            return "Other";
    }
    return "Unknown";
}

GenericError GenericError::from_exception(const std::exception& ex)
{
    return GenericError{ex.what(), nested_cause(ex)};
}

GenericError GenericError::from_error_code(const std::error_code& code)
{
    return GenericError{fmt::format("{}: {}", code.category().name(), code.message())};
}

std::string GenericError::to_string() const
{
    std::string out = description;
    append_chain(out, cause);
    return out;
}

bool operator==(const GenericError& lhs, const GenericError& rhs)
{
    if (lhs.description != rhs.description) {
        return false;
    }
    if (!lhs.cause || !rhs.cause) {
        return !lhs.cause && !rhs.cause;
    }
    return *lhs.cause == *rhs.cause;
}

ErrorCode Error::kind() const
{
    if (code.category() != ferry_error_category()) {
        return ErrorCode::Other;
    }
    return static_cast<ErrorCode>(code.value());
}

std::string Error::to_string() const
{
    std::string out = message;
    append_chain(out, cause);
    return out;
}

bool operator==(const Error& lhs, const Error& rhs)
{
    if (lhs.code != rhs.code || lhs.message != rhs.message) {
        return false;
    }
    if (!lhs.cause || !rhs.cause) {
        return !lhs.cause && !rhs.cause;
    }
    return *lhs.cause == *rhs.cause;
}

Error make_errno_error(const std::string& prefix, int err)
{
    std::error_code code(err, std::generic_category());
    std::string message = prefix;
    if (!prefix.empty()) {
        message += ": ";
    }
    message += code.message();
    return make_error(ErrorCode::TransportError, std::move(message), GenericError::from_error_code(code));
}

}  // namespace ferry::runtime
