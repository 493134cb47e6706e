#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry::runtime
{

enum class ErrorCode {
    SerializationError = 1,  ///< encode/decode failure
    UnknownMethod,           ///< server could not resolve the method identifier
    TransportError,          ///< channel-level I/O fault, raised only by concrete transports
    TransportEOF,            ///< peer closed the channel while a read was pending
    IllegalState,            ///< internal invariant violation
    Other,
};

std::string_view to_string(ErrorCode code);

class FerryErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "ferry";
    }

    std::string message(int ev) const override
    {
        return std::string(to_string(static_cast<ErrorCode>(ev)));
    }
};

inline const std::error_category& ferry_error_category()
{
    static FerryErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorCode code)
{
    return {static_cast<int>(code), ferry_error_category()};
}

/**
 * @brief Serialization-safe projection of an arbitrary error.
 *
 * Keeps the message text and the depth of the causal chain. The concrete
 * type of the original error is lost.
 */
struct GenericError {
    std::string description;
    std::shared_ptr<const GenericError> cause;

    GenericError() = default;
    explicit GenericError(std::string description_, std::shared_ptr<const GenericError> cause_ = nullptr)
        : description(std::move(description_))
        , cause(std::move(cause_))
    {
    }

    /// Builds the chain from `std::nested_exception` links.
    static GenericError from_exception(const std::exception& ex);
    static GenericError from_error_code(const std::error_code& code);

    std::string to_string() const;
};

bool operator==(const GenericError& lhs, const GenericError& rhs);

/**
 * @brief Protocol or transport level failure.
 *
 * The only error type the core produces. Application errors travel as
 * ordinary result payloads and never use this type.
 */
struct Error {
    std::error_code code = make_error_code(ErrorCode::Other);
    std::string message;
    std::shared_ptr<const GenericError> cause;

    Error() = default;

    Error(ErrorCode code_, std::string message_)
        : code(make_error_code(code_))
        , message(std::move(message_))
    {
    }

    Error(ErrorCode code_, std::string message_, GenericError cause_)
        : code(make_error_code(code_))
        , message(std::move(message_))
        , cause(std::make_shared<const GenericError>(std::move(cause_)))
    {
    }

    Error(std::error_code code_, std::string message_)
        : code(std::move(code_))
        , message(std::move(message_))
    {
    }

    /// Errors from foreign categories report `ErrorCode::Other`.
    ErrorCode kind() const;

    /// Message followed by the cause chain, one "caused by" per link.
    std::string to_string() const;
};

bool operator==(const Error& lhs, const Error& rhs);

inline Error make_error(ErrorCode code, std::string message = {})
{
    return Error{code, std::move(message)};
}

inline Error make_error(ErrorCode code, std::string message, GenericError cause)
{
    return Error{code, std::move(message), std::move(cause)};
}

inline Error make_error(std::error_code code, std::string message = {})
{
    return Error{std::move(code), std::move(message)};
}

/// Wraps an I/O failure reported through errno as a TransportError.
Error make_errno_error(const std::string& prefix, int err);

}  // namespace ferry::runtime
