#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace visionmcp
{

/// Closed set of protocol-level error codes. Written on the wire as their names.
enum class ErrorCode
{
    ParseError,
    MethodNotFound,
    InvalidParams,
    MissingApiKey,
    InternalError
};

inline std::string to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::ParseError:
        return "ParseError";
    case ErrorCode::MethodNotFound:
        return "MethodNotFound";
    case ErrorCode::InvalidParams:
        return "InvalidParams";
    case ErrorCode::MissingApiKey:
        return "MissingApiKey";
    case ErrorCode::InternalError:
        return "InternalError";
    }
    return "InternalError";
}

inline std::optional<ErrorCode> error_code_from_string(const std::string& s)
{
    if (s == "ParseError")
        return ErrorCode::ParseError;
    if (s == "MethodNotFound")
        return ErrorCode::MethodNotFound;
    if (s == "InvalidParams")
        return ErrorCode::InvalidParams;
    if (s == "MissingApiKey")
        return ErrorCode::MissingApiKey;
    if (s == "InternalError")
        return ErrorCode::InternalError;
    return std::nullopt;
}

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Classified failure: reported through the JSON-RPC `error` member.
class ProtocolError : public Error
{
  public:
    ProtocolError(ErrorCode code, const std::string& message) : Error(message), code_(code) {}

    ErrorCode code() const noexcept
    {
        return code_;
    }

  private:
    ErrorCode code_;
};

struct ParseError : public ProtocolError
{
    explicit ParseError(const std::string& message)
        : ProtocolError(ErrorCode::ParseError, message)
    {
    }
};

struct NotFoundError : public ProtocolError
{
    explicit NotFoundError(const std::string& message)
        : ProtocolError(ErrorCode::MethodNotFound, message)
    {
    }
};

struct ValidationError : public ProtocolError
{
    explicit ValidationError(const std::string& message)
        : ProtocolError(ErrorCode::InvalidParams, message)
    {
    }
};

struct MissingApiKeyError : public ProtocolError
{
    explicit MissingApiKeyError(const std::string& message)
        : ProtocolError(ErrorCode::MissingApiKey, message)
    {
    }
};

// Unclassified failures below are reported as tool results with isError set.

struct ImageError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

struct ProviderError : public Error
{
    using Error::Error;
};

} // namespace visionmcp
