#pragma once
#include "visionmcp/exceptions.hpp"
#include "visionmcp/types.hpp"

#include <optional>
#include <string>

namespace visionmcp::mcp
{

/// Inbound request or notification.
struct Message
{
    std::optional<Json> id; ///< absent (or JSON null) for notifications
    std::string method;
    Json params = Json::object();

    bool is_notification() const
    {
        return !id.has_value();
    }
};

struct ErrorObject
{
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
    std::optional<Json> data; ///< diagnostics; only set for unclassified errors
};

/// Outbound result or error, as read back by a client.
struct Response
{
    Json id;
    std::optional<Json> result;
    std::optional<ErrorObject> error;
};

/// Parse one framed line. Throws ParseError for malformed JSON or a
/// top-level value that is not an object (batches are not supported).
Message decode_message(const std::string& line);

/// Interpret an already-parsed JSON value as a Message.
Message message_from_json(const Json& j);

Json make_result(const Json& id, const Json& result);
Json make_error(const Json& id, const ErrorObject& error);

/// Inverse of make_result/make_error. Throws ParseError on other shapes.
Response decode_response(const Json& envelope);

} // namespace visionmcp::mcp
