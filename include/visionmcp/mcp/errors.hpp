#pragma once
#include "visionmcp/mcp/envelope.hpp"

#include <exception>

namespace visionmcp::mcp
{

/// Map any exception onto the closed error set.
///
/// ProtocolError keeps its own code and message and carries no data.
/// Everything else becomes InternalError with the exception type and
/// message attached as `data` for diagnostics.
ErrorObject map_exception(const std::exception& e);

} // namespace visionmcp::mcp
