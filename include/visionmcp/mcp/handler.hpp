#pragma once
#include "visionmcp/mcp/dispatcher.hpp"
#include "visionmcp/mcp/envelope.hpp"
#include "visionmcp/settings.hpp"
#include "visionmcp/tools/tool.hpp"
#include "visionmcp/types.hpp"

#include <functional>
#include <optional>

namespace visionmcp::mcp
{

inline constexpr const char* kProtocolVersion = "2024-11-05";

/// Takes one decoded message; returns the reply envelope, or nullopt for a
/// notification. Never throws.
using McpHandler = std::function<std::optional<Json>(const Message&)>;

/// Build the method table: initialize, notifications/initialized, ping,
/// tools/list and tools/call for the single given tool.
///
/// tools/call checks the credential in `settings` first, then the tool name,
/// then lets the tool validate its arguments. Failures of the tool itself
/// that are not protocol errors come back as a result with isError set.
Dispatcher make_dispatcher(const ServerInfo& info, const Settings& settings, tools::Tool tool);

McpHandler make_mcp_handler(const ServerInfo& info, const Settings& settings, tools::Tool tool);

/// Wrap an existing table with envelope encoding and error mapping.
McpHandler make_mcp_handler(Dispatcher dispatcher);

} // namespace visionmcp::mcp
