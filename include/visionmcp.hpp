#pragma once

/// @file visionmcp.hpp
/// @brief Main header for visionmcp - pulls in every public component
///
/// Usage:
/// @code
/// #include <visionmcp.hpp>
///
/// int main() {
///     auto settings = visionmcp::Settings::from_env();
///     auto client = std::make_shared<const visionmcp::vision::VisionClient>(
///         settings, visionmcp::vision::make_https_poster(settings.request_timeout_s));
///     auto tool = visionmcp::tools::make_analyze_image_tool(
///         visionmcp::image::ImagePreprocessor(settings.image_profile), client);
///     visionmcp::server::StdioServer server(visionmcp::mcp::make_mcp_handler(
///         {"read-images", visionmcp::VERSION_STRING}, settings, std::move(tool)));
///     return server.run() ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "visionmcp/types.hpp"
#include "visionmcp/exceptions.hpp"
#include "visionmcp/settings.hpp"
#include "visionmcp/version.hpp"

// Protocol
#include "visionmcp/mcp/envelope.hpp"
#include "visionmcp/mcp/errors.hpp"
#include "visionmcp/mcp/dispatcher.hpp"
#include "visionmcp/mcp/handler.hpp"

// Analysis pipeline
#include "visionmcp/image/preprocessor.hpp"
#include "visionmcp/vision/client.hpp"
#include "visionmcp/tools/tool.hpp"
#include "visionmcp/tools/analyze_image.hpp"

// Transport
#include "visionmcp/server/line_framer.hpp"
#include "visionmcp/server/output_sink.hpp"
#include "visionmcp/server/stdio_server.hpp"
