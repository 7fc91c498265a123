#include "visionmcp/image/preprocessor.hpp"
#include "visionmcp/mcp/handler.hpp"
#include "visionmcp/server/stdio_server.hpp"
#include "visionmcp/settings.hpp"
#include "visionmcp/tools/analyze_image.hpp"
#include "visionmcp/util/log.hpp"
#include "visionmcp/version.hpp"
#include "visionmcp/vision/client.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace
{

void on_interrupt(int)
{
    // In-flight calls are abandoned.
    std::_Exit(0);
}

int usage(int exit_code)
{
    std::cerr << "visionmcp-server " << visionmcp::VERSION_STRING << "\n";
    std::cerr << "Usage:\n";
    std::cerr << "  visionmcp-server            Serve MCP over stdin/stdout\n";
    std::cerr << "  visionmcp-server --version\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  OPENAI_API_KEY              Provider credential (required for tools/call)\n";
    std::cerr << "  OPENAI_MODEL                Default model (fallback: gpt-4.1)\n";
    std::cerr << "  OPENAI_BASE_URL             Provider base URL\n";
    std::cerr << "  VISIONMCP_MAX_DIMENSION     Longest image side before upload (default 1024)\n";
    std::cerr << "  VISIONMCP_JPEG_QUALITY      JPEG quality 1-100 (default 85)\n";
    std::cerr << "  VISIONMCP_MAX_TOKENS        Completion token limit (default 1000)\n";
    std::cerr << "  VISIONMCP_TIMEOUT_SECONDS   Provider connect/read/write timeout (default 120)\n";
    std::cerr << "  VISIONMCP_LOG_LEVEL         DEBUG, INFO, WARN, ERROR or OFF\n";
    return exit_code;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace visionmcp;

    if (argc > 1)
    {
        std::string arg = argv[1];
        if (arg == "--version")
        {
            std::cout << VERSION_STRING << "\n";
            return 0;
        }
        return usage(arg == "--help" || arg == "-h" ? 0 : 1);
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    auto settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));

    auto client = std::make_shared<const vision::VisionClient>(
        settings, vision::make_https_poster(settings.request_timeout_s));
    auto tool =
        tools::make_analyze_image_tool(image::ImagePreprocessor(settings.image_profile), client);

    ServerInfo info{"read-images", VERSION_STRING};
    server::StdioServer server(mcp::make_mcp_handler(info, settings, std::move(tool)));
    return server.run() ? 0 : 1;
}
