// One-shot analysis outside the server loop, for debugging credentials,
// models and image handling from a shell.
//
//   visionmcp-analyze /abs/path/photo.png "What colors dominate?" gpt-4o-mini

#include "visionmcp/exceptions.hpp"
#include "visionmcp/image/preprocessor.hpp"
#include "visionmcp/settings.hpp"
#include "visionmcp/tools/analyze_image.hpp"
#include "visionmcp/util/log.hpp"
#include "visionmcp/vision/client.hpp"

#include <iostream>
#include <memory>

int main(int argc, char** argv)
{
    using namespace visionmcp;

    if (argc < 2 || argc > 4)
    {
        std::cerr << "Usage: visionmcp-analyze <absolute-image-path> [question] [model]\n";
        return 2;
    }

    auto settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));
    if (!settings.has_api_key())
    {
        std::cerr << "OPENAI_API_KEY environment variable is required\n";
        return 1;
    }

    Json arguments = {{"image_path", argv[1]}};
    if (argc > 2)
        arguments["question"] = argv[2];
    if (argc > 3)
        arguments["model"] = argv[3];

    auto client = std::make_shared<const vision::VisionClient>(
        settings, vision::make_https_poster(settings.request_timeout_s));
    auto tool =
        tools::make_analyze_image_tool(image::ImagePreprocessor(settings.image_profile), client);

    try
    {
        std::cout << tool.invoke(arguments) << std::endl;
    }
    catch (const ProtocolError& e)
    {
        std::cerr << to_string(e.code()) << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error analyzing image: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
