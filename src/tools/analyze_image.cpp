#include "visionmcp/tools/analyze_image.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/util/log.hpp"

#include <filesystem>

namespace visionmcp::tools
{

static std::optional<std::string> optional_string(const Json& args, const char* key)
{
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw ValidationError(std::string("Invalid params: '") + key + "' must be a string");
    return it->get<std::string>();
}

CallArguments CallArguments::from_json(const Json& arguments)
{
    if (!arguments.is_object())
        throw ValidationError("Invalid params: arguments must be an object");

    auto path = optional_string(arguments, "image_path");
    if (!path || path->empty())
        throw ValidationError("Invalid params: 'image_path' is required");
    if (!std::filesystem::path(*path).is_absolute())
        throw ValidationError("Image path must be absolute: " + *path);

    CallArguments out;
    out.image_path = *path;
    out.question = optional_string(arguments, "question");
    out.model = optional_string(arguments, "model");
    return out;
}

Json analyze_image_schema()
{
    return Json{
        {"type", "object"},
        {"properties",
         {
             {"image_path",
              {{"type", "string"},
               {"description", "Path to the image file to analyze (must be absolute path)"}}},
             {"question",
              {{"type", "string"}, {"description", "Question to ask about the image"}}},
             {"model",
              {{"type", "string"},
               {"description",
                "OpenAI model to use (e.g., gpt-4.1, gpt-4.1-mini, gpt-4o, gpt-4o-mini)"}}},
         }},
        {"required", Json::array({"image_path"})},
    };
}

Tool make_analyze_image_tool(image::ImagePreprocessor preprocessor,
                             std::shared_ptr<const vision::VisionClient> client)
{
    auto fn = [preprocessor, client](const Json& arguments) -> std::string
    {
        auto args = CallArguments::from_json(arguments);
        log::info("Analyzing " + args.image_path);

        // Artifact lives only for this call.
        auto artifact = preprocessor.process(args.image_path);
        log::debug("Prepared image " + std::to_string(artifact.original_width) + "x" +
                   std::to_string(artifact.original_height) + " -> " +
                   std::to_string(artifact.width) + "x" + std::to_string(artifact.height) +
                   ", " + std::to_string(artifact.base64.size()) + " base64 chars");
        return client->analyze(artifact, args.question, args.model);
    };

    return Tool(kAnalyzeImageTool,
                std::string("Analyze an image using OpenAI vision models (default: ") +
                    vision::kFallbackModel + ")",
                analyze_image_schema(), std::move(fn));
}

} // namespace visionmcp::tools
