#pragma once
#include "visionmcp/image/preprocessor.hpp"
#include "visionmcp/tools/tool.hpp"
#include "visionmcp/vision/client.hpp"

#include <memory>
#include <optional>
#include <string>

namespace visionmcp::tools
{

inline constexpr const char* kAnalyzeImageTool = "analyze_image";

/// Validated tools/call arguments for analyze_image.
struct CallArguments
{
    std::string image_path;
    std::optional<std::string> question;
    std::optional<std::string> model;

    /// Throws ValidationError unless image_path is an absolute path and the
    /// optional fields are strings. Touches no files.
    static CallArguments from_json(const Json& arguments);
};

Json analyze_image_schema();

/// Validate, preprocess, then ask the vision model.
Tool make_analyze_image_tool(image::ImagePreprocessor preprocessor,
                             std::shared_ptr<const vision::VisionClient> client);

} // namespace visionmcp::tools
