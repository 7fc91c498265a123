#pragma once
#include "visionmcp/types.hpp"

#include <optional>
#include <string>

namespace visionmcp
{

/// Target bound and JPEG quality applied by the image pipeline.
struct ImageProfile
{
    int max_dimension{1024};
    int quality{85};

    static ImageProfile compact()
    {
        return ImageProfile{400, 60};
    }
    static ImageProfile high_fidelity()
    {
        return ImageProfile{1024, 85};
    }
};

struct Settings
{
    std::optional<std::string> api_key;
    std::optional<std::string> default_model;
    std::string api_base_url{"https://api.openai.com"};
    ImageProfile image_profile{ImageProfile::high_fidelity()};
    int max_tokens{1000};
    int request_timeout_s{120};
    std::string log_level{"INFO"};

    bool has_api_key() const
    {
        return api_key.has_value() && !api_key->empty();
    }

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace visionmcp
