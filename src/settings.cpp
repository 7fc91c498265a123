#include "visionmcp/settings.hpp"

#include "visionmcp/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace visionmcp
{

static std::optional<std::string> getenv_opt(const char* key)
{
    if (const char* v = std::getenv(key))
        if (*v != '\0')
            return std::string(v);
    return std::nullopt;
}

static std::string getenv_str(const char* key, const std::string& defv)
{
    return getenv_opt(key).value_or(defv);
}

static int getenv_int(const char* key, int defv)
{
    auto raw = getenv_opt(key);
    if (!raw)
        return defv;
    try
    {
        size_t pos = 0;
        int v = std::stoi(*raw, &pos);
        if (pos == raw->size())
            return v;
    }
    catch (const std::exception&)
    {
    }
    log::warn(std::string("Ignoring invalid value for ") + key + ": '" + *raw + "'");
    return defv;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static void clamp(Settings& s)
{
    s.image_profile.quality = std::clamp(s.image_profile.quality, 1, 100);
    s.image_profile.max_dimension = std::max(s.image_profile.max_dimension, 1);
    s.max_tokens = std::max(s.max_tokens, 1);
    s.request_timeout_s = std::max(s.request_timeout_s, 1);
}

Settings Settings::from_env()
{
    Settings s;
    s.api_key = getenv_opt("OPENAI_API_KEY");
    s.default_model = getenv_opt("OPENAI_MODEL");
    s.api_base_url = getenv_str("OPENAI_BASE_URL", s.api_base_url);
    s.image_profile.max_dimension =
        getenv_int("VISIONMCP_MAX_DIMENSION", s.image_profile.max_dimension);
    s.image_profile.quality = getenv_int("VISIONMCP_JPEG_QUALITY", s.image_profile.quality);
    s.max_tokens = getenv_int("VISIONMCP_MAX_TOKENS", s.max_tokens);
    s.request_timeout_s = getenv_int("VISIONMCP_TIMEOUT_SECONDS", s.request_timeout_s);
    s.log_level = upper(getenv_str("VISIONMCP_LOG_LEVEL", s.log_level));
    clamp(s);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("api_key") && j["api_key"].is_string())
        s.api_key = j["api_key"].get<std::string>();
    if (j.contains("default_model") && j["default_model"].is_string())
        s.default_model = j["default_model"].get<std::string>();
    if (j.contains("api_base_url"))
        s.api_base_url = j.at("api_base_url").get<std::string>();
    if (j.contains("image_profile"))
    {
        const auto& p = j.at("image_profile");
        s.image_profile.max_dimension = p.value("max_dimension", s.image_profile.max_dimension);
        s.image_profile.quality = p.value("quality", s.image_profile.quality);
    }
    if (j.contains("max_tokens"))
        s.max_tokens = j.at("max_tokens").get<int>();
    if (j.contains("request_timeout_s"))
        s.request_timeout_s = j.at("request_timeout_s").get<int>();
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    clamp(s);
    return s;
}

} // namespace visionmcp
