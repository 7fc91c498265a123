#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace visionmcp
{

using Json = nlohmann::json;

/// Identity reported in the initialize response. Fixed for the process lifetime.
struct ServerInfo
{
    std::string name;
    std::string version;
};

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

// nlohmann::json adapters
inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    info.version = j.at("version").get<std::string>();
}

inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

} // namespace visionmcp
