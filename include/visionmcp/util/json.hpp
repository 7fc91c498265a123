#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace visionmcp::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }

// Provider bodies can carry arbitrary bytes; replace invalid UTF-8 instead of throwing.
inline std::string dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace visionmcp::util::json
