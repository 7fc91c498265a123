#include "visionmcp/mcp/dispatcher.hpp"

#include "visionmcp/exceptions.hpp"

#include <algorithm>

namespace visionmcp::mcp
{

Json Dispatcher::dispatch(const std::string& method, const Json& params) const
{
    auto it = routes_.find(method);
    if (it == routes_.end())
        throw NotFoundError("Unknown method: " + method);
    return it->second(params);
}

std::vector<std::string> Dispatcher::methods() const
{
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& kv : routes_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace visionmcp::mcp
