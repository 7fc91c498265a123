#pragma once
#include "visionmcp/types.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace visionmcp::mcp
{

/// Method name -> handler table.
///
/// The table is fixed at construction; there is no registration afterwards,
/// so concurrent dispatch() calls need no locking.
class Dispatcher
{
  public:
    using Handler = std::function<Json(const Json& params)>;
    using Table = std::unordered_map<std::string, Handler>;

    explicit Dispatcher(Table routes) : routes_(std::move(routes)) {}

    /// Throws NotFoundError for an unknown method.
    Json dispatch(const std::string& method, const Json& params) const;

    bool has(const std::string& method) const
    {
        return routes_.find(method) != routes_.end();
    }

    std::vector<std::string> methods() const;

  private:
    const Table routes_;
};

} // namespace visionmcp::mcp
