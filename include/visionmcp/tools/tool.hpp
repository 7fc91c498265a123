#pragma once
#include "visionmcp/types.hpp"

#include <functional>
#include <string>

namespace visionmcp::tools
{

/// Named callable exposed through tools/list and tools/call.
class Tool
{
  public:
    using Fn = std::function<std::string(const Json& arguments)>;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }

    /// Returns the answer text; throws on failure.
    std::string invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

    /// tools/list entry.
    Json definition() const
    {
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

} // namespace visionmcp::tools
