#include "visionmcp/mcp/handler.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/mcp/errors.hpp"
#include "visionmcp/util/json.hpp"
#include "visionmcp/util/log.hpp"

#include <memory>

namespace visionmcp::mcp
{

namespace
{
Json text_result(const std::string& text, bool is_error)
{
    Json payload = {{"content", Json::array({Json(TextContent{"text", text})})}};
    if (is_error)
        payload["isError"] = true;
    return payload;
}

std::string describe_id(const Message& msg)
{
    return msg.id ? util::json::dump(*msg.id) : std::string("(notification)");
}
} // namespace

Dispatcher make_dispatcher(const ServerInfo& info, const Settings& settings, tools::Tool tool)
{
    auto shared_tool = std::make_shared<const tools::Tool>(std::move(tool));
    const bool has_key = settings.has_api_key();

    Dispatcher::Table table;

    table["initialize"] = [info](const Json& params) -> Json
    {
        // The client's protocolVersion is accepted as-is.
        if (params.is_object())
            log::info("Initialize request from " +
                      util::json::dump(params.value("clientInfo", Json::object())) +
                      ", protocolVersion " +
                      util::json::dump(params.value("protocolVersion", Json())));
        return Json{
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", Json::object()}, {"logging", Json::object()}}},
            {"serverInfo", Json(info)},
        };
    };

    table["notifications/initialized"] = [](const Json&) -> Json
    {
        log::info("Client finished initialization");
        return Json();
    };

    table["ping"] = [](const Json&) -> Json { return Json::object(); };

    table["tools/list"] = [shared_tool](const Json&) -> Json
    { return Json{{"tools", Json::array({shared_tool->definition()})}}; };

    table["tools/call"] = [shared_tool, has_key](const Json& params) -> Json
    {
        if (!has_key)
            throw MissingApiKeyError("OPENAI_API_KEY environment variable is required");

        if (!params.is_object())
            throw ValidationError("Invalid params: tools/call expects an object");
        auto name_it = params.find("name");
        std::string name = (name_it != params.end() && name_it->is_string())
                               ? name_it->get<std::string>()
                               : std::string();
        if (name != shared_tool->name())
            throw NotFoundError("Unknown tool: " + name);

        Json arguments = params.value("arguments", Json::object());
        try
        {
            return text_result(shared_tool->invoke(arguments), false);
        }
        catch (const ProtocolError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            log::error(std::string("Error analyzing image: ") + e.what());
            return text_result(std::string("Error analyzing image: ") + e.what(), true);
        }
    };

    return Dispatcher(std::move(table));
}

McpHandler make_mcp_handler(const ServerInfo& info, const Settings& settings, tools::Tool tool)
{
    return make_mcp_handler(make_dispatcher(info, settings, std::move(tool)));
}

McpHandler make_mcp_handler(Dispatcher dispatcher)
{
    auto table = std::make_shared<const Dispatcher>(std::move(dispatcher));
    return [table](const Message& msg) -> std::optional<Json>
    {
        log::debug("Received " + (msg.method.empty() ? std::string("<no method>") : msg.method) +
                   " id=" + describe_id(msg));
        try
        {
            Json result = table->dispatch(msg.method, msg.params);
            if (msg.is_notification())
            {
                log::debug("Processed notification: " + msg.method);
                return std::nullopt;
            }
            if (result.is_null())
                result = Json::object();
            return make_result(*msg.id, result);
        }
        catch (const std::exception& e)
        {
            if (msg.is_notification())
            {
                log::warn("Error in notification " + msg.method + ": " + e.what());
                return std::nullopt;
            }
            auto error = map_exception(e);
            log::warn("Request " + describe_id(msg) + " (" + msg.method + ") failed with " +
                      to_string(error.code) + ": " + error.message);
            return make_error(*msg.id, error);
        }
    };
}

} // namespace visionmcp::mcp
