#include "visionmcp/mcp/envelope.hpp"

#include "visionmcp/util/json.hpp"

namespace visionmcp::mcp
{

static constexpr const char* kJsonRpcVersion = "2.0";

Message decode_message(const std::string& line)
{
    Json j;
    try
    {
        j = util::json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw ParseError(std::string("Invalid JSON-RPC message: ") + e.what());
    }
    return message_from_json(j);
}

Message message_from_json(const Json& j)
{
    if (!j.is_object())
        throw ParseError("Invalid JSON-RPC message: expected an object");

    Message msg;
    auto id_it = j.find("id");
    if (id_it != j.end() && !id_it->is_null())
        msg.id = *id_it;

    auto method_it = j.find("method");
    if (method_it != j.end() && method_it->is_string())
        msg.method = method_it->get<std::string>();

    // Malformed params are left for the handler to reject.
    auto params_it = j.find("params");
    if (params_it != j.end() && !params_it->is_null())
        msg.params = *params_it;
    return msg;
}

Json make_result(const Json& id, const Json& result)
{
    return Json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

Json make_error(const Json& id, const ErrorObject& error)
{
    Json err = {{"code", to_string(error.code)}, {"message", error.message}};
    if (error.data)
        err["data"] = *error.data;
    return Json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", err}};
}

Response decode_response(const Json& envelope)
{
    if (!envelope.is_object())
        throw ParseError("Not a JSON-RPC 2.0 response");
    auto version_it = envelope.find("jsonrpc");
    if (version_it == envelope.end() || !version_it->is_string() ||
        version_it->get<std::string>() != kJsonRpcVersion)
        throw ParseError("Not a JSON-RPC 2.0 response");

    Response resp;
    resp.id = envelope.value("id", Json());

    auto result_it = envelope.find("result");
    auto error_it = envelope.find("error");
    if ((result_it == envelope.end()) == (error_it == envelope.end()))
        throw ParseError("Response must carry exactly one of result or error");

    if (result_it != envelope.end())
    {
        resp.result = *result_it;
        return resp;
    }

    const auto& err = *error_it;
    if (!err.is_object() || !err.contains("code") || !err["code"].is_string())
        throw ParseError("Malformed error object");
    auto code = error_code_from_string(err["code"].get<std::string>());
    if (!code)
        throw ParseError("Unknown error code: " + err["code"].get<std::string>());

    ErrorObject obj;
    obj.code = *code;
    if (err.contains("message") && err["message"].is_string())
        obj.message = err["message"].get<std::string>();
    if (err.contains("data"))
        obj.data = err["data"];
    resp.error = std::move(obj);
    return resp;
}

} // namespace visionmcp::mcp
