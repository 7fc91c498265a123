#include "visionmcp/mcp/errors.hpp"

#include <new>
#include <stdexcept>
#include <system_error>

namespace visionmcp::mcp
{

namespace
{
template <typename T>
bool is(const std::exception& e)
{
    return dynamic_cast<const T*>(&e) != nullptr;
}

// Most derived first.
std::string exception_name(const std::exception& e)
{
    if (is<ImageError>(e))
        return "ImageError";
    if (is<TransportError>(e))
        return "TransportError";
    if (is<ProviderError>(e))
        return "ProviderError";
    if (is<Error>(e))
        return "Error";
    if (is<Json::exception>(e))
        return "JsonError";
    if (is<std::system_error>(e))
        return "std::system_error";
    if (is<std::bad_alloc>(e))
        return "std::bad_alloc";
    if (is<std::invalid_argument>(e))
        return "std::invalid_argument";
    if (is<std::out_of_range>(e))
        return "std::out_of_range";
    if (is<std::logic_error>(e))
        return "std::logic_error";
    if (is<std::runtime_error>(e))
        return "std::runtime_error";
    return "std::exception";
}
} // namespace

ErrorObject map_exception(const std::exception& e)
{
    ErrorObject obj;
    obj.message = e.what();
    if (const auto* classified = dynamic_cast<const ProtocolError*>(&e))
    {
        obj.code = classified->code();
        return obj;
    }

    obj.code = ErrorCode::InternalError;
    obj.data = Json{{"exception", exception_name(e)}, {"detail", e.what()}};
    return obj;
}

} // namespace visionmcp::mcp
