#include "visionmcp/vision/client.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/util/json.hpp"
#include "visionmcp/util/log.hpp"

#include <httplib.h>

#include <algorithm>
#include <memory>
#include <regex>

namespace visionmcp::vision
{

namespace
{
struct ParsedUrl
{
    std::string scheme;
    std::string host;
    int port{443};
    std::string path;
};

ParsedUrl parse_url(const std::string& url)
{
    std::regex pattern(R"(^(https?)://([^/:]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, pattern))
        throw TransportError("Provider URL must look like https://host[:port][/path]: " + url);

    ParsedUrl parsed;
    parsed.scheme = match[1].str();
    parsed.host = match[2].str();
    parsed.port =
        match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
    parsed.path = match[4].matched ? match[4].str() : std::string("/");
    return parsed;
}

std::string join_url(std::string base, const std::string& path)
{
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + path;
}

std::string truncate(const std::string& s, size_t max_len)
{
    if (s.size() <= max_len)
        return s;
    return s.substr(0, max_len) + "...";
}
} // namespace

HttpPoster make_https_poster(int timeout_seconds)
{
    return [timeout_seconds](const HttpRequest& request) -> HttpResponse
    {
        const auto parsed = parse_url(request.url);

        // ClientImpl is the common base of the plain and TLS clients.
        std::unique_ptr<httplib::ClientImpl> client;
        if (parsed.scheme == "http")
        {
            client = std::make_unique<httplib::ClientImpl>(parsed.host, parsed.port);
        }
        else
        {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            client = std::make_unique<httplib::SSLClient>(parsed.host, parsed.port);
#else
            throw TransportError("https:// requires CPPHTTPLIB_OPENSSL_SUPPORT at build time");
#endif
        }
        client->set_follow_location(true);
        client->set_connection_timeout(timeout_seconds, 0);
        client->set_read_timeout(timeout_seconds, 0);
        client->set_write_timeout(timeout_seconds, 0);

        httplib::Headers headers;
        std::string content_type = "application/json";
        for (const auto& [name, value] : request.headers)
        {
            if (name == "Content-Type")
                content_type = value;
            else
                headers.emplace(name, value);
        }

        auto res = client->Post(parsed.path, headers, request.body, content_type);
        if (!res)
            throw TransportError("HTTP request to " + parsed.host +
                                 " failed: " + httplib::to_string(res.error()));

        HttpResponse out;
        out.status = res->status;
        out.reason = res->reason.empty() ? std::string(httplib::status_message(res->status))
                                         : res->reason;
        out.body = res->body;
        return out;
    };
}

const std::vector<std::string>& known_vision_models()
{
    static const std::vector<std::string> models = {
        "gpt-4.1",     "gpt-4.1-mini", "gpt-4.1-nano", "gpt-4o",
        "gpt-4o-mini", "gpt-4-turbo",  "gpt-4",        "gpt-4-vision-preview",
    };
    return models;
}

bool is_known_vision_model(const std::string& model)
{
    const auto& models = known_vision_models();
    return std::find(models.begin(), models.end(), model) != models.end();
}

VisionClient::VisionClient(Settings settings, HttpPoster poster)
    : settings_(std::move(settings)), poster_(std::move(poster))
{
}

std::string VisionClient::resolve_model(const std::optional<std::string>& requested) const
{
    if (requested && !requested->empty())
        return *requested;
    if (settings_.default_model && !settings_.default_model->empty())
        return *settings_.default_model;
    return kFallbackModel;
}

Json VisionClient::build_request(const std::string& model, const std::string& question,
                                 const image::ImageArtifact& image) const
{
    Json text_part = {{"type", "text"}, {"text", question}};
    Json image_part = {
        {"type", "image_url"},
        {"image_url",
         {{"url", "data:" + image.mime_type + ";base64," + image.base64}, {"detail", "high"}}},
    };
    return Json{
        {"model", model},
        {"messages", Json::array({Json{{"role", "user"},
                                       {"content", Json::array({text_part, image_part})}}})},
        {"max_tokens", settings_.max_tokens},
    };
}

std::string VisionClient::extract_answer(const std::string& body)
{
    Json parsed;
    try
    {
        parsed = util::json::parse(body);
    }
    catch (const Json::parse_error& e)
    {
        throw ProviderError(std::string("Malformed provider response: ") + e.what());
    }

    if (!parsed.is_object() || !parsed.contains("choices") || !parsed["choices"].is_array() ||
        parsed["choices"].empty())
        throw ProviderError("Provider response has no choices: " + truncate(body, 500));

    const auto& choice = parsed["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        throw ProviderError("Provider response choice has no message");

    const auto& message = choice["message"];
    auto it = message.find("content");
    if (it == message.end() || !it->is_string())
        throw ProviderError("Provider response message has no text content");
    return it->get<std::string>();
}

std::string VisionClient::analyze(const image::ImageArtifact& image,
                                  const std::optional<std::string>& question,
                                  const std::optional<std::string>& model) const
{
    if (!settings_.has_api_key())
        throw TransportError("No API key configured for the vision provider");

    const std::string selected = resolve_model(model);
    if (!is_known_vision_model(selected))
    {
        std::string supported;
        for (const auto& m : known_vision_models())
            supported += (supported.empty() ? "" : ", ") + m;
        log::warn("Model '" + selected +
                  "' may not support vision. Supported models: " + supported);
    }

    const std::string prompt = (question && !question->empty()) ? *question : kDefaultQuestion;

    HttpRequest request;
    request.url = join_url(settings_.api_base_url, kChatCompletionsPath);
    request.headers = {
        {"Authorization", "Bearer " + *settings_.api_key},
        {"Content-Type", "application/json"},
    };
    request.body = util::json::dump(build_request(selected, prompt, image));

    log::info("Sending " + std::to_string(image.encoded.size()) + " byte image (" +
              std::to_string(image.width) + "x" + std::to_string(image.height) + ") to " +
              selected);
    HttpResponse response = poster_(request);
    log::info("Provider responded with status " + std::to_string(response.status));

    if (response.status < 200 || response.status >= 300)
        throw ProviderError("OpenAI API error: " + std::to_string(response.status) + " " +
                            response.reason + "\nDetails: " + response.body);

    return extract_answer(response.body);
}

} // namespace visionmcp::vision
