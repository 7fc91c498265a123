#pragma once
#include "visionmcp/image/preprocessor.hpp"
#include "visionmcp/settings.hpp"
#include "visionmcp/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace visionmcp::vision
{

inline constexpr const char* kFallbackModel = "gpt-4.1";
inline constexpr const char* kDefaultQuestion = "What's in this image?";
inline constexpr const char* kChatCompletionsPath = "/v1/chat/completions";

struct HttpRequest
{
    std::string url; ///< absolute, e.g. https://api.openai.com/v1/chat/completions
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse
{
    int status{0};
    std::string reason;
    std::string body;
};

/// Sends one POST and returns the full response. Throws TransportError when
/// no response was received at all.
using HttpPoster = std::function<HttpResponse(const HttpRequest&)>;

/// cpp-httplib backed poster (HTTPS requires CPPHTTPLIB_OPENSSL_SUPPORT).
HttpPoster make_https_poster(int timeout_seconds);

/// Models known to accept image input.
const std::vector<std::string>& known_vision_models();
bool is_known_vision_model(const std::string& model);

/**
 * Chat-completion client for a single image + question.
 *
 * The bearer credential and defaults come from Settings at construction;
 * nothing is read from the environment afterwards.
 */
class VisionClient
{
  public:
    VisionClient(Settings settings, HttpPoster poster);

    /// Call argument, then Settings::default_model, then kFallbackModel.
    std::string resolve_model(const std::optional<std::string>& requested) const;

    Json build_request(const std::string& model, const std::string& question,
                       const image::ImageArtifact& image) const;

    /// Throws TransportError or ProviderError on failure.
    std::string analyze(const image::ImageArtifact& image,
                        const std::optional<std::string>& question,
                        const std::optional<std::string>& model) const;

    /// Pull choices[0].message.content out of a response body.
    static std::string extract_answer(const std::string& body);

  private:
    Settings settings_;
    HttpPoster poster_;
};

} // namespace visionmcp::vision
