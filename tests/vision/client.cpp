/// @file client.cpp
/// @brief Chat-completion request shape, model precedence and response handling

#include "test_helpers.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/util/log.hpp"
#include "visionmcp/vision/client.hpp"

#include <cassert>
#include <iostream>

using namespace visionmcp;
using namespace visionmcp::vision;

static image::ImageArtifact tiny_artifact()
{
    image::ImageArtifact art;
    art.width = 2;
    art.height = 2;
    art.encoded = {0xFF, 0xD8, 0xFF, 0xD9};
    art.base64 = "/9j/2Q==";
    return art;
}

template <typename E>
static std::string error_from(const VisionClient& client)
{
    try
    {
        client.analyze(tiny_artifact(), std::nullopt, std::nullopt);
    }
    catch (const E& e)
    {
        return e.what();
    }
    return "";
}

int main()
{
    log::set_level(log::Level::Off);

    // Test 1: model precedence - argument, then default_model, then fallback
    {
        auto fake = std::make_shared<test::FakePoster>();
        auto settings = test::settings_with_key();
        VisionClient plain(settings, test::poster_for(fake));
        assert(plain.resolve_model(std::nullopt) == "gpt-4.1");
        assert(plain.resolve_model(std::string("gpt-4o")) == "gpt-4o");
        assert(plain.resolve_model(std::string()) == "gpt-4.1");

        settings.default_model = "gpt-4o-mini";
        VisionClient with_default(settings, test::poster_for(fake));
        assert(with_default.resolve_model(std::nullopt) == "gpt-4o-mini");
        assert(with_default.resolve_model(std::string("gpt-4.1-nano")) == "gpt-4.1-nano");
        std::cout << "[PASS] Test 1: model precedence\n";
    }

    // Test 2: allow-list
    {
        assert(is_known_vision_model("gpt-4o"));
        assert(is_known_vision_model("gpt-4-vision-preview"));
        assert(!is_known_vision_model("anthropic/claude-3-opus-20240229"));
        assert(known_vision_models().size() == 8);
        std::cout << "[PASS] Test 2: allow-list\n";
    }

    // Test 3: request body and headers
    {
        auto fake = std::make_shared<test::FakePoster>();
        auto settings = test::settings_with_key("sk-secret");
        settings.api_base_url = "https://example.test/";
        settings.max_tokens = 321;
        VisionClient client(settings, test::poster_for(fake));

        auto answer = client.analyze(tiny_artifact(), std::string("Is it round?"), std::nullopt);
        assert(answer == "a red square");
        assert(fake->calls() == 1);

        const auto& req = fake->requests[0];
        assert(req.url == "https://example.test/v1/chat/completions");
        assert(req.headers.at("Authorization") == "Bearer sk-secret");
        assert(req.headers.at("Content-Type") == "application/json");

        auto body = Json::parse(req.body);
        assert(body["model"] == "gpt-4.1");
        assert(body["max_tokens"] == 321);
        assert(body["messages"].size() == 1);
        const auto& msg = body["messages"][0];
        assert(msg["role"] == "user");
        assert(msg["content"].size() == 2);
        assert(msg["content"][0]["type"] == "text");
        assert(msg["content"][0]["text"] == "Is it round?");
        assert(msg["content"][1]["type"] == "image_url");
        assert(msg["content"][1]["image_url"]["url"] == "data:image/jpeg;base64,/9j/2Q==");
        assert(msg["content"][1]["image_url"]["detail"] == "high");
        std::cout << "[PASS] Test 3: request shape\n";
    }

    // Test 4: default question; unknown model still sent
    {
        auto fake = std::make_shared<test::FakePoster>();
        VisionClient client(test::settings_with_key(), test::poster_for(fake));
        client.analyze(tiny_artifact(), std::nullopt, std::string("some-future-model"));
        auto body = Json::parse(fake->requests[0].body);
        assert(body["model"] == "some-future-model");
        assert(body["messages"][0]["content"][0]["text"] == kDefaultQuestion);
        std::cout << "[PASS] Test 4: default question, unknown model proceeds\n";
    }

    // Test 5: non-2xx carries status text and raw body
    {
        auto fake = std::make_shared<test::FakePoster>();
        fake->response = {401, "Unauthorized", "{\"error\":\"bad key\"}"};
        VisionClient client(test::settings_with_key(), test::poster_for(fake));
        auto msg = error_from<ProviderError>(client);
        assert(msg.find("401 Unauthorized") != std::string::npos);
        assert(msg.find("bad key") != std::string::npos);
        std::cout << "[PASS] Test 5: HTTP error\n";
    }

    // Test 6: malformed or choice-less bodies
    {
        auto fake = std::make_shared<test::FakePoster>();
        VisionClient client(test::settings_with_key(), test::poster_for(fake));

        fake->response = {200, "OK", "<html>"};
        assert(error_from<ProviderError>(client).find("Malformed") != std::string::npos);

        fake->response = {200, "OK", R"({"choices":[]})"};
        assert(!error_from<ProviderError>(client).empty());

        fake->response = {200, "OK", R"({"choices":[{"message":{"content":null}}]})"};
        assert(!error_from<ProviderError>(client).empty());
        std::cout << "[PASS] Test 6: malformed responses\n";
    }

    // Test 7: transport failure propagates as TransportError
    {
        HttpPoster failing = [](const HttpRequest&) -> HttpResponse
        { throw TransportError("connection refused"); };
        VisionClient client(test::settings_with_key(), failing);
        assert(error_from<TransportError>(client) == "connection refused");
        std::cout << "[PASS] Test 7: transport failure\n";
    }

    // Test 8: extract_answer on a well-formed body
    {
        assert(VisionClient::extract_answer(test::completion_body("hello")) == "hello");
        std::cout << "[PASS] Test 8: extract_answer\n";
    }

    // Test 9: the httplib poster reports unreachable hosts and bad URLs as TransportError
    {
        auto poster = make_https_poster(2);
        auto post_error = [&poster](const std::string& url) -> std::string
        {
            try
            {
                poster(HttpRequest{url, {{"Content-Type", "application/json"}}, "{}"});
            }
            catch (const TransportError& e)
            {
                return e.what();
            }
            return "";
        };
        // Nothing listens on port 1 of the loopback interface.
        assert(post_error("http://127.0.0.1:1/v1/chat/completions").find("127.0.0.1") !=
               std::string::npos);
        assert(!post_error("https://127.0.0.1:1/v1/chat/completions").empty());
        assert(post_error("ftp://example.com/x").find("must look like") != std::string::npos);

        // The same poster drives a client end to end.
        auto settings = test::settings_with_key();
        settings.api_base_url = "http://127.0.0.1:1";
        VisionClient client(settings, poster);
        assert(!error_from<TransportError>(client).empty());
        std::cout << "[PASS] Test 9: httplib poster failures\n";
    }

    std::cout << "\nAll vision client tests passed!\n";
    return 0;
}
