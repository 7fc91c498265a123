/// @file stdio_server.cpp
/// @brief Whole transport loop over a pipe: framing, correlation, notifications

#include "test_helpers.hpp"

#include "visionmcp/mcp/handler.hpp"
#include "visionmcp/server/stdio_server.hpp"
#include "visionmcp/tools/analyze_image.hpp"
#include "visionmcp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace visionmcp;

// Feed `input` through a pipe into a server and collect every reply line.
static std::vector<Json> serve(mcp::McpHandler handler, const std::string& input)
{
    int fds[2];
    int rc = ::pipe(fds);
    assert(rc == 0);
    (void)rc;

    std::thread writer(
        [fd = fds[1], input]()
        {
            // Dribble the input in small pieces to exercise reassembly.
            size_t pos = 0;
            while (pos < input.size())
            {
                size_t n = std::min<size_t>(7, input.size() - pos);
                ssize_t w = ::write(fd, input.data() + pos, n);
                assert(w > 0);
                pos += static_cast<size_t>(w);
            }
            ::close(fd);
        });

    std::ostringstream out;
    {
        server::StdioServer srv(std::move(handler), fds[0], out);
        assert(!srv.running());
        bool clean = srv.run();
        assert(clean);
        assert(srv.in_flight() == 0);
    }
    writer.join();
    ::close(fds[0]);

    std::vector<Json> replies;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line))
        replies.push_back(Json::parse(line));
    return replies;
}

static std::map<std::string, Json> by_id(const std::vector<Json>& replies)
{
    std::map<std::string, Json> out;
    for (const auto& r : replies)
    {
        auto key = r["id"].dump();
        assert(out.find(key) == out.end()); // exactly one reply per id
        out[key] = r;
    }
    return out;
}

int main()
{
    log::set_level(log::Level::Off);
    test::TempDir dir;
    auto image_path = dir.file("shared.png");
    test::write_image(image_path, 1300, 700);

    auto fake = std::make_shared<test::FakePoster>();
    auto settings = test::settings_with_key();
    auto client =
        std::make_shared<const vision::VisionClient>(settings, test::poster_for(fake));
    auto tool = tools::make_analyze_image_tool(image::ImagePreprocessor(), client);
    auto handler = mcp::make_mcp_handler(ServerInfo{"read-images", "0.1.0"}, settings, tool);

    // Test 1: full session with notifications, garbage, and blank lines
    {
        Json call_args = {{"name", "analyze_image"}, {"arguments", {{"image_path", image_path}}}};
        std::string input;
        input += Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                      {"params", {{"clientInfo", {{"name", "t"}}}}}}.dump() + "\n";
        input += Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump() + "\n";
        input += "\n\r\n";
        input += "{this is not json\n";
        input += Json{{"jsonrpc", "2.0"}, {"id", "two"}, {"method", "tools/list"}}.dump() + "\r\n";
        input += Json{{"jsonrpc", "2.0"}, {"method", "bogus/notification"}}.dump() + "\n";
        input += Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "bogus"}}.dump() + "\n";
        input += Json{{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                      {"params", call_args}}.dump() + "\n";
        input += Json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                      {"params", call_args}}.dump() + "\n";
        // last line has no trailing newline
        input += Json{{"jsonrpc", "2.0"}, {"id", 6}, {"method", "ping"}}.dump();

        auto replies = serve(handler, input);
        // 5 requests with ids + 1 parse error; the two notifications are silent
        assert(replies.size() == 7);
        for (const auto& r : replies)
            assert(r["jsonrpc"] == "2.0");

        auto ids = by_id(replies);
        assert(ids.at("1")["result"]["serverInfo"]["name"] == "read-images");
        assert(ids.at("\"two\"")["result"]["tools"][0]["name"] == "analyze_image");
        assert(ids.at("3")["error"]["code"] == "MethodNotFound");
        assert(ids.at("4")["result"]["content"][0]["text"] == "a red square");
        assert(ids.at("5")["result"]["content"][0]["text"] == "a red square");
        assert(ids.at("6")["result"].empty());
        assert(ids.at("null")["error"]["code"] == "ParseError");
        assert(fake->calls() == 2);
        std::cout << "[PASS] Test 1: mixed session\n";
    }

    // Test 2: a blocked call does not hold back a later one; ids still correlate
    {
        // "slow" can only finish once "fast" has run, which needs both in flight at once.
        auto fast_ran = std::make_shared<std::promise<void>>();
        std::shared_future<void> fast_done = fast_ran->get_future().share();
        auto slow_released = std::make_shared<std::atomic<bool>>(false);

        mcp::Dispatcher::Table table;
        table["slow"] = [fast_done, slow_released](const Json& p) -> Json
        {
            if (fast_done.wait_for(std::chrono::seconds(10)) == std::future_status::ready)
                *slow_released = true;
            return Json{{"echo", p}};
        };
        table["fast"] = [fast_ran](const Json& p) -> Json
        {
            fast_ran->set_value();
            return Json{{"echo", p}};
        };
        auto concurrent_handler = mcp::make_mcp_handler(mcp::Dispatcher(std::move(table)));

        std::string input;
        input += Json{{"jsonrpc", "2.0"}, {"id", 10}, {"method", "slow"},
                      {"params", {{"n", 10}}}}.dump() + "\n";
        input += Json{{"jsonrpc", "2.0"}, {"id", 11}, {"method", "fast"},
                      {"params", {{"n", 11}}}}.dump() + "\n";

        auto replies = serve(concurrent_handler, input);
        assert(replies.size() == 2);
        assert(slow_released->load());
        auto ids = by_id(replies);
        assert(ids.count("10") == 1 && ids.count("11") == 1);
        for (const auto& r : replies)
            assert(r["result"]["echo"]["n"] == r["id"]);
        std::cout << "[PASS] Test 2: concurrent dispatch\n";
    }

    // Test 3: empty input ends cleanly with no output
    {
        auto replies = serve(handler, "");
        assert(replies.empty());
        std::cout << "[PASS] Test 3: empty input\n";
    }

    std::cout << "\nAll stdio server tests passed!\n";
    return 0;
}
