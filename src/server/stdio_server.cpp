#include "visionmcp/server/stdio_server.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/mcp/errors.hpp"
#include "visionmcp/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>
#include <thread>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace visionmcp::server
{

namespace
{
constexpr std::size_t kReadChunk = 64 * 1024;

long read_some(int fd, char* buffer, std::size_t size)
{
#ifdef _WIN32
    return ::_read(fd, buffer, static_cast<unsigned int>(size));
#else
    return static_cast<long>(::read(fd, buffer, size));
#endif
}
} // namespace

StdioServer::StdioServer(mcp::McpHandler handler, int input_fd, std::ostream& out)
    : handler_(std::move(handler)), input_fd_(input_fd), sink_(out)
{
}

StdioServer::~StdioServer()
{
    // Workers reference this object until they finish.
    wait_for_in_flight();
}

std::size_t StdioServer::in_flight() const
{
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return in_flight_;
}

bool StdioServer::run()
{
    if (running_.exchange(true))
        return false;

    log::info("Image analysis server running on stdio");

    bool clean = true;
    char buffer[kReadChunk];
    while (true)
    {
        long n = read_some(input_fd_, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            log::error(std::string("Failed reading input: ") + std::strerror(errno));
            clean = false;
            break;
        }
        if (n == 0)
            break;

        for (const auto& line : framer_.feed(buffer, static_cast<std::size_t>(n)))
            handle_line(line);
    }

    for (const auto& line : framer_.finish())
        handle_line(line);

    wait_for_in_flight();
    log::info("Input closed, server stopping");
    running_ = false;
    return clean;
}

void StdioServer::handle_line(const std::string& line)
{
    mcp::Message message;
    try
    {
        message = mcp::decode_message(line);
    }
    catch (const ParseError& e)
    {
        log::warn(std::string("Error parsing JSON-RPC message: ") + e.what());
        sink_.write(mcp::make_error(Json(), mcp::ErrorObject{ErrorCode::ParseError,
                                                             "Invalid JSON-RPC message",
                                                             std::nullopt}));
        return;
    }
    spawn(std::move(message));
}

void StdioServer::spawn(mcp::Message message)
{
    auto work = [this](const mcp::Message& msg)
    {
        try
        {
            if (auto reply = handler_(msg))
                sink_.write(*reply);
        }
        catch (const std::exception& e)
        {
            log::error(std::string("Handler failed for ") + msg.method + ": " + e.what());
            if (!msg.is_notification())
                sink_.write(mcp::make_error(*msg.id, mcp::map_exception(e)));
        }
    };

    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        ++in_flight_;
    }

    auto finish = [this]()
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        --in_flight_;
        tasks_cv_.notify_all();
    };

    auto shared = std::make_shared<const mcp::Message>(std::move(message));
    try
    {
        std::thread(
            [work, finish, shared]()
            {
                work(*shared);
                finish();
            })
            .detach();
    }
    catch (const std::system_error& e)
    {
        // No thread available: answer on the reader thread instead.
        log::warn(std::string("Could not start worker thread: ") + e.what());
        work(*shared);
        finish();
    }
}

void StdioServer::wait_for_in_flight()
{
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    tasks_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

} // namespace visionmcp::server
