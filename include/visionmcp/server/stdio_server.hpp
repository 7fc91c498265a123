#pragma once
#include "visionmcp/mcp/handler.hpp"
#include "visionmcp/server/line_framer.hpp"
#include "visionmcp/server/output_sink.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>

namespace visionmcp::server
{

/**
 * Line-delimited JSON-RPC over a file descriptor and an output stream.
 *
 * Usage:
 *   auto handler = visionmcp::mcp::make_mcp_handler(info, settings, tool);
 *   StdioServer server(handler);
 *   server.run();  // Blocking - returns at EOF on stdin
 *
 * Each framed line is decoded on the reader thread and handed to its own
 * worker thread, so a slow tools/call never stalls reading. Replies are
 * written as soon as their worker finishes; clients must match them by id.
 * Malformed JSON is answered immediately with a ParseError carrying a null id.
 */
class StdioServer
{
  public:
    /**
     * @param handler  Decoded message -> reply envelope (nullopt for notifications).
     * @param input_fd Descriptor to read from (stdin by default).
     * @param out      Stream replies are written to (stdout by default).
     */
    explicit StdioServer(mcp::McpHandler handler, int input_fd = 0, std::ostream& out = std::cout);

    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /**
     * Read until EOF or a read error, then wait for in-flight calls to write
     * their replies.
     *
     * @return true on clean EOF, false if reading failed or already running
     */
    bool run();

    bool running() const
    {
        return running_.load();
    }

    std::size_t in_flight() const;

  private:
    void handle_line(const std::string& line);
    void spawn(mcp::Message message);
    void wait_for_in_flight();

    mcp::McpHandler handler_;
    int input_fd_;
    OutputSink sink_;
    LineFramer framer_;
    std::atomic<bool> running_{false};

    mutable std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    std::size_t in_flight_{0};
};

} // namespace visionmcp::server
