#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace visionmcp::server
{

/**
 * Splits a byte stream into newline-delimited lines.
 *
 * Input may arrive in arbitrary chunks: a line split across several feed()
 * calls is buffered until its '\n' shows up, and a chunk holding several
 * lines yields all of them at once. Lines are trimmed of surrounding
 * whitespace (so "\r\n" endings work) and blank lines are dropped.
 *
 * The pending buffer is unbounded: a peer that never sends '\n' grows it
 * without limit.
 */
class LineFramer
{
  public:
    /// Append a chunk and return every line it completed, in order.
    std::vector<std::string> feed(const char* data, std::size_t size);

    std::vector<std::string> feed(const std::string& chunk)
    {
        return feed(chunk.data(), chunk.size());
    }

    /// End of input: return the unterminated tail, if it is not blank.
    std::vector<std::string> finish();

    std::size_t buffered() const
    {
        return buffer_.size();
    }

  private:
    std::string buffer_;
};

} // namespace visionmcp::server
