#include "visionmcp/server/line_framer.hpp"

namespace visionmcp::server
{

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
} // namespace

std::vector<std::string> LineFramer::feed(const char* data, std::size_t size)
{
    std::vector<std::string> lines;
    if (size == 0)
        return lines;

    // Only the new bytes can contain the next delimiter.
    std::size_t scan_from = buffer_.size();
    buffer_.append(data, size);

    std::size_t start = 0;
    std::size_t pos;
    while ((pos = buffer_.find('\n', scan_from)) != std::string::npos)
    {
        auto line = trim(buffer_.substr(start, pos - start));
        if (!line.empty())
            lines.push_back(std::move(line));
        start = pos + 1;
        scan_from = start;
    }
    buffer_.erase(0, start);
    return lines;
}

std::vector<std::string> LineFramer::finish()
{
    std::vector<std::string> lines;
    auto line = trim(buffer_);
    buffer_.clear();
    if (!line.empty())
        lines.push_back(std::move(line));
    return lines;
}

} // namespace visionmcp::server
