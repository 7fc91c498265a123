#include "visionmcp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace visionmcp::log
{
namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::mutex& stream_mutex()
{
    static std::mutex m;
    return m;
}

const char* label(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "";
}
} // namespace

Level level_from_string(const std::string& name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (s == "DEBUG")
        return Level::Debug;
    if (s == "WARN" || s == "WARNING")
        return Level::Warn;
    if (s == "ERROR")
        return Level::Error;
    if (s == "OFF" || s == "NONE")
        return Level::Off;
    return Level::Info;
}

void set_level(Level level)
{
    g_level.store(static_cast<int>(level));
}

void write(Level lvl, const std::string& message)
{
    if (lvl == Level::Off || static_cast<int>(lvl) < g_level.load())
        return;
    std::lock_guard<std::mutex> lock(stream_mutex());
    std::cerr << "[visionmcp] " << label(lvl) << ": " << message << std::endl;
}

} // namespace visionmcp::log
