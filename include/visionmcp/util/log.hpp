#pragma once
#include <string>

namespace visionmcp::log
{

enum class Level
{
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/// Parses DEBUG/INFO/WARN/WARNING/ERROR/OFF (any case). Unknown names map to Info.
Level level_from_string(const std::string& name);

void set_level(Level level);

/// Diagnostics go to stderr only; stdout carries protocol traffic.
void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace visionmcp::log
