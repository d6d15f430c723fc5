#pragma once
#include <functional>
#include <string>

namespace llmtools::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(Level level);

/// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (case-insensitive); unknown -> Info.
Level level_from_string(const std::string& s);

using Sink = std::function<void(Level, const std::string&)>;

/// Replace the process-wide sink. Passing nullptr restores the stderr default.
void set_sink(Sink sink);
void set_level(Level level);
Level level();

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace llmtools::log
