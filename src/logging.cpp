#include "llmtools/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace llmtools::log
{

namespace
{
std::mutex& sink_mutex()
{
    static std::mutex m;
    return m;
}

Sink& current_sink()
{
    static Sink sink;
    return sink;
}

std::atomic<int>& threshold()
{
    static std::atomic<int> t{static_cast<int>(Level::Info)};
    return t;
}
} // namespace

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    return Level::Info;
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

void set_level(Level level)
{
    threshold().store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(threshold().load());
}

void write(Level level, const std::string& message)
{
    if (static_cast<int>(level) < threshold().load())
        return;

    std::lock_guard<std::mutex> lock(sink_mutex());
    auto& sink = current_sink();
    if (sink)
    {
        sink(level, message);
        return;
    }
    // Default: print to stderr
    std::cerr << "[llmtools] " << to_string(level) << " " << message << std::endl;
}

} // namespace llmtools::log
