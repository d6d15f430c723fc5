#include "llmtools/settings.hpp"

#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace llmtools
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

template <typename T, typename Parse>
static T getenv_number(const char* key, T defv, Parse parse)
{
    const char* v = std::getenv(key);
    if (v == nullptr || *v == '\0')
        return defv;
    try
    {
        size_t used = 0;
        T value = parse(std::string(v), &used);
        if (used != std::string(v).size())
            throw std::invalid_argument(v);
        return value;
    }
    catch (const std::logic_error&)
    {
        throw ValidationError(std::string("Invalid value for ") + key + ": '" + v + "'");
    }
}

// Keeps the seconds -> milliseconds conversion well inside the integer range.
static double checked_timeout(double seconds, const std::string& source)
{
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > MAX_TOOL_TIMEOUT_SECONDS)
        throw ValidationError("Invalid tool timeout from " + source + ": " +
                              std::to_string(seconds) + " (expected 0 to " +
                              std::to_string(static_cast<long long>(MAX_TOOL_TIMEOUT_SECONDS)) +
                              " seconds)");
    return seconds;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("LLMTOOLS_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.max_iterations = getenv_number<int>(
        "LLMTOOLS_MAX_ITERATIONS", s.max_iterations,
        [](const std::string& t, size_t* used) { return std::stoi(t, used); });
    s.tool_timeout_seconds = getenv_number<double>(
        "LLMTOOLS_TOOL_TIMEOUT", s.tool_timeout_seconds,
        [](const std::string& t, size_t* used) { return std::stod(t, used); });
    s.tool_timeout_seconds = checked_timeout(s.tool_timeout_seconds, "LLMTOOLS_TOOL_TIMEOUT");
    s.max_schema_depth = getenv_number<int>(
        "LLMTOOLS_MAX_SCHEMA_DEPTH", s.max_schema_depth,
        [](const std::string& t, size_t* used) { return std::stoi(t, used); });
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("max_iterations"))
        s.max_iterations = j.at("max_iterations").get<int>();
    if (j.contains("tool_timeout"))
        s.tool_timeout_seconds =
            checked_timeout(j.at("tool_timeout").get<double>(), "tool_timeout");
    if (j.contains("max_schema_depth"))
        s.max_schema_depth = j.at("max_schema_depth").get<int>();
    return s;
}

tools::LoopOptions Settings::loop_options() const
{
    tools::LoopOptions options;
    options.max_iterations = max_iterations;
    double seconds = checked_timeout(tool_timeout_seconds, "tool_timeout_seconds");
    options.tool_timeout = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(seconds * 1000.0));
    return options;
}

void Settings::apply_logging() const
{
    log::set_level(log::level_from_string(log_level));
}

} // namespace llmtools
