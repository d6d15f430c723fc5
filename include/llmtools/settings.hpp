#pragma once
#include "llmtools/schema/resolver.hpp"
#include "llmtools/tools/loop.hpp"
#include "llmtools/types.hpp"

#include <string>

namespace llmtools
{

/// Largest accepted tool timeout, about 31 years.
constexpr double MAX_TOOL_TIMEOUT_SECONDS = 1e9;

struct Settings
{
    std::string log_level{"INFO"};
    int max_iterations{5};
    double tool_timeout_seconds{180.0};
    int max_schema_depth{schema::DEFAULT_MAX_DEPTH};

    /// Reads LLMTOOLS_LOG_LEVEL, LLMTOOLS_MAX_ITERATIONS, LLMTOOLS_TOOL_TIMEOUT
    /// and LLMTOOLS_MAX_SCHEMA_DEPTH. Malformed numbers, and timeouts that are
    /// negative or above MAX_TOOL_TIMEOUT_SECONDS, throw ValidationError.
    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Throws ValidationError when tool_timeout_seconds is out of range.
    tools::LoopOptions loop_options() const;
    void apply_logging() const;
};

} // namespace llmtools
