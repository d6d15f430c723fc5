#pragma once
#include "llmtools/tools/adapter.hpp"
#include "llmtools/tools/registry.hpp"
#include "llmtools/types.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace llmtools::tools
{

enum class LoopState
{
    AwaitingResponse,
    Dispatching,
    Responding,
    Done,      ///< The last response carried no tool calls
    CappedExit ///< Iteration budget exhausted; the last response may still request calls
};

std::string to_string(LoopState state);

struct LoopOptions
{
    using ArgumentErrorFormatter =
        std::function<std::string(const std::string& tool_name, const std::string& error)>;

    int max_iterations{5};
    /// Per-call deadline; ten years or more means no deadline.
    std::chrono::milliseconds tool_timeout{std::chrono::seconds(180)};
    /// Formats argument-parsing failures; defaults to
    /// "Failed to parse arguments for tool '<name>': <error>".
    ArgumentErrorFormatter argument_error_formatter;
    /// Observes every state transition; optional.
    std::function<void(LoopState)> on_state;
};

struct LoopResult
{
    Json response;
    LoopState state{LoopState::Done};
    int iterations{0};

    bool capped() const
    {
        return state == LoopState::CappedExit;
    }
};

/// Provider-agnostic call -> execute -> respond state machine.
///
/// Each iteration asks the adapter for tool calls, runs all of them
/// concurrently against the registry (each on its own worker with its own
/// deadline), and sends one result message per call back through the adapter.
/// Recoverable failures become {"error": ...} payloads; any other exception
/// thrown by a tool aborts the turn and propagates to the caller of run().
class ToolExecutionLoop
{
  public:
    /// @param registry may be nullptr, in which case every call reports "not found".
    explicit ToolExecutionLoop(const ToolRegistry* registry, LoopOptions options = {});

    LoopResult run(const Json& initial_response, ToolAdapter& adapter) const;

    /// Executes one batch concurrently; results keep request order and call ids.
    std::vector<ToolCallResult> execute_batch(const std::vector<ToolCallRequest>& calls) const;

    ToolCallResult execute_call(const ToolCallRequest& call) const;

    /// Argument normalization: null/"" -> {}, object as-is, JSON text parsed
    /// (must decode to an object or null), array of [key, value] pairs folded into
    /// an object. Throws ExecutionError with the formatted message otherwise.
    Json normalize_arguments(const std::string& tool_name, const Json& raw) const;

    /// Returns the message of a recoverable exception, or std::nullopt if @p error is fatal.
    static std::optional<std::string> recoverable_message(const std::exception_ptr& error);

    const LoopOptions& options() const
    {
        return options_;
    }

  private:
    void transition(LoopState state) const;
    /// Result of a finished call; rethrows fatal exceptions.
    ToolCallResult settle(const ToolCallRequest& call, std::future<Json>& future) const;
    std::string format_argument_error(const std::string& tool_name,
                                      const std::string& error) const;

    const ToolRegistry* registry_;
    LoopOptions options_;
};

} // namespace llmtools::tools
