#pragma once
#include "llmtools/types.hpp"

#include <vector>

namespace llmtools::tools
{

/// Translates between one provider's native response/message shapes and the
/// generic call/result vocabulary driven by ToolExecutionLoop.
class ToolAdapter
{
  public:
    virtual ~ToolAdapter() = default;

    /// Tool-call requests carried by a provider response; empty when it is a final answer.
    virtual std::vector<ToolCallRequest> extract_calls(const Json& response) = 0;

    /// Appends the assistant turn (including any call intents) to the conversation history.
    virtual void record_assistant_message(const Json& response) = 0;

    /// Converts one result into the provider's tool-result message.
    virtual Json build_result_message(const ToolCallResult& result) = 0;

    /// Sends a batch of result messages and returns the provider's next response.
    virtual Json send_results(const std::vector<Json>& messages) = 0;
};

} // namespace llmtools::tools
