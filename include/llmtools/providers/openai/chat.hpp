#pragma once
#include "llmtools/providers/openai/adapter.hpp"
#include "llmtools/providers/openai/registry.hpp"
#include "llmtools/providers/openai/transport.hpp"
#include "llmtools/tools/loop.hpp"
#include "llmtools/util/retry.hpp"

#include <string>

namespace llmtools::providers::openai
{

struct ChatOptions
{
    CompletionParams completion;
    std::string system_instruction;
    tools::LoopOptions loop;
    util::RetryPolicy retry;
    /// Drop tool messages and bare tool-call turns from the returned history.
    bool clean_history{false};
};

struct ChatResult
{
    std::string content;
    Json messages = Json::array(); ///< Chat-completions history after the turn
    Json raw;                      ///< Final provider response
    bool capped{false};            ///< Iteration budget ran out with calls still pending
};

/// One chat-completions conversation turn with automatic tool calling.
class OpenAIChat
{
  public:
    /// @param registry may be nullptr for a tool-less chat.
    OpenAIChat(ChatTransport& transport, const OpenAIToolRegistry* registry, ChatOptions options);

    /// Retried as a whole on TransportError per options.retry.
    ChatResult chat(const Json& history, const std::string& prompt) const;

    /// Single turn without prior history.
    ChatResult ask(const std::string& prompt) const
    {
        return chat(Json::array(), prompt);
    }

    /// Removes tool results and content-less tool-call turns; strips tool_calls elsewhere.
    static Json clean_history(const Json& messages);

  private:
    ChatResult chat_once(const Json& history, const std::string& prompt) const;

    ChatTransport& transport_;
    const OpenAIToolRegistry* registry_;
    ChatOptions options_;
    tools::ToolExecutionLoop loop_;
};

} // namespace llmtools::providers::openai
