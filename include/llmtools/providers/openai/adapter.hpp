#pragma once
#include "llmtools/providers/openai/transport.hpp"
#include "llmtools/tools/adapter.hpp"

#include <string>

namespace llmtools::providers::openai
{

struct CompletionParams
{
    std::string model;
    double temperature{1.0};
    int max_tokens{3000};
};

/// Builds a chat-completions request body from a message list and a tool manifest.
Json make_request(const CompletionParams& params, const Json& messages, const Json& tools);

/// Chat-completions flavour of ToolAdapter. Appends to a caller-owned message list.
class OpenAIToolAdapter : public tools::ToolAdapter
{
  public:
    OpenAIToolAdapter(ChatTransport& transport, Json& messages, Json tools,
                      CompletionParams params)
        : transport_(transport), messages_(messages), tools_(std::move(tools)),
          params_(std::move(params))
    {
    }

    std::vector<ToolCallRequest> extract_calls(const Json& response) override;
    void record_assistant_message(const Json& response) override;
    Json build_result_message(const ToolCallResult& result) override;
    Json send_results(const std::vector<Json>& messages) override;

  private:
    ChatTransport& transport_;
    Json& messages_;
    Json tools_;
    CompletionParams params_;
};

/// choices[0].message of a completion, or nullptr when there is none.
const Json* first_message(const Json& response);

} // namespace llmtools::providers::openai
