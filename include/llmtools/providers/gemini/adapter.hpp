#pragma once
#include "llmtools/tools/adapter.hpp"

#include <functional>
#include <utility>

namespace llmtools::providers::gemini
{

/// Gemini flavour of ToolAdapter. History lives in the provider's chat
/// session, so the adapter only translates shapes and forwards parts to
/// the session through the send function.
class GeminiToolAdapter : public tools::ToolAdapter
{
  public:
    /// Receives the functionResponse parts for one iteration; returns the next response.
    using SendFn = std::function<Json(const Json& parts)>;

    explicit GeminiToolAdapter(SendFn send) : send_(std::move(send)) {}

    /// functionCall parts of candidates[0].content.parts, in order.
    std::vector<ToolCallRequest> extract_calls(const Json& response) override;
    void record_assistant_message(const Json&) override {}
    Json build_result_message(const ToolCallResult& result) override;
    Json send_results(const std::vector<Json>& messages) override;

  private:
    SendFn send_;
};

} // namespace llmtools::providers::gemini
