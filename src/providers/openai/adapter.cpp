#include "llmtools/providers/openai/adapter.hpp"

#include "llmtools/logging.hpp"

namespace llmtools::providers::openai
{

const Json* first_message(const Json& response)
{
    if (!response.is_object() || !response.contains("choices") ||
        !response["choices"].is_array() || response["choices"].empty())
        return nullptr;
    const auto& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        return nullptr;
    return &choice["message"];
}

Json make_request(const CompletionParams& params, const Json& messages, const Json& tools)
{
    Json request = {
        {"model", params.model},
        {"messages", messages},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens},
    };
    if (tools.is_array() && !tools.empty())
        request["tools"] = tools;
    return request;
}

std::vector<ToolCallRequest> OpenAIToolAdapter::extract_calls(const Json& response)
{
    std::vector<ToolCallRequest> calls;
    const Json* message = first_message(response);
    if (message == nullptr || !message->contains("tool_calls") ||
        !(*message)["tool_calls"].is_array())
        return calls;

    for (const auto& tc : (*message)["tool_calls"])
    {
        if (tc.is_object() && tc.contains("type") && tc["type"] != "function")
            continue;
        if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object())
        {
            log::warning("Skipping malformed tool call: " + tc.dump());
            continue;
        }
        const auto& fn = tc["function"];
        if (!fn.contains("name") || !fn["name"].is_string())
        {
            log::warning("Skipping tool call without a function name: " + tc.dump());
            continue;
        }
        ToolCallRequest call;
        call.name = fn["name"].get<std::string>();
        call.arguments = fn.contains("arguments") ? fn["arguments"] : Json();
        if (tc.contains("id") && tc["id"].is_string())
            call.call_id = tc["id"].get<std::string>();
        calls.push_back(std::move(call));
    }
    return calls;
}

void OpenAIToolAdapter::record_assistant_message(const Json& response)
{
    if (const Json* message = first_message(response))
        messages_.push_back(*message);
    else
        log::warning("Completion has no choices; nothing recorded to history.");
}

Json OpenAIToolAdapter::build_result_message(const ToolCallResult& result)
{
    return Json{
        {"role", "tool"},
        {"tool_call_id", result.call_id.value_or("")},
        {"name", result.name},
        {"content", result.response.dump()},
    };
}

Json OpenAIToolAdapter::send_results(const std::vector<Json>& messages)
{
    for (const auto& m : messages)
        messages_.push_back(m);
    return transport_.complete(make_request(params_, messages_, tools_));
}

} // namespace llmtools::providers::openai
