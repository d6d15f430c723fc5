#include "llmtools/providers/gemini/adapter.hpp"

#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"

namespace llmtools::providers::gemini
{

std::vector<ToolCallRequest> GeminiToolAdapter::extract_calls(const Json& response)
{
    std::vector<ToolCallRequest> calls;
    if (!response.is_object() || !response.contains("candidates") ||
        !response["candidates"].is_array() || response["candidates"].empty())
        return calls;

    const auto& candidate = response["candidates"][0];
    if (!candidate.is_object() || !candidate.contains("content") ||
        !candidate["content"].is_object() || !candidate["content"].contains("parts") ||
        !candidate["content"]["parts"].is_array())
        return calls;

    for (const auto& part : candidate["content"]["parts"])
    {
        if (!part.is_object() || !part.contains("functionCall"))
            continue;
        const auto& fc = part["functionCall"];
        if (!fc.is_object() || !fc.contains("name") || !fc["name"].is_string())
        {
            log::warning("Skipping malformed functionCall part: " + part.dump());
            continue;
        }
        ToolCallRequest call;
        call.name = fc["name"].get<std::string>();
        call.arguments = fc.contains("args") ? fc["args"] : Json();
        if (fc.contains("id") && fc["id"].is_string())
            call.call_id = fc["id"].get<std::string>();
        calls.push_back(std::move(call));
    }
    return calls;
}

Json GeminiToolAdapter::build_result_message(const ToolCallResult& result)
{
    Json fr = {{"name", result.name}, {"response", result.response}};
    if (result.call_id)
        fr["id"] = *result.call_id;
    return Json{{"functionResponse", std::move(fr)}};
}

Json GeminiToolAdapter::send_results(const std::vector<Json>& messages)
{
    if (!send_)
        throw Error("GeminiToolAdapter has no send function");
    Json parts = Json::array();
    for (const auto& m : messages)
        parts.push_back(m);
    return send_(parts);
}

} // namespace llmtools::providers::gemini
