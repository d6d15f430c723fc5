#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace llmtools
{

using Json = nlohmann::json;

/// Outcome of one tool invocation: exactly one of "result" or "error".
struct ToolCallResult
{
    std::string name;
    Json response;
    std::optional<std::string> call_id;

    static ToolCallResult ok(std::string name, Json value,
                             std::optional<std::string> call_id = std::nullopt)
    {
        return ToolCallResult{std::move(name), Json{{"result", std::move(value)}},
                              std::move(call_id)};
    }

    static ToolCallResult error(std::string name, const std::string& message,
                                std::optional<std::string> call_id = std::nullopt)
    {
        return ToolCallResult{std::move(name), Json{{"error", message}}, std::move(call_id)};
    }

    bool is_error() const
    {
        return response.is_object() && response.contains("error");
    }
};

/// A model-issued request to run a tool. Arguments stay opaque until the loop
/// normalizes them: null (absent), a JSON-encoded string, or a structured value.
struct ToolCallRequest
{
    std::string name;
    Json arguments;
    std::optional<std::string> call_id;
};

// nlohmann::json adapters
inline void to_json(Json& j, const ToolCallRequest& call)
{
    j = Json{{"name", call.name}, {"arguments", call.arguments}};
    if (call.call_id)
        j["id"] = *call.call_id;
}

inline void from_json(const Json& j, ToolCallRequest& call)
{
    call.name = j.at("name").get<std::string>();
    call.arguments = j.value("arguments", Json());
    if (j.contains("id") && j["id"].is_string())
        call.call_id = j["id"].get<std::string>();
}

inline void to_json(Json& j, const ToolCallResult& result)
{
    j = Json{{"name", result.name}, {"response", result.response}};
    if (result.call_id)
        j["id"] = *result.call_id;
}

} // namespace llmtools
