#pragma once
#include "llmtools/providers/openai/registry.hpp"
#include "llmtools/tools/adapter.hpp"

#include <string>
#include <vector>

namespace llmtools::test
{

/// Adapter over a toy response format: {"calls":[{"name","arguments","id"}], "text": ...}.
/// Replays scripted responses and records everything the loop sends.
class ScriptedAdapter : public tools::ToolAdapter
{
  public:
    explicit ScriptedAdapter(std::vector<Json> script) : script_(std::move(script)) {}

    std::vector<ToolCallRequest> extract_calls(const Json& response) override
    {
        std::vector<ToolCallRequest> calls;
        if (!response.contains("calls"))
            return calls;
        for (const auto& c : response["calls"])
        {
            ToolCallRequest call;
            call.name = c.value("name", "");
            call.arguments = c.contains("arguments") ? c["arguments"] : Json();
            if (c.contains("id"))
                call.call_id = c["id"].get<std::string>();
            calls.push_back(std::move(call));
        }
        return calls;
    }

    void record_assistant_message(const Json& response) override
    {
        events.push_back("record");
        history.push_back(response);
    }

    Json build_result_message(const ToolCallResult& result) override
    {
        Json msg = {{"name", result.name}, {"response", result.response}};
        if (result.call_id)
            msg["id"] = *result.call_id;
        return msg;
    }

    Json send_results(const std::vector<Json>& messages) override
    {
        events.push_back("send");
        batches.push_back(messages);
        if (next_ < script_.size())
            return script_[next_++];
        return script_.empty() ? Json::object() : script_.back();
    }

    std::vector<std::string> events;
    std::vector<Json> history;
    std::vector<std::vector<Json>> batches;

  private:
    std::vector<Json> script_;
    size_t next_{0};
};

inline Json call(const std::string& name, Json arguments, const std::string& id)
{
    return Json{{"name", name}, {"arguments", std::move(arguments)}, {"id", id}};
}

inline Json calls(std::vector<Json> list)
{
    Json arr = Json::array();
    for (auto& c : list)
        arr.push_back(std::move(c));
    return Json{{"calls", arr}};
}

inline Json answer(const std::string& text)
{
    return Json{{"text", text}};
}

inline void register_add(tools::ToolRegistry& reg)
{
    reg.register_tool(tools::make_callable("add", [](int a, int b) { return a + b; })
                          .doc("Add two integers.")
                          .param("a", "First addend")
                          .param("b", "Second addend"));
}

} // namespace llmtools::test
