#include "llmtools/providers/openai/registry.hpp"

namespace llmtools::providers::openai
{

Json OpenAIToolRegistry::manifest() const
{
    Json tools = Json::array();
    for (const auto& name : names())
    {
        const auto& tool = get(name);
        Json function = {{"name", tool.name()}, {"description", tool.description()}};
        if (tool.has_parameters())
            function["parameters"] = tool.parameters();
        else
            function["parameters"] = Json{{"type", "object"}, {"properties", Json::object()}};
        tools.push_back(Json{{"type", "function"}, {"function", function}});
    }
    return tools;
}

} // namespace llmtools::providers::openai
