#include "llmtools/providers/gemini/registry.hpp"

#include <set>
#include <string>

namespace llmtools::providers::gemini
{

namespace
{
void trim_required(Json& node)
{
    if (!node.contains("required") || !node.contains("properties") ||
        !node["properties"].is_object() || !node["required"].is_array())
        return;

    Json kept = Json::array();
    std::set<std::string> seen;
    for (const auto& r : node["required"])
    {
        if (!r.is_string())
            continue;
        const auto& name = r.get_ref<const std::string&>();
        if (node["properties"].contains(name) && seen.insert(name).second)
            kept.push_back(r);
    }
    if (kept.empty())
        node.erase("required");
    else
        node["required"] = std::move(kept);
}
} // namespace

Json sanitize_for_gemini(const Json& schema)
{
    if (!schema.is_object())
        return schema;

    Json out = schema;
    out.erase("additionalProperties");

    if (out.contains("properties") && out["properties"].is_object())
        for (auto& sub : out["properties"])
            sub = sanitize_for_gemini(sub);

    for (const char* key : {"items", "not"})
    {
        if (!out.contains(key))
            continue;
        if (out[key].is_array())
            for (auto& sub : out[key])
                sub = sanitize_for_gemini(sub);
        else
            out[key] = sanitize_for_gemini(out[key]);
    }
    for (const char* key : {"prefixItems", "anyOf", "oneOf", "allOf"})
        if (out.contains(key) && out[key].is_array())
            for (auto& sub : out[key])
                sub = sanitize_for_gemini(sub);

    trim_required(out);
    return out;
}

Json GeminiToolRegistry::manifest() const
{
    if (empty())
        return Json();

    Json declarations = Json::array();
    for (const auto& name : names())
    {
        const auto& tool = get(name);
        Json decl = {{"name", tool.name()}, {"description", tool.description()}};
        if (tool.has_parameters())
            decl["parameters"] = sanitize_for_gemini(tool.parameters());
        declarations.push_back(std::move(decl));
    }
    return Json{{"function_declarations", std::move(declarations)}};
}

} // namespace llmtools::providers::gemini
