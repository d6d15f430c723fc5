#include "llmtools/schema/introspect.hpp"

#include "llmtools/logging.hpp"
#include "llmtools/schema/sanitizer.hpp"

#include <cctype>

namespace llmtools::schema
{

namespace
{

// "max_results" -> "Max Results"
std::string title_case(const std::string& name)
{
    std::string out;
    bool upper_next = true;
    for (char c : name)
    {
        if (c == '_')
        {
            out.push_back(' ');
            upper_next = true;
            continue;
        }
        out.push_back(upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                                 : c);
        upper_next = false;
    }
    return out;
}

[[noreturn]] void fail(const std::string& msg)
{
    log::error(msg);
    throw ValidationError(msg);
}

} // namespace

Json build_raw_schema(const tools::Signature& signature, const std::string& tool_name)
{
    Json properties = Json::object();
    Json required = Json::array();

    size_t position = 0;
    for (const auto& param : signature.params)
    {
        ++position;
        if (param.variadic)
            fail("Parameter '*" + param.name + "' in tool '" + tool_name +
                 "' accepts a variable number of arguments, which tools cannot describe. "
                 "Use a list parameter instead.");
        if (param.name.empty())
            fail("Parameter #" + std::to_string(position) + " in tool '" + tool_name +
                 "' has no name.\nUsage: .param(\"<name>\", \"<description>\")");
        if (!param.description || param.description->empty())
            fail("Parameter '" + param.name + "' in tool '" + tool_name +
                 "' is missing a description.\nUsage: .param(\"" + param.name +
                 "\", \"<description>\")");

        Json field = param.schema.is_object() ? param.schema : Json::object();
        field["title"] = title_case(param.name);
        field["description"] = *param.description;
        if (param.default_value)
            field["default"] = *param.default_value;
        else
            required.push_back(param.name);
        properties[param.name] = std::move(field);
    }

    Json schema = {
        {"type", "object"},
        {"title", tool_name + "Params"},
        {"properties", properties},
    };
    if (!required.empty())
        schema["required"] = required;
    if (signature.definitions.is_object() && !signature.definitions.empty())
        schema["$defs"] = signature.definitions;
    return schema;
}

tools::ToolDefinition introspect(const tools::Callable& callable,
                                 const std::optional<std::string>& name,
                                 const std::optional<std::string>& description, int max_depth)
{
    const auto& signature = callable.signature();
    std::string tool_name = name.value_or(signature.name);

    std::string tool_description;
    if (description && !description->empty())
        tool_description = *description;
    else if (signature.doc && !signature.doc->empty())
        tool_description = *signature.doc;
    else
        fail("Tool '" + tool_name +
             "' missing docstring. LLMs need a description of what the tool does.");

    Json raw = build_raw_schema(signature, tool_name);
    Json resolved = resolve(raw, max_depth);
    Json parameters = sanitize(resolved);

    log::debug("Introspected tool '" + tool_name + "': " + parameters.dump());
    // Validation keeps the unsanitized form so optional parameters still accept null
    // and defaults are filled in.
    return tools::ToolDefinition(tool_name, tool_description, callable, std::move(parameters),
                                 std::move(resolved));
}

} // namespace llmtools::schema
