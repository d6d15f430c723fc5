#include "llmtools/tools/registry.hpp"

#include "llmtools/logging.hpp"
#include "llmtools/schema/introspect.hpp"
#include "llmtools/schema/sanitizer.hpp"

#include <algorithm>

namespace llmtools::tools
{

namespace
{
[[noreturn]] void registration_failure(const std::string& msg)
{
    log::error(msg);
    throw RegistrationError(msg);
}
} // namespace

void ToolRegistry::register_tool(ToolDefinition tool)
{
    if (tool.name().empty())
        registration_failure("Tool definition has no name.");
    if (!tool.callable())
        registration_failure("Tool '" + tool.name() + "' has no implementation.");
    insert(std::move(tool));
}

void ToolRegistry::register_tool(const std::string& name, const std::string& description,
                                 Callable impl, Json parameters)
{
    if (name.empty())
        registration_failure("If passing a name, it must not be empty.");
    if (!impl)
        registration_failure("If passing name as string, an implementation is required.");
    if (description.empty())
        registration_failure("If passing name and parameters, description is required.");

    Json schema = Json::object();
    if (parameters.is_object() && !parameters.empty())
        schema = schema::sanitize(schema::resolve(parameters, options_.max_schema_depth));
    else if (!parameters.is_null() && !parameters.is_object())
        registration_failure("Parameters for tool '" + name + "' must be a JSON object schema.");

    insert(ToolDefinition(name, description, std::move(impl), std::move(schema)));
}

void ToolRegistry::register_tool(const Callable& fn, const std::optional<std::string>& name,
                                 const std::optional<std::string>& description)
{
    if (!fn)
        registration_failure("Tool '" + name.value_or(fn.name()) + "' has no implementation.");
    if (name.value_or(fn.name()).empty())
        registration_failure("Callable has no name; pass one explicitly.");
    insert(schema::introspect(fn, name, description, options_.max_schema_depth));
}

void ToolRegistry::insert(ToolDefinition tool)
{
    if (contains(tool.name()))
        registration_failure("Tool '" + tool.name() + "' is already registered.");
    std::string name = tool.name();
    tools_.emplace(name, std::move(tool));
    log::info("Successfully registered tool: '" + name + "'");
}

void ToolRegistry::unregister(const std::string& name)
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        throw NotFoundError("Tool '" + name + "' not found in the registry.");
    tools_.erase(it);
    log::info("Successfully unregistered tool: '" + name + "'");
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const
{
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

const ToolDefinition& ToolRegistry::get(const std::string& name) const
{
    if (const auto* tool = find(name))
        return *tool;
    throw NotFoundError("Tool '" + name + "' not found in the registry.");
}

std::vector<std::string> ToolRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& kv : tools_)
        out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::unordered_map<std::string, Callable> ToolRegistry::implementations() const
{
    std::unordered_map<std::string, Callable> out;
    for (const auto& [name, tool] : tools_)
        out.emplace(name, tool.callable());
    return out;
}

ScopedTool::ScopedTool(ToolRegistry& registry, const Callable& fn,
                       const std::optional<std::string>& name,
                       const std::optional<std::string>& description)
    : registry_(registry), name_(name.value_or(fn.name()))
{
    registry_.register_tool(fn, name, description);
    log::debug("ScopedTool loaded '" + name_ + "'.");
}

ScopedTool::~ScopedTool()
{
    try
    {
        registry_.unregister(name_);
        log::debug("ScopedTool unloaded '" + name_ + "'.");
    }
    catch (const NotFoundError&)
    {
        log::debug("ScopedTool '" + name_ + "' was already unregistered.");
    }
}

} // namespace llmtools::tools
