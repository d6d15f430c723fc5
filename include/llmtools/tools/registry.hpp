#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/schema/resolver.hpp"
#include "llmtools/tools/callable.hpp"
#include "llmtools/tools/tool.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmtools::tools
{

/// Owns the name -> ToolDefinition map and builds definitions on registration.
///
/// Lookups are exact and case-sensitive. The registry does no locking: callers
/// that mutate it while a ToolExecutionLoop is running must serialize access.
/// Provider variants implement manifest().
class ToolRegistry
{
  public:
    struct Options
    {
        int max_schema_depth{schema::DEFAULT_MAX_DEPTH};
    };

    ToolRegistry() = default;
    explicit ToolRegistry(Options options) : options_(options) {}
    virtual ~ToolRegistry() = default;

    /// Registers a ready-made definition as-is.
    void register_tool(ToolDefinition tool);

    /// Registers an implementation under an explicit name, description and schema.
    /// The schema is resolved and sanitized; an empty object means no parameters.
    void register_tool(const std::string& name, const std::string& description, Callable impl,
                       Json parameters);

    /// Introspects @p fn; @p name and @p description override its own.
    void register_tool(const Callable& fn, const std::optional<std::string>& name = std::nullopt,
                       const std::optional<std::string>& description = std::nullopt);

    /// Throws NotFoundError when @p name is not registered.
    void unregister(const std::string& name);

    bool contains(const std::string& name) const
    {
        return tools_.find(name) != tools_.end();
    }
    /// nullptr when absent.
    const ToolDefinition* find(const std::string& name) const;
    const ToolDefinition& get(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }
    const std::unordered_map<std::string, ToolDefinition>& definitions() const
    {
        return tools_;
    }
    /// Name -> callable view used for execution.
    std::unordered_map<std::string, Callable> implementations() const;

    const Options& options() const
    {
        return options_;
    }

    /// Provider-specific tool listing built from the registered definitions.
    virtual Json manifest() const = 0;

  protected:
    std::unordered_map<std::string, ToolDefinition> tools_;

  private:
    void insert(ToolDefinition tool);

    Options options_;
};

/// Registers a callable for the lifetime of the scope and unregisters it on exit.
class ScopedTool
{
  public:
    ScopedTool(ToolRegistry& registry, const Callable& fn,
               const std::optional<std::string>& name = std::nullopt,
               const std::optional<std::string>& description = std::nullopt);
    ScopedTool(const ScopedTool&) = delete;
    ScopedTool& operator=(const ScopedTool&) = delete;
    ~ScopedTool();

    const std::string& name() const
    {
        return name_;
    }

  private:
    ToolRegistry& registry_;
    std::string name_;
};

} // namespace llmtools::tools
