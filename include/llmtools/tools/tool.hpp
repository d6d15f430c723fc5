#pragma once
#include "llmtools/tools/callable.hpp"
#include "llmtools/types.hpp"

#include <optional>
#include <string>

namespace llmtools::tools
{

/// A registered tool: name, description, implementation and the resolved,
/// sanitized parameter schema. Immutable once constructed.
class ToolDefinition
{
  public:
    ToolDefinition() = default;

    ToolDefinition(std::string name, std::string description, Callable callable,
                   Json parameters = Json::object(),
                   std::optional<Json> args_schema = std::nullopt)
        : name_(std::move(name)), description_(std::move(description)),
          callable_(std::move(callable)), parameters_(std::move(parameters)),
          args_schema_(std::move(args_schema))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Callable& callable() const
    {
        return callable_;
    }
    /// Object schema advertised to providers; an empty object when the tool takes nothing.
    const Json& parameters() const
    {
        return parameters_;
    }
    /// Schema arguments are validated and coerced against before invocation.
    const std::optional<Json>& args_schema() const
    {
        return args_schema_;
    }
    bool has_parameters() const
    {
        return parameters_.is_object() && !parameters_.empty();
    }

    Json invoke(const Json& args) const
    {
        return callable_.invoke(args);
    }

  private:
    std::string name_;
    std::string description_;
    Callable callable_;
    Json parameters_ = Json::object();
    std::optional<Json> args_schema_;
};

} // namespace llmtools::tools
