#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/schema/resolver.hpp"
#include "llmtools/tools/callable.hpp"
#include "llmtools/tools/tool.hpp"
#include "llmtools/types.hpp"

#include <optional>
#include <string>

namespace llmtools::schema
{

/// Builds the raw, reference-carrying parameter schema of a signature:
/// {"type":"object","title":"<tool>Params","properties":{...},"required":[...],"$defs":{...}}
///
/// Every parameter must carry a description; parameters without a default are
/// required. Throws ValidationError for an undescribed, unnamed or variadic parameter.
Json build_raw_schema(const tools::Signature& signature, const std::string& tool_name);

/// Turns a callable into a ToolDefinition: description from @p description or
/// the callable's doc, then raw schema -> cycle check -> inlining -> sanitizing.
/// The resolved (pre-sanitize) schema becomes the argument validation model.
tools::ToolDefinition introspect(const tools::Callable& callable,
                                 const std::optional<std::string>& name = std::nullopt,
                                 const std::optional<std::string>& description = std::nullopt,
                                 int max_depth = DEFAULT_MAX_DEPTH);

} // namespace llmtools::schema
