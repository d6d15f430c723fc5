#pragma once
#include "llmtools/tools/registry.hpp"

namespace llmtools::providers::gemini
{

/// Drops "additionalProperties" from every subschema and trims "required" to
/// the names declared under "properties" (removing it when nothing survives).
/// Only schema positions are visited, so property names are never touched.
Json sanitize_for_gemini(const Json& schema);

/// Tool listing in the generateContent shape:
/// {"function_declarations":[{"name","description","parameters"?}]}, or null when empty.
class GeminiToolRegistry : public tools::ToolRegistry
{
  public:
    using tools::ToolRegistry::ToolRegistry;

    Json manifest() const override;
};

} // namespace llmtools::providers::gemini
