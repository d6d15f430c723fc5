#pragma once
#include "llmtools/tools/registry.hpp"

namespace llmtools::providers::openai
{

/// Tool listing in the chat-completions "tools" shape:
/// [{"type":"function","function":{"name","description","parameters"}}]
class OpenAIToolRegistry : public tools::ToolRegistry
{
  public:
    using tools::ToolRegistry::ToolRegistry;

    Json manifest() const override;
};

} // namespace llmtools::providers::openai
