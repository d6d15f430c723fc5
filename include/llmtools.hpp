#pragma once

/// @file llmtools.hpp
/// @brief Main header for llmtools - includes commonly used components
///
/// Usage:
/// @code
/// #include <llmtools.hpp>
///
/// int add(int a, int b) { return a + b; }
///
/// int main() {
///     llmtools::providers::openai::OpenAIToolRegistry registry;
///     registry.register_tool(llmtools::tools::make_callable("add", add)
///                                .doc("Add two integers.")
///                                .param("a", "First addend")
///                                .param("b", "Second addend"));
///
///     llmtools::providers::openai::HttpChatTransport transport("https://api.openai.com");
///     llmtools::providers::openai::OpenAIChat chat(transport, &registry, {});
///     auto reply = chat.ask("What is 2 + 3?");
/// }
/// @endcode

// Core types and exceptions
#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"
#include "llmtools/settings.hpp"
#include "llmtools/types.hpp"

// Schema engine
#include "llmtools/schema/coerce.hpp"
#include "llmtools/schema/introspect.hpp"
#include "llmtools/schema/resolver.hpp"
#include "llmtools/schema/sanitizer.hpp"

// Tools and the execution loop
#include "llmtools/tools/adapter.hpp"
#include "llmtools/tools/callable.hpp"
#include "llmtools/tools/loop.hpp"
#include "llmtools/tools/registry.hpp"
#include "llmtools/tools/tool.hpp"
#include "llmtools/util/retry.hpp"

// Providers
#include "llmtools/providers/gemini/adapter.hpp"
#include "llmtools/providers/gemini/registry.hpp"
#include "llmtools/providers/openai/adapter.hpp"
#include "llmtools/providers/openai/chat.hpp"
#include "llmtools/providers/openai/registry.hpp"
#include "llmtools/providers/openai/transport.hpp"
