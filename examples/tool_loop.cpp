// Example: describe a few C++ functions as tools, print what each provider
// sees, and (when OPENAI_API_KEY is set) run one chat turn with tool calling.
//
//   OPENAI_API_KEY=sk-... OPENAI_BASE_URL=http://localhost:8080 ./llmtools_example_tool_loop

#include "llmtools.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace
{

struct Inventory
{
    int apples{12};
    int count(const std::string& item) const
    {
        return item == "apple" ? apples : 0;
    }
};

std::string greet(std::string name, std::optional<std::string> greeting)
{
    return greeting.value_or("Hello") + ", " + name + "!";
}

} // namespace

int main()
{
    using namespace llmtools;

    auto settings = Settings::from_env();
    settings.apply_logging();

    Inventory inventory;

    // ============================================================================
    // Step 1: Describe the tools
    // ============================================================================

    auto add = tools::make_callable("add", [](int a, int b) { return a + b; })
                   .doc("Add two integers.")
                   .param("a", "First addend")
                   .param("b", "Second addend");
    auto hello = tools::make_callable("greet", greet)
                     .doc("Greet someone by name.")
                     .param("name", "Who to greet")
                     .param("greeting", "Greeting word, defaults to Hello");
    auto stock = tools::make_callable("stock", &Inventory::count, &inventory)
                     .doc("How many of an item are in stock.")
                     .param("item", "Item name, e.g. apple");

    tools::ToolRegistry::Options registry_options;
    registry_options.max_schema_depth = settings.max_schema_depth;

    providers::openai::OpenAIToolRegistry openai(registry_options);
    providers::gemini::GeminiToolRegistry gemini(registry_options);
    for (const auto& fn : {add, hello, stock})
    {
        openai.register_tool(fn);
        gemini.register_tool(fn);
    }

    std::cout << "=== chat-completions tools ===\n" << openai.manifest().dump(2) << "\n\n";
    std::cout << "=== Gemini function declarations ===\n" << gemini.manifest().dump(2) << "\n\n";

    // ============================================================================
    // Step 2: One turn against a live endpoint
    // ============================================================================

    const char* api_key = std::getenv("OPENAI_API_KEY");
    if (api_key == nullptr)
    {
        std::cout << "OPENAI_API_KEY not set; skipping the live turn.\n";
        return 0;
    }
    const char* base_url = std::getenv("OPENAI_BASE_URL");

    providers::openai::HttpChatTransport::Options transport_options;
    transport_options.api_key = api_key;
    providers::openai::HttpChatTransport transport(base_url ? base_url : "https://api.openai.com",
                                                   transport_options);

    providers::openai::ChatOptions chat_options;
    chat_options.completion.model = "gpt-4o-mini";
    chat_options.system_instruction = "Answer briefly. Use tools when they help.";
    chat_options.loop = settings.loop_options();
    providers::openai::OpenAIChat chat(transport, &openai, chat_options);

    try
    {
        auto result = chat.ask("What is 17 + 25, and how many apples are in stock?");
        std::cout << "Assistant: " << result.content << "\n";
        if (result.capped)
            std::cout << "(stopped after " << settings.max_iterations << " tool rounds)\n";
    }
    catch (const Error& e)
    {
        std::cerr << "Chat failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
