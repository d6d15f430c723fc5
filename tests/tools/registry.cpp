/// @file registry.cpp
/// @brief Tests for tool registration, lookup and removal

#include "llmtools/providers/openai/registry.hpp"
#include "llmtools/tools/registry.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace llmtools;
using namespace llmtools::tools;
using providers::openai::OpenAIToolRegistry;

static Callable make_add()
{
    return make_callable("add", [](int a, int b) { return a + b; })
        .doc("Add two integers.")
        .param("a", "First addend")
        .param("b", "Second addend");
}

static Callable make_echo()
{
    return make_callable("echo", [](std::string text) { return text; })
        .doc("Echo text back.")
        .param("text", "Text to echo");
}

void test_register_and_lookup()
{
    std::cout << "  test_register_and_lookup... " << std::flush;
    OpenAIToolRegistry reg;
    assert(reg.empty());
    reg.register_tool(make_echo());
    reg.register_tool(make_add());

    assert(reg.size() == 2);
    assert(reg.contains("add"));
    assert(!reg.contains("ADD"));
    assert(reg.names() == (std::vector<std::string>{"add", "echo"}));
    assert(reg.find("missing") == nullptr);
    assert(reg.get("add").description() == "Add two integers.");
    assert(reg.implementations().size() == 2);
    assert(reg.implementations().at("add").invoke(Json{{"a", 1}, {"b", 1}}) == 2);

    bool threw = false;
    try
    {
        reg.get("missing");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_duplicate_rejected()
{
    std::cout << "  test_duplicate_rejected... " << std::flush;
    OpenAIToolRegistry reg;
    reg.register_tool(make_add());

    auto other = make_callable("add", [](int a, int b) { return a * b; })
                     .doc("Multiply, not add.")
                     .param("a", "x")
                     .param("b", "y");
    bool threw = false;
    try
    {
        reg.register_tool(other);
    }
    catch (const RegistrationError& e)
    {
        threw = true;
        assert(std::string(e.what()) == "Tool 'add' is already registered.");
    }
    assert(threw);
    assert(reg.get("add").description() == "Add two integers.");
    std::cout << "PASSED\n";
}

void test_failed_registration_leaves_no_trace()
{
    std::cout << "  test_failed_registration_leaves_no_trace... " << std::flush;
    OpenAIToolRegistry reg;
    auto undocumented = make_callable("nodoc", [](int x) { return x; }).param("x", "Value");
    bool threw = false;
    try
    {
        reg.register_tool(undocumented);
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    assert(!reg.contains("nodoc"));
    assert(reg.empty());
    std::cout << "PASSED\n";
}

void test_unregister()
{
    std::cout << "  test_unregister... " << std::flush;
    OpenAIToolRegistry reg;
    reg.register_tool(make_add());
    reg.unregister("add");
    assert(!reg.contains("add"));

    bool threw = false;
    try
    {
        reg.unregister("add");
    }
    catch (const NotFoundError& e)
    {
        threw = true;
        assert(std::string(e.what()) == "Tool 'add' not found in the registry.");
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_explicit_registration()
{
    std::cout << "  test_explicit_registration... " << std::flush;
    OpenAIToolRegistry reg;
    Json params = {{"type", "object"},
                   {"title", "LookupArgs"},
                   {"properties", {{"unit", {{"$ref", "#/$defs/Unit"}, {"description", "Unit"}}}}},
                   {"$defs", {{"Unit", {{"type", "string"}, {"enum", Json::array({"c", "f"})}}}}}};
    reg.register_tool("weather", "Current weather.",
                      Callable("weather", [](const Json& args) { return args.at("unit"); }),
                      params);

    const auto& def = reg.get("weather");
    assert(!def.args_schema().has_value());
    assert(def.parameters()["properties"]["unit"]["enum"].size() == 2);
    assert(def.parameters()["additionalProperties"] == false);
    assert(!def.parameters().contains("$defs"));
    assert(!def.parameters().contains("title"));

    // Tools without parameters
    reg.register_tool("now", "Current time.",
                      Callable("now", [](const Json&) { return Json("12:00"); }), Json::object());
    assert(!reg.get("now").has_parameters());

    bool threw = false;
    try
    {
        reg.register_tool("blank", "", Callable("blank", [](const Json&) { return Json(); }),
                          Json::object());
    }
    catch (const RegistrationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_register_definition()
{
    std::cout << "  test_register_definition... " << std::flush;
    OpenAIToolRegistry reg;
    reg.register_tool(ToolDefinition("raw", "Prebuilt.",
                                      Callable("raw", [](const Json&) { return Json(1); })));
    assert(reg.contains("raw"));

    bool threw = false;
    try
    {
        reg.register_tool(ToolDefinition("hollow", "No implementation.", Callable()));
    }
    catch (const RegistrationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_name_override()
{
    std::cout << "  test_name_override... " << std::flush;
    OpenAIToolRegistry reg;
    reg.register_tool(make_add(), std::string("plus"), std::string("Adds numbers."));
    assert(reg.contains("plus"));
    assert(!reg.contains("add"));
    assert(reg.get("plus").description() == "Adds numbers.");
    std::cout << "PASSED\n";
}

void test_scoped_tool()
{
    std::cout << "  test_scoped_tool... " << std::flush;
    OpenAIToolRegistry reg;
    {
        ScopedTool scoped(reg, make_echo());
        assert(scoped.name() == "echo");
        assert(reg.contains("echo"));
    }
    assert(!reg.contains("echo"));

    {
        ScopedTool scoped(reg, make_echo());
        reg.unregister("echo");
    } // already gone; destructor must not throw
    assert(reg.empty());
    std::cout << "PASSED\n";
}

void test_depth_option()
{
    std::cout << "  test_depth_option... " << std::flush;
    ToolRegistry::Options options;
    options.max_schema_depth = 1;
    OpenAIToolRegistry reg(options);
    assert(reg.options().max_schema_depth == 1);

    auto nested = make_callable("nested", [](const Json& v) { return v; })
                      .doc("Nested input.")
                      .param("v", "Value")
                      .define("Outer", Json{{"type", "object"},
                                            {"properties", {{"inner", {{"$ref", "#/$defs/Inner"}}}}}})
                      .define("Inner", Json{{"type", "string"}})
                      .param_schema("v", Json{{"$ref", "#/$defs/Outer"}});
    bool threw = false;
    try
    {
        reg.register_tool(nested);
    }
    catch (const SchemaDepthError&)
    {
        threw = true;
    }
    assert(threw);
    assert(!reg.contains("nested"));

    OpenAIToolRegistry roomy;
    roomy.register_tool(nested);
    assert(roomy.contains("nested"));
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Tool Registry Tests\n";
    std::cout << "===================\n";
    try
    {
        test_register_and_lookup();
        test_duplicate_rejected();
        test_failed_registration_leaves_no_trace();
        test_unregister();
        test_explicit_registration();
        test_register_definition();
        test_name_override();
        test_scoped_tool();
        test_depth_option();
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}
