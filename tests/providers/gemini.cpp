/// @file gemini.cpp
/// @brief Tests for the Gemini function-declaration registry and adapter

#include "llmtools/providers/gemini/adapter.hpp"
#include "llmtools/providers/gemini/registry.hpp"
#include "llmtools/tools/loop.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace llmtools;
using namespace llmtools::providers::gemini;

static bool has_key_anywhere(const Json& node, const std::string& key)
{
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
            if (it.key() == key || has_key_anywhere(it.value(), key))
                return true;
    }
    else if (node.is_array())
    {
        for (const auto& item : node)
            if (has_key_anywhere(item, key))
                return true;
    }
    return false;
}

static Json function_call_response(const std::vector<Json>& calls)
{
    Json parts = Json::array();
    for (const auto& c : calls)
        parts.push_back(Json{{"functionCall", c}});
    return Json{{"candidates", Json::array({Json{{"content", {{"role", "model"}, {"parts", parts}}}}})}};
}

static Json text_response(const std::string& text)
{
    Json parts = Json::array({Json{{"text", text}}});
    return Json{{"candidates", Json::array({Json{{"content", {{"role", "model"}, {"parts", parts}}}}})}};
}

void test_empty_manifest_is_null()
{
    std::cout << "  test_empty_manifest_is_null... " << std::flush;
    GeminiToolRegistry reg;
    assert(reg.manifest().is_null());
    std::cout << "PASSED\n";
}

void test_manifest_declarations()
{
    std::cout << "  test_manifest_declarations... " << std::flush;
    GeminiToolRegistry reg;
    reg.register_tool(tools::make_callable("move", [](const Json& to) { return to; })
                          .doc("Move somewhere.")
                          .param("to", "Destination")
                          .define("Point", Json{{"type", "object"},
                                                {"properties", {{"x", {{"type", "number"}}}}}})
                          .param_schema("to", Json{{"$ref", "#/$defs/Point"}}));
    reg.register_tool("ping", "Liveness check.",
                      tools::Callable("ping", [](const Json&) { return Json("pong"); }),
                      Json::object());

    auto manifest = reg.manifest();
    const auto& decls = manifest["function_declarations"];
    assert(decls.size() == 2);
    assert(decls[0]["name"] == "move");
    assert(decls[0]["parameters"]["properties"]["to"]["properties"]["x"]["type"] == "number");
    assert(!has_key_anywhere(decls[0]["parameters"], "additionalProperties"));
    // The registry's own definition stays closed
    assert(reg.get("move").parameters()["additionalProperties"] == false);

    assert(decls[1]["name"] == "ping");
    assert(!decls[1].contains("parameters"));
    std::cout << "PASSED\n";
}

void test_required_trimmed()
{
    std::cout << "  test_required_trimmed... " << std::flush;
    Json s = {{"type", "object"},
              {"properties", {{"a", {{"type", "string"}}}}},
              {"required", Json::array({"a", "ghost"})},
              {"additionalProperties", false}};
    auto out = sanitize_for_gemini(s);
    assert(out["required"] == Json::array({"a"}));
    assert(!out.contains("additionalProperties"));

    s["required"] = Json::array({"ghost"});
    assert(!sanitize_for_gemini(s).contains("required"));
    std::cout << "PASSED\n";
}

void test_property_names_untouched()
{
    std::cout << "  test_property_names_untouched... " << std::flush;
    Json s = {{"type", "object"},
              {"properties",
               {{"additionalProperties", {{"type", "boolean"}, {"description", "Allow extras"}}},
                {"rows",
                 {{"type", "array"},
                  {"items",
                   {{"type", "object"},
                    {"properties", {{"id", {{"type", "integer"}}}}},
                    {"required", Json::array({"id"})},
                    {"additionalProperties", false}}}}}}},
              {"required", Json::array({"additionalProperties"})},
              {"additionalProperties", false}};
    auto out = sanitize_for_gemini(s);
    assert(!out.contains("additionalProperties"));
    assert(out["properties"].contains("additionalProperties"));
    assert(out["properties"]["additionalProperties"]["type"] == "boolean");
    assert(out["required"] == Json::array({"additionalProperties"}));

    const auto& row = out["properties"]["rows"]["items"];
    assert(!row.contains("additionalProperties"));
    assert(row["required"] == Json::array({"id"}));
    std::cout << "PASSED\n";
}

void test_adapter_translation()
{
    std::cout << "  test_adapter_translation... " << std::flush;
    std::vector<Json> sent;
    GeminiToolAdapter adapter(
        [&sent](const Json& parts)
        {
            sent.push_back(parts);
            return text_response("done");
        });

    auto response = function_call_response(
        {Json{{"name", "add"}, {"args", {{"a", 1}, {"b", 2}}}, {"id", "fc-1"}},
         Json{{"name", "now"}}});
    auto calls = adapter.extract_calls(response);
    assert(calls.size() == 2);
    assert(calls[0].name == "add");
    assert(calls[0].arguments == (Json{{"a", 1}, {"b", 2}}));
    assert(calls[0].call_id == std::string("fc-1"));
    assert(calls[1].arguments.is_null());
    assert(!calls[1].call_id.has_value());
    assert(adapter.extract_calls(text_response("hi")).empty());
    assert(adapter.extract_calls(Json{{"candidates", Json::array()}}).empty());

    auto noisy = function_call_response(
        {Json{{"name", 7}}, Json("add"), Json{{"name", "add"}, {"args", Json::object()}}});
    calls = adapter.extract_calls(noisy);
    assert(calls.size() == 1);
    assert(calls[0].name == "add");

    auto part = adapter.build_result_message(ToolCallResult::ok("add", 3, std::string("fc-1")));
    assert(part == (Json{{"functionResponse",
                          {{"name", "add"}, {"response", {{"result", 3}}}, {"id", "fc-1"}}}}));
    auto bare = adapter.build_result_message(ToolCallResult::error("now", "nope"));
    assert(!bare["functionResponse"].contains("id"));

    auto next = adapter.send_results({part, bare});
    assert(next == text_response("done"));
    assert(sent.size() == 1 && sent[0].size() == 2);
    std::cout << "PASSED\n";
}

void test_loop_with_gemini()
{
    std::cout << "  test_loop_with_gemini... " << std::flush;
    GeminiToolRegistry reg;
    reg.register_tool(tools::make_callable("add", [](int a, int b) { return a + b; })
                          .doc("Add two integers.")
                          .param("a", "First addend")
                          .param("b", "Second addend"));

    std::vector<Json> sent;
    GeminiToolAdapter adapter(
        [&sent](const Json& parts)
        {
            sent.push_back(parts);
            return text_response("5");
        });
    tools::ToolExecutionLoop loop(&reg);
    auto result = loop.run(
        function_call_response({Json{{"name", "add"}, {"args", {{"a", 2}, {"b", 3}}}}}), adapter);

    assert(result.state == tools::LoopState::Done);
    assert(result.response == text_response("5"));
    assert(sent.size() == 1);
    assert(sent[0][0]["functionResponse"]["response"] == (Json{{"result", 5}}));
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Gemini Provider Tests\n";
    std::cout << "=====================\n";
    try
    {
        test_empty_manifest_is_null();
        test_manifest_declarations();
        test_required_trimmed();
        test_property_names_untouched();
        test_adapter_translation();
        test_loop_with_gemini();
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}
