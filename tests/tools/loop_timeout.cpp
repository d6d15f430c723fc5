/// @file loop_timeout.cpp
/// @brief Tests for per-call timeouts and concurrent dispatch

#include "llmtools/tools/loop.hpp"

#include "loop_helpers.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>

using namespace llmtools;
using namespace llmtools::tools;
using namespace llmtools::test;
using namespace std::chrono_literals;
using providers::openai::OpenAIToolRegistry;

static void register_sleepers(ToolRegistry& reg)
{
    reg.register_tool(make_callable("sleep_ms",
                                    [](int ms)
                                    {
                                        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                                        return ms;
                                    })
                          .doc("Sleep for a while.")
                          .param("ms", "Milliseconds"));

    reg.register_tool(make_async_callable("sleep_async",
                                          [](int ms)
                                          {
                                              return std::async(
                                                  std::launch::async,
                                                  [ms]()
                                                  {
                                                      std::this_thread::sleep_for(
                                                          std::chrono::milliseconds(ms));
                                                      return ms;
                                                  });
                                          })
                          .doc("Sleep asynchronously.")
                          .param("ms", "Milliseconds"));
}

void test_timeout_reported_as_error()
{
    std::cout << "  test_timeout_reported_as_error... " << std::flush;
    OpenAIToolRegistry reg;
    register_sleepers(reg);
    LoopOptions options;
    options.tool_timeout = 50ms;
    ToolExecutionLoop loop(&reg, options);

    auto r = loop.execute_call(ToolCallRequest{"sleep_ms", Json{{"ms", 600}}, std::string("c1")});
    assert(r.is_error());
    assert(r.call_id == std::string("c1"));
    auto msg = r.response["error"].get<std::string>();
    assert(msg.find("timed out") != std::string::npos);
    assert(msg == "Tool execution timed out after 0.05 seconds.");
    std::cout << "PASSED\n";
}

void test_siblings_unaffected_by_timeout()
{
    std::cout << "  test_siblings_unaffected_by_timeout... " << std::flush;
    OpenAIToolRegistry reg;
    register_sleepers(reg);
    register_add(reg);
    LoopOptions options;
    options.tool_timeout = 100ms;
    ToolExecutionLoop loop(&reg, options);

    auto start = std::chrono::steady_clock::now();
    auto results = loop.execute_batch({ToolCallRequest{"sleep_ms", Json{{"ms", 2000}}, "slow"},
                                       ToolCallRequest{"add", Json{{"a", 1}, {"b", 2}}, "fast"},
                                       ToolCallRequest{"sleep_async", Json{{"ms", 10}}, "async"}});
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(results.size() == 3);
    assert(results[0].call_id == std::string("slow"));
    assert(results[0].response["error"].get<std::string>().find("timed out") != std::string::npos);
    assert(results[1].response == (Json{{"result", 3}}));
    assert(results[2].response == (Json{{"result", 10}}));
    // The abandoned worker must not hold the batch hostage
    assert(elapsed < 1500ms);
    std::cout << "PASSED\n";
}

void test_async_timeout()
{
    std::cout << "  test_async_timeout... " << std::flush;
    OpenAIToolRegistry reg;
    register_sleepers(reg);
    LoopOptions options;
    options.tool_timeout = 30ms;
    ToolExecutionLoop loop(&reg, options);

    auto r = loop.execute_call(ToolCallRequest{"sleep_async", Json{{"ms", 500}}, std::nullopt});
    assert(r.is_error());
    assert(r.response["error"].get<std::string>().find("timed out") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_calls_run_concurrently()
{
    std::cout << "  test_calls_run_concurrently... " << std::flush;
    OpenAIToolRegistry reg;
    register_sleepers(reg);
    ToolExecutionLoop loop(&reg);

    auto start = std::chrono::steady_clock::now();
    auto results = loop.execute_batch({ToolCallRequest{"sleep_ms", Json{{"ms", 200}}, "a"},
                                       ToolCallRequest{"sleep_ms", Json{{"ms", 200}}, "b"},
                                       ToolCallRequest{"sleep_async", Json{{"ms", 200}}, "c"}});
    auto elapsed = std::chrono::steady_clock::now() - start;

    for (const auto& r : results)
        assert(r.response == (Json{{"result", 200}}));
    // Sequential execution would take at least 600ms
    assert(elapsed < 500ms);
    std::cout << "PASSED\n";
}

void test_loop_continues_after_timeout()
{
    std::cout << "  test_loop_continues_after_timeout... " << std::flush;
    OpenAIToolRegistry reg;
    register_sleepers(reg);
    LoopOptions options;
    options.tool_timeout = 50ms;
    ToolExecutionLoop loop(&reg, options);

    ScriptedAdapter adapter(std::vector<Json>{answer("gave up waiting")});
    auto result = loop.run(calls({call("sleep_ms", Json{{"ms", 400}}, "c1")}), adapter);
    assert(result.state == LoopState::Done);
    assert(adapter.batches.size() == 1);
    assert(adapter.batches[0][0]["response"]["error"].get<std::string>().find("timed out") !=
           std::string::npos);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Loop Timeout Tests\n";
    std::cout << "==================\n";

    try
    {
        test_timeout_reported_as_error();
        test_siblings_unaffected_by_timeout();
        test_async_timeout();
        test_calls_run_concurrently();
        test_loop_continues_after_timeout();
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}
