#include "llmtools/tools/loop.hpp"

#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"
#include "llmtools/schema/coerce.hpp"

#include <condition_variable>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace llmtools::tools
{

namespace
{

struct PendingCall
{
    const ToolCallRequest* call;
    std::optional<ToolCallResult> settled;
    std::future<Json> future;
    std::chrono::steady_clock::time_point deadline;
};

// Counts finished workers so the collector wakes on whichever call settles first.
struct BatchSignal
{
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t finished{0};
};

constexpr auto NO_DEADLINE_THRESHOLD = std::chrono::hours(24 * 365 * 10);

std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout)
{
    if (timeout >= NO_DEADLINE_THRESHOLD)
        return std::chrono::steady_clock::time_point::max();
    return std::chrono::steady_clock::now() + timeout;
}

// Runs the callable on a detached worker. A worker that outlives its deadline
// is abandoned; it owns copies of everything it touches.
std::future<Json> launch(const Callable& callable, Json args, std::shared_ptr<BatchSignal> signal)
{
    auto promise = std::make_shared<std::promise<Json>>();
    auto future = promise->get_future();
    std::thread(
        [promise, callable, args = std::move(args), signal = std::move(signal)]()
        {
            try
            {
                promise->set_value(callable.invoke(args));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
            {
                std::lock_guard<std::mutex> lock(signal->mutex);
                ++signal->finished;
            }
            signal->cv.notify_all();
        })
        .detach();
    return future;
}

std::string seconds_string(std::chrono::milliseconds timeout)
{
    std::ostringstream ss;
    ss << static_cast<double>(timeout.count()) / 1000.0;
    return ss.str();
}

} // namespace

std::string to_string(LoopState state)
{
    switch (state)
    {
    case LoopState::AwaitingResponse:
        return "awaiting_response";
    case LoopState::Dispatching:
        return "dispatching";
    case LoopState::Responding:
        return "responding";
    case LoopState::Done:
        return "done";
    case LoopState::CappedExit:
        return "capped_exit";
    }
    return "done";
}

ToolExecutionLoop::ToolExecutionLoop(const ToolRegistry* registry, LoopOptions options)
    : registry_(registry), options_(std::move(options))
{
}

void ToolExecutionLoop::transition(LoopState state) const
{
    if (options_.on_state)
        options_.on_state(state);
}

std::string ToolExecutionLoop::format_argument_error(const std::string& tool_name,
                                                     const std::string& error) const
{
    if (options_.argument_error_formatter)
        return options_.argument_error_formatter(tool_name, error);
    return "Failed to parse arguments for tool '" + tool_name + "': " + error;
}

LoopResult ToolExecutionLoop::run(const Json& initial_response, ToolAdapter& adapter) const
{
    transition(LoopState::AwaitingResponse);
    Json current = initial_response;

    for (int iteration = 0; iteration < options_.max_iterations; ++iteration)
    {
        auto calls = adapter.extract_calls(current);
        if (calls.empty())
        {
            log::debug("No tool calls found in response. Loop finished.");
            adapter.record_assistant_message(current);
            transition(LoopState::Done);
            return LoopResult{std::move(current), LoopState::Done, iteration};
        }

        log::info("Loop " + std::to_string(iteration + 1) + "/" +
                  std::to_string(options_.max_iterations) + ": Processing " +
                  std::to_string(calls.size()) + " tool call(s).");
        // The call intent must reach history before its results are sent.
        adapter.record_assistant_message(current);

        transition(LoopState::Dispatching);
        auto results = execute_batch(calls);

        transition(LoopState::Responding);
        std::vector<Json> messages;
        messages.reserve(results.size());
        for (const auto& result : results)
            messages.push_back(adapter.build_result_message(result));
        current = adapter.send_results(messages);
        transition(LoopState::AwaitingResponse);
    }

    log::warning("Max tool loops (" + std::to_string(options_.max_iterations) +
                 ") reached. Stopping execution.");
    transition(LoopState::CappedExit);
    return LoopResult{std::move(current), LoopState::CappedExit, options_.max_iterations};
}

std::vector<ToolCallResult>
ToolExecutionLoop::execute_batch(const std::vector<ToolCallRequest>& calls) const
{
    std::vector<PendingCall> pending;
    pending.reserve(calls.size());
    auto signal = std::make_shared<BatchSignal>();

    // Resolve, normalize and validate on this thread; launch survivors right away.
    for (const auto& call : calls)
    {
        PendingCall p{&call, std::nullopt, {}, {}};
        log::debug("Handling tool call: " + call.name +
                   " (ID: " + call.call_id.value_or("none") + ")");

        const ToolDefinition* tool = registry_ ? registry_->find(call.name) : nullptr;
        if (tool == nullptr)
        {
            std::string msg = "Tool '" + call.name + "' not found in registry.";
            log::warning(msg);
            p.settled = ToolCallResult::error(call.name, msg, call.call_id);
            pending.push_back(std::move(p));
            continue;
        }

        Json args;
        try
        {
            args = normalize_arguments(call.name, call.arguments);
        }
        catch (const ExecutionError& e)
        {
            log::warning("Argument normalization failed for '" + call.name + "': " + e.what());
            p.settled = ToolCallResult::error(call.name, e.what(), call.call_id);
            pending.push_back(std::move(p));
            continue;
        }

        if (tool->args_schema())
        {
            try
            {
                args = schema::coerce_arguments(*tool->args_schema(), args);
            }
            catch (const ValidationError& e)
            {
                std::string msg = std::string("Argument validation failed: ") + e.what();
                log::warning("Validation error for '" + call.name + "': " + msg);
                p.settled = ToolCallResult::error(call.name, msg, call.call_id);
                pending.push_back(std::move(p));
                continue;
            }
            catch (const Json::exception& e)
            {
                std::string msg = std::string("Argument validation failed: ") + e.what();
                log::warning("Validation error for '" + call.name + "': " + msg);
                p.settled = ToolCallResult::error(call.name, msg, call.call_id);
                pending.push_back(std::move(p));
                continue;
            }
        }

        log::info("Executing tool '" + call.name + "'...");
        p.deadline = deadline_after(options_.tool_timeout);
        p.future = launch(tool->callable(), std::move(args), signal);
        pending.push_back(std::move(p));
    }

    std::size_t outstanding = 0;
    for (const auto& p : pending)
        if (!p.settled)
            ++outstanding;

    // Settle calls in completion order so a fatal error surfaces as soon as it
    // happens, without waiting on slower siblings.
    while (outstanding > 0)
    {
        std::size_t seen = 0;
        {
            std::lock_guard<std::mutex> lock(signal->mutex);
            seen = signal->finished;
        }

        auto now = std::chrono::steady_clock::now();
        auto next_deadline = std::chrono::steady_clock::time_point::max();
        for (auto& p : pending)
        {
            if (p.settled)
                continue;
            const auto& call = *p.call;

            if (p.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            {
                p.settled = settle(call, p.future);
                --outstanding;
            }
            else if (now >= p.deadline)
            {
                std::string msg = "Tool execution timed out after " +
                                  seconds_string(options_.tool_timeout) + " seconds.";
                log::warning("Recoverable error in '" + call.name + "': " + msg);
                p.settled = ToolCallResult::error(call.name, msg, call.call_id);
                --outstanding;
            }
            else if (p.deadline < next_deadline)
            {
                next_deadline = p.deadline;
            }
        }
        if (outstanding == 0)
            break;

        std::unique_lock<std::mutex> lock(signal->mutex);
        auto progressed = [&] { return signal->finished != seen; };
        if (next_deadline == std::chrono::steady_clock::time_point::max())
            signal->cv.wait(lock, progressed);
        else
            signal->cv.wait_until(lock, next_deadline, progressed);
    }

    std::vector<ToolCallResult> results;
    results.reserve(pending.size());
    for (auto& p : pending)
        results.push_back(std::move(*p.settled));
    return results;
}

ToolCallResult ToolExecutionLoop::settle(const ToolCallRequest& call, std::future<Json>& future) const
{
    try
    {
        Json value = future.get();
        log::info("Tool '" + call.name + "' executed successfully.");
        return ToolCallResult::ok(call.name, std::move(value), call.call_id);
    }
    catch (...)
    {
        auto error = std::current_exception();
        auto msg = recoverable_message(error);
        if (!msg)
        {
            log::error("Fatal error in tool '" + call.name + "'; aborting turn.");
            std::rethrow_exception(error);
        }
        log::warning("Recoverable error in '" + call.name + "': " + *msg);
        return ToolCallResult::error(call.name, *msg, call.call_id);
    }
}

ToolCallResult ToolExecutionLoop::execute_call(const ToolCallRequest& call) const
{
    return execute_batch({call}).front();
}

Json ToolExecutionLoop::normalize_arguments(const std::string& tool_name, const Json& raw) const
{
    if (raw.is_null())
        return Json::object();
    if (raw.is_object())
        return raw;

    if (raw.is_string())
    {
        const auto& text = raw.get_ref<const std::string&>();
        if (text.empty())
            return Json::object();

        Json parsed;
        try
        {
            parsed = Json::parse(text);
        }
        catch (const Json::parse_error& e)
        {
            throw ExecutionError(format_argument_error(tool_name, e.what()));
        }
        if (parsed.is_null())
            return Json::object();
        if (!parsed.is_object())
            throw ExecutionError(format_argument_error(
                tool_name, "Function arguments must decode to a JSON object."));
        return parsed;
    }

    // A sequence of [key, value] pairs folds into a mapping
    if (raw.is_array())
    {
        Json out = Json::object();
        for (const auto& pair : raw)
        {
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string())
                throw ExecutionError(format_argument_error(
                    tool_name, "cannot convert " + raw.dump() + " to a mapping"));
            out[pair[0].get<std::string>()] = pair[1];
        }
        return out;
    }

    throw ExecutionError(
        format_argument_error(tool_name, "cannot convert " + raw.dump() + " to a mapping"));
}

std::optional<std::string> ToolExecutionLoop::recoverable_message(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const ExecutionError& e)
    {
        return std::string(e.what());
    }
    catch (const ValidationError& e)
    {
        return std::string(e.what());
    }
    catch (const FileNotFoundError& e)
    {
        return std::string(e.what());
    }
    catch (const FileExistsError& e)
    {
        return std::string(e.what());
    }
    catch (const PermissionError& e)
    {
        return std::string(e.what());
    }
    catch (const InvalidPathError& e)
    {
        return std::string(e.what());
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        return std::string(e.what());
    }
    catch (const std::invalid_argument& e)
    {
        return std::string(e.what());
    }
    catch (const std::domain_error& e)
    {
        return std::string(e.what());
    }
    catch (const std::out_of_range& e)
    {
        return std::string(e.what());
    }
    catch (const std::length_error& e)
    {
        return std::string(e.what());
    }
    catch (const Json::type_error& e)
    {
        return std::string(e.what());
    }
    catch (const Json::out_of_range& e)
    {
        return std::string(e.what());
    }
    catch (...)
    {
        // Not in the recoverable set; the caller rethrows it.
        return std::nullopt;
    }
}

} // namespace llmtools::tools
