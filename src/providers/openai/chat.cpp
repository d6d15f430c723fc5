#include "llmtools/providers/openai/chat.hpp"

#include "llmtools/logging.hpp"

namespace llmtools::providers::openai
{

namespace
{
tools::LoopOptions with_default_formatter(tools::LoopOptions options)
{
    if (!options.argument_error_formatter)
        options.argument_error_formatter = [](const std::string&, const std::string& error)
        { return "Failed to decode function arguments: " + error; };
    return options;
}

bool has_content(const Json& message)
{
    return message.contains("content") && message["content"].is_string() &&
           !message["content"].get_ref<const std::string&>().empty();
}
} // namespace

OpenAIChat::OpenAIChat(ChatTransport& transport, const OpenAIToolRegistry* registry,
                       ChatOptions options)
    : transport_(transport), registry_(registry), options_(std::move(options)),
      loop_(registry_, with_default_formatter(options_.loop))
{
}

ChatResult OpenAIChat::chat(const Json& history, const std::string& prompt) const
{
    return util::with_retry(options_.retry, [&]() { return chat_once(history, prompt); });
}

ChatResult OpenAIChat::chat_once(const Json& history, const std::string& prompt) const
{
    Json messages = history.is_array() ? history : Json::array();
    if (messages.empty() && !options_.system_instruction.empty())
        messages.push_back(Json{{"role", "system"}, {"content", options_.system_instruction}});
    messages.push_back(Json{{"role", "user"}, {"content", prompt}});

    Json tools = registry_ ? registry_->manifest() : Json::array();
    Json response = transport_.complete(make_request(options_.completion, messages, tools));

    ChatResult result;
    if (first_message(response) != nullptr)
    {
        OpenAIToolAdapter adapter(transport_, messages, tools, options_.completion);
        auto outcome = loop_.run(response, adapter);
        response = std::move(outcome.response);
        result.capped = outcome.capped();
    }
    else
    {
        log::warning("Initial completion has no choices.");
    }

    // A capped turn ends on a response the loop never recorded
    if (const Json* final_message = first_message(response))
    {
        if (has_content(*final_message) && (messages.empty() || messages.back() != *final_message))
            messages.push_back(*final_message);
        if (has_content(*final_message))
            result.content = (*final_message)["content"].get<std::string>();
    }

    result.messages = options_.clean_history ? clean_history(messages) : messages;
    result.raw = std::move(response);
    return result;
}

Json OpenAIChat::clean_history(const Json& messages)
{
    Json cleaned = Json::array();
    for (const auto& msg : messages)
    {
        std::string role = msg.value("role", "");
        if (role == "tool")
            continue;
        bool has_calls = msg.contains("tool_calls") && !msg["tool_calls"].is_null() &&
                         !msg["tool_calls"].empty();
        if (role == "assistant" && has_calls)
        {
            if (!has_content(msg))
                continue;
            Json copy = msg;
            copy.erase("tool_calls");
            cleaned.push_back(std::move(copy));
            continue;
        }
        cleaned.push_back(msg);
    }
    return cleaned;
}

} // namespace llmtools::providers::openai
