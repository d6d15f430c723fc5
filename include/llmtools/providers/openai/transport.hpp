#pragma once
#include "llmtools/types.hpp"

#include <chrono>
#include <string>

namespace llmtools::providers::openai
{

/// Sends one chat-completions request and returns the parsed response.
class ChatTransport
{
  public:
    virtual ~ChatTransport() = default;
    virtual Json complete(const Json& request) = 0;
};

/// ChatTransport over HTTP(S) against an OpenAI-compatible endpoint.
class HttpChatTransport : public ChatTransport
{
  public:
    struct Options
    {
        std::string path{"/v1/chat/completions"};
        std::string api_key;
        std::chrono::seconds connection_timeout{10};
        std::chrono::seconds read_timeout{300};
    };

    /// @param base_url e.g. "https://api.openai.com" or "http://localhost:8080"
    explicit HttpChatTransport(std::string base_url) : base_url_(std::move(base_url)) {}
    HttpChatTransport(std::string base_url, Options options)
        : base_url_(std::move(base_url)), options_(std::move(options))
    {
    }

    /// Throws TransportError on connection failure, non-2xx status or a non-JSON body.
    Json complete(const Json& request) override;

  private:
    std::string base_url_;
    Options options_;
};

} // namespace llmtools::providers::openai
