#include "llmtools/providers/openai/transport.hpp"

#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"

#include <httplib.h>

namespace llmtools::providers::openai
{

namespace
{
struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
};

ParsedUrl parse_url(const std::string& base)
{
    ParsedUrl result;
    std::string remaining = base;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw TransportError("Unsupported URL scheme: " + result.scheme +
                             " (only http and https are allowed)");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
        remaining = remaining.substr(0, slash_pos);

    int default_port = result.scheme == "https" ? 443 : 80;
    auto colon_pos = remaining.rfind(':');
    if (colon_pos == std::string::npos)
    {
        result.host = remaining;
        result.port = default_port;
        return result;
    }

    result.host = remaining.substr(0, colon_pos);
    try
    {
        result.port = std::stoi(remaining.substr(colon_pos + 1));
    }
    catch (const std::logic_error&)
    {
        throw TransportError("Invalid port in URL: " + base);
    }
    return result;
}
} // namespace

Json HttpChatTransport::complete(const Json& request)
{
    auto url = parse_url(base_url_);
    std::string full_url = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    httplib::Client cli(full_url);

    cli.set_connection_timeout(options_.connection_timeout);
    cli.set_read_timeout(options_.read_timeout);
    // Redirects could downgrade TLS or leak the bearer token
    cli.set_follow_location(false);

    httplib::Headers headers = {{"Accept", "application/json"}};
    if (!options_.api_key.empty())
        headers.emplace("Authorization", "Bearer " + options_.api_key);

    log::debug("POST " + full_url + options_.path);
    auto res = cli.Post(options_.path, headers, request.dump(), "application/json");
    if (!res)
        throw TransportError("HTTP request failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw TransportError("HTTP error: " + std::to_string(res->status) + " " + res->body);

    try
    {
        return Json::parse(res->body);
    }
    catch (const Json::parse_error& e)
    {
        throw TransportError(std::string("Invalid JSON in response: ") + e.what());
    }
}

} // namespace llmtools::providers::openai
