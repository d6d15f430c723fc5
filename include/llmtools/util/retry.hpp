#pragma once
#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace llmtools::util
{

/// Exponential backoff around one whole conversational turn.
struct RetryPolicy
{
    int max_retries{3};
    std::chrono::milliseconds base_delay{1000};
};

/// Calls @p fn, retrying on TransportError up to policy.max_retries times with
/// the delay doubling after every failure. The last TransportError propagates;
/// other exceptions are never retried.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, Fn&& fn) -> decltype(fn())
{
    auto delay = policy.base_delay;
    for (int attempt = 0;; ++attempt)
    {
        try
        {
            return fn();
        }
        catch (const TransportError& e)
        {
            if (attempt >= policy.max_retries)
            {
                log::error("Giving up after " + std::to_string(attempt + 1) +
                           " attempt(s): " + e.what());
                throw;
            }
            log::warning("API Error (Retry: " + std::to_string(attempt + 1) + "/" +
                         std::to_string(policy.max_retries) + "): " + e.what() + ". Waiting " +
                         std::to_string(delay.count()) + "ms...");
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
}

} // namespace llmtools::util
