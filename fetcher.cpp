#include "fetcher.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

Fetcher::Fetcher(Http::Transport& transport, Http::Sleeper sleeper)
    : transport_(transport), sleeper_(std::move(sleeper)) {}

News::RawDocument Fetcher::fetch(std::string_view url)
{
    const std::string url_str(url);
    std::optional<FetchError> last_error;

    for(int attempt = 1; attempt <= config::FETCH_MAX_ATTEMPTS; ++attempt)
    {
        auto fetch_start = std::chrono::steady_clock::now();
        auto res = transport_.get(url_str, true);
        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - fetch_start).count();

        if(res.success())
        {
            std::cout << "[Fetcher] GET " << url_str << " -> " << res.status
                      << " (" << res.body.size() << " bytes, " << latency << " ms)\n";
            return News::RawDocument{url_str, std::move(res.body), res.header("content-type").value_or("")};
        }

        if(!res.transport_ok())
        {
            auto kind = res.failure == Http::Failure::Timeout ? FetchError::Kind::Timeout : FetchError::Kind::Network;
            last_error.emplace(kind, "Feed request failed: " + res.error);
            std::cerr << "[Fetcher] " << to_string(kind) << " error: " << res.error << '\n';
        }
        else
        {
            last_error.emplace(FetchError::Kind::HttpStatus,
                               "Feed request returned HTTP " + std::to_string(res.status), res.status);
            std::cerr << "[Fetcher] HTTP " << res.status << " from " << url_str << '\n';

            if(res.status < 500)
                throw *last_error;
        }

        if(attempt < config::FETCH_MAX_ATTEMPTS)
        {
            std::cerr << "[Fetcher] Attempt " << attempt << "/" << config::FETCH_MAX_ATTEMPTS << " failed, retrying\n";
            sleeper_(config::FETCH_RETRY_DELAY);
        }
    }

    std::cerr << "[Fetcher] Giving up on " << url_str << '\n';
    throw *last_error;
}
