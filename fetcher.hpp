#pragma once

#include "http_client.hpp"
#include "news_item.hpp"

#include <string_view>

class Fetcher
{
public:
    Fetcher(Http::Transport& transport, Http::Sleeper sleeper);

    // Throws FetchError once retries are exhausted; 4xx is never retried.
    [[nodiscard]] News::RawDocument fetch(std::string_view url);

private:
    Http::Transport& transport_;
    Http::Sleeper sleeper_;
};
