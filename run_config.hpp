#pragma once

#include "filters.hpp"
#include "google_news.hpp"
#include "news_item.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Everything one run needs, resolved before any network or file I/O.
struct RunConfig
{
    GoogleNews::FeedSelection feed;

    std::string webhook_url;
    std::string avatar_url;
    std::string username;

    bool initialize = false;
    bool origin_link = true;

    Filters::DateFilter date_filter;
    Filters::AdvancedFilter advanced_filter;

    std::string state_db_path;
    News::Timestamp run_started;

    using Lookup = std::function<std::optional<std::string>(std::string_view)>;

    // Throws ConfigError or FilterError.
    [[nodiscard]] static RunConfig from_env();
    [[nodiscard]] static RunConfig from_lookup(const Lookup& lookup);

    // Feed selection only; the webhook is not required.
    [[nodiscard]] static GoogleNews::FeedSelection feed_from_lookup(const Lookup& lookup);
};

// "true", "1", "yes" ... ; nullopt when the value is not a recognised boolean.
[[nodiscard]] std::optional<bool> parse_bool(std::string_view value);

[[nodiscard]] std::optional<std::string> env_lookup(std::string_view name);
