#include "run_config.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace
{
    std::string lower(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string_view text)
    {
        size_t start = text.find_first_not_of(" \t\n\r");
        size_t end = text.find_last_not_of(" \t\n\r");
        return (start == std::string_view::npos) ? "" : std::string(text.substr(start, end - start + 1));
    }

    // Unset and blank variables are the same thing.
    std::string value_or(const RunConfig::Lookup& lookup, std::string_view name, std::string_view fallback = "")
    {
        auto value = lookup(name);
        if(!value)
            return std::string(fallback);

        std::string trimmed = trim(*value);
        return trimmed.empty() ? std::string(fallback) : trimmed;
    }
}

std::optional<bool> parse_bool(std::string_view value)
{
    std::string v = lower(trim(value));
    if(v == "true" || v == "t" || v == "1" || v == "yes" || v == "y") return true;
    if(v == "false" || v == "f" || v == "0" || v == "no" || v == "n") return false;
    return std::nullopt;
}

std::optional<std::string> env_lookup(std::string_view name)
{
    const char* value = std::getenv(std::string(name).c_str());
    if(!value)
        return std::nullopt;
    return std::string(value);
}

RunConfig RunConfig::from_env()
{
    return from_lookup(env_lookup);
}

GoogleNews::FeedSelection RunConfig::feed_from_lookup(const Lookup& lookup)
{
    std::string rss_url = value_or(lookup, "RSS_URL");
    std::string mode_text = value_or(lookup, "FEED_MODE", rss_url.empty() ? "top" : "url");
    std::string country = value_or(lookup, "TOP_COUNTRY", config::DEFAULT_COUNTRY);

    switch(GoogleNews::parse_mode(mode_text))
    {
        case GoogleNews::FeedMode::Top:
            return GoogleNews::select_top(country);

        case GoogleNews::FeedMode::Topic:
        {
            std::string keyword = value_or(lookup, "TOPIC_KEYWORD");
            if(keyword.empty())
                throw ConfigError("TOPIC_KEYWORD must be set when FEED_MODE is topic");
            return GoogleNews::select_topic(keyword, country);
        }

        case GoogleNews::FeedMode::Url:
            return GoogleNews::select_url(rss_url);
    }

    throw ConfigError("Unhandled feed mode: " + mode_text);
}

RunConfig RunConfig::from_lookup(const Lookup& lookup)
{
    RunConfig cfg;
    cfg.run_started = std::chrono::system_clock::now();

    cfg.webhook_url = value_or(lookup, "DISCORD_WEBHOOK");
    if(cfg.webhook_url.empty())
        throw ConfigError("DISCORD_WEBHOOK is not set");

    cfg.avatar_url = value_or(lookup, "DISCORD_AVATAR");
    cfg.username = value_or(lookup, "DISCORD_USERNAME");

    cfg.initialize = parse_bool(value_or(lookup, "INITIALIZE_MODE", "false")).value_or(false);

    // Anything but an explicit "no" keeps origin links on.
    cfg.origin_link = parse_bool(value_or(lookup, "ORIGIN_LINK", "true")).value_or(true);

    cfg.date_filter = Filters::DateFilter::parse(value_or(lookup, "DATE_FILTER"));
    cfg.advanced_filter = Filters::AdvancedFilter::parse(value_or(lookup, "ADVANCED_FILTER"));

    cfg.feed = feed_from_lookup(lookup);
    cfg.state_db_path = value_or(lookup, "STATE_DB_PATH", config::DB_PATH);

    std::cout << "[Config] Feed (" << GoogleNews::to_string(cfg.feed.mode) << "): " << cfg.feed.url << '\n';
    return cfg;
}
