#pragma once

#include <string>
#include <string_view>

namespace GoogleNews
{
    struct Country
    {
        std::string_view code;   // gl
        std::string_view hl;
        std::string_view ceid;
        std::string_view name;
    };

    struct Topic
    {
        std::string_view keyword;
        std::string_view name_en;
        std::string_view id_en;
        std::string_view name_ko;
        std::string_view id_ko;
    };

    enum class FeedMode
    {
        Top,
        Topic,
        Url
    };

    // Header line of every posted message: `Google News - Top Stories - United States 🇺🇸`
    struct FeedLabel
    {
        std::string prefix;
        std::string category;
        std::string topic;
        std::string flag;

        [[nodiscard]] std::string line() const;
    };

    struct FeedSelection
    {
        FeedMode mode = FeedMode::Top;
        std::string url;
        std::string country;
        std::string topic_keyword;
        std::string language;
        FeedLabel label;
    };

    [[nodiscard]] const Country* find_country(std::string_view code);
    [[nodiscard]] const Topic* find_topic(std::string_view keyword);
    [[nodiscard]] const Topic* find_topic_by_id(std::string_view id);

    [[nodiscard]] std::string country_flag(std::string_view code);
    [[nodiscard]] std::string news_prefix(std::string_view language);
    [[nodiscard]] std::string query_param(std::string_view url, std::string_view name);

    // Throw ConfigError for unknown modes, countries or topics.
    [[nodiscard]] FeedMode parse_mode(std::string_view mode);
    [[nodiscard]] FeedSelection select_top(std::string_view country_code);
    [[nodiscard]] FeedSelection select_topic(std::string_view keyword, std::string_view country_code);
    [[nodiscard]] FeedSelection select_url(std::string_view url);

    [[nodiscard]] std::string_view to_string(FeedMode mode) noexcept;
}
