#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace News
{
    using Timestamp = std::chrono::system_clock::time_point;

    struct RelatedArticle
    {
        std::string title;
        std::string link;
        std::string press;
    };

    struct NewsItem
    {
        std::string guid;
        std::string title;
        std::string link;
        std::optional<Timestamp> pub_date;   // nullopt: feed date missing or unparsable
        std::optional<std::string> source;

        std::vector<RelatedArticle> related;
        std::string coverage_link;
    };

    struct RawDocument
    {
        std::string url;
        std::string body;
        std::string content_type;
    };
}
