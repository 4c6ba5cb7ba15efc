#pragma once

#include "news_item.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace News
{
    class FeedParser
    {
    public:
        // Items in document order. Entries without guid or link are skipped.
        // Throws FetchError(Kind::Parse) if the body is not RSS or Atom.
        [[nodiscard]] static std::vector<NewsItem> parse(const RawDocument& doc);

        // Related coverage from a Google News <description> HTML block.
        static void parse_description(std::string_view html, NewsItem& item);
    };
}
