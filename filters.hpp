#pragma once

#include "news_item.hpp"

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

struct RunConfig;
class LinkResolver;

namespace Filters
{
    // "past:6h", "since:2026-01-01 until:2026-01-31". past supersedes since/until.
    struct DateFilter
    {
        std::optional<News::Timestamp> since;
        std::optional<News::Timestamp> until;   // inclusive through the end of that day
        std::optional<std::chrono::hours> past;

        // Throws FilterError on any unknown or malformed token.
        [[nodiscard]] static DateFilter parse(std::string_view text);

        [[nodiscard]] bool active() const noexcept { return since || until || past; }

        // Unknown dates never pass an active filter.
        [[nodiscard]] bool accepts(const std::optional<News::Timestamp>& pub_date, News::Timestamp now) const;
    };

    // Keyword expression: terms are ANDed, groups split by "|" or "OR" are ORed.
    // Terms are words, "quoted phrases" or /regex/, optionally prefixed with + or -.
    class AdvancedFilter
    {
    public:
        AdvancedFilter() = default;

        // Throws FilterError on malformed input.
        [[nodiscard]] static AdvancedFilter parse(std::string_view text);

        [[nodiscard]] bool empty() const noexcept { return groups_.empty(); }
        [[nodiscard]] bool matches(std::string_view text) const;

        [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

    private:
        struct Term
        {
            bool negated = false;
            bool is_regex = false;
            std::string needle;   // lower-cased
            std::regex pattern;
        };

        using Group = std::vector<Term>;

        std::string expression_;
        std::vector<Group> groups_;
    };

    // Title, source and related coverage joined for keyword matching.
    [[nodiscard]] std::string searchable_text(const News::NewsItem& item);

    class FilterEngine
    {
    public:
        FilterEngine(const RunConfig& config, LinkResolver& resolver);

        // Date window, advanced expression, then link resolution. Order preserved.
        // Items in already_sent keep their aggregator links.
        [[nodiscard]] std::vector<News::NewsItem> apply(std::vector<News::NewsItem> items,
                                                        const std::unordered_set<std::string>& already_sent = {}) const;

    private:
        const RunConfig& config_;
        LinkResolver& resolver_;
    };
}
