#include "filters.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include "link_resolver.hpp"
#include "run_config.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace Filters
{
    namespace
    {
        std::string lower(std::string_view text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool is_space(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        std::optional<std::chrono::hours> parse_past(std::string_view value)
        {
            if(value.size() < 2 || value.size() > 7)
                return std::nullopt;

            std::string_view digits = value.substr(0, value.size() - 1);
            if(!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }))
                return std::nullopt;

            long amount = std::stol(std::string(digits));
            long per_unit = 0;
            switch(value.back())
            {
                case 'h': per_unit = 1; break;
                case 'd': per_unit = 24; break;
                case 'm': per_unit = 24 * 30; break;
                case 'y': per_unit = 24 * 365; break;
                default: return std::nullopt;
            }

            // The window is subtracted from a system_clock time point.
            constexpr auto longest = std::chrono::duration_cast<std::chrono::hours>(
                std::chrono::system_clock::duration::max());
            if(amount > longest.count() / per_unit)
                return std::nullopt;

            return std::chrono::hours(amount * per_unit);
        }
    }

    DateFilter DateFilter::parse(std::string_view text)
    {
        DateFilter filter;

        size_t pos = 0;
        while(pos < text.size())
        {
            while(pos < text.size() && is_space(text[pos])) ++pos;
            size_t end = pos;
            while(end < text.size() && !is_space(text[end])) ++end;
            if(end == pos)
                break;

            std::string_view token = text.substr(pos, end - pos);
            pos = end;

            auto colon = token.find(':');
            if(colon == std::string_view::npos)
                throw FilterError("Date filter token without a key: " + std::string(token));

            std::string_view key = token.substr(0, colon);
            std::string_view value = token.substr(colon + 1);

            if(key == "past")
            {
                filter.past = parse_past(value);
                if(!filter.past)
                    throw FilterError("Invalid past: window \"" + std::string(value) + "\" (expected N followed by h, d, m or y, under about 290 years)");
            }
            else if(key == "since" || key == "until")
            {
                auto day = Dates::parse_ymd(value);
                if(!day)
                    throw FilterError("Invalid " + std::string(key) + ": date \"" + std::string(value) + "\" (expected YYYY-MM-DD)");
                (key == "since" ? filter.since : filter.until) = day;
            }
            else
            {
                throw FilterError("Unknown date filter key: " + std::string(key));
            }
        }

        if(filter.since && filter.until && *filter.until < *filter.since)
            throw FilterError("Date filter until: is before since:");

        return filter;
    }

    bool DateFilter::accepts(const std::optional<News::Timestamp>& pub_date, News::Timestamp now) const
    {
        if(!active())
            return true;
        if(!pub_date)
            return false;

        if(past)
            return *pub_date >= now - *past;

        if(since && *pub_date < *since)
            return false;
        if(until && *pub_date >= *until + std::chrono::hours(24))
            return false;
        return true;
    }

    AdvancedFilter AdvancedFilter::parse(std::string_view text)
    {
        AdvancedFilter filter;
        filter.expression_ = std::string(text);

        Group current;
        bool saw_separator = false;

        auto close_group = [&]()
        {
            if(current.empty())
                throw FilterError("Empty group around | or OR in filter: " + filter.expression_);
            filter.groups_.push_back(std::move(current));
            current.clear();
        };

        size_t pos = 0;
        while(pos < text.size())
        {
            if(is_space(text[pos]))
            {
                ++pos;
                continue;
            }

            if(text[pos] == '|')
            {
                close_group();
                saw_separator = true;
                ++pos;
                continue;
            }

            Term term;
            bool prefixed = false;
            if(text[pos] == '+' || text[pos] == '-')
            {
                prefixed = true;
                term.negated = text[pos] == '-';
                ++pos;
                if(pos >= text.size() || is_space(text[pos]) || text[pos] == '|')
                    throw FilterError("Dangling " + std::string(1, text[pos - 1]) + " in filter: " + filter.expression_);
            }

            if(text[pos] == '"' || text[pos] == '/')
            {
                char delim = text[pos];
                auto close = text.find(delim, pos + 1);
                if(close == std::string_view::npos)
                    throw FilterError(std::string(delim == '"' ? "Unterminated quote" : "Unterminated regex") +
                                      " in filter: " + filter.expression_);

                std::string_view atom = text.substr(pos + 1, close - pos - 1);
                if(atom.empty())
                    throw FilterError("Empty term in filter: " + filter.expression_);

                if(delim == '/')
                {
                    term.is_regex = true;
                    try
                    {
                        term.pattern = std::regex(std::string(atom), std::regex::ECMAScript | std::regex::icase);
                    }
                    catch(const std::regex_error& e)
                    {
                        throw FilterError("Invalid regex /" + std::string(atom) + "/: " + e.what());
                    }
                }
                term.needle = lower(atom);
                pos = close + 1;
            }
            else
            {
                size_t end = pos;
                while(end < text.size() && !is_space(text[end]) && text[end] != '|')
                    ++end;

                std::string_view word = text.substr(pos, end - pos);
                pos = end;

                if(word == "OR" && !prefixed)
                {
                    close_group();
                    saw_separator = true;
                    continue;
                }
                term.needle = lower(word);
            }

            current.push_back(std::move(term));
        }

        if(!current.empty())
            filter.groups_.push_back(std::move(current));
        else if(saw_separator)
            throw FilterError("Empty group around | or OR in filter: " + filter.expression_);

        return filter;
    }

    bool AdvancedFilter::matches(std::string_view text) const
    {
        if(groups_.empty())
            return true;

        const std::string haystack = lower(text);

        auto term_holds = [&](const Term& term)
        {
            bool found = term.is_regex
                ? std::regex_search(text.begin(), text.end(), term.pattern)
                : haystack.find(term.needle) != std::string::npos;
            return found != term.negated;
        };

        return std::any_of(groups_.begin(), groups_.end(), [&](const Group& group)
        {
            return std::all_of(group.begin(), group.end(), term_holds);
        });
    }

    std::string searchable_text(const News::NewsItem& item)
    {
        std::string text = item.title;
        if(item.source)
            text += " " + *item.source;
        for(const auto& related : item.related)
        {
            text += " " + related.title;
            if(!related.press.empty())
                text += " " + related.press;
        }
        return text;
    }

    FilterEngine::FilterEngine(const RunConfig& config, LinkResolver& resolver)
        : config_(config), resolver_(resolver) {}

    std::vector<News::NewsItem> FilterEngine::apply(std::vector<News::NewsItem> items,
                                                    const std::unordered_set<std::string>& already_sent) const
    {
        if(config_.date_filter.active())
        {
            size_t before = items.size();
            std::erase_if(items, [&](const News::NewsItem& item)
            {
                return !config_.date_filter.accepts(item.pub_date, config_.run_started);
            });
            std::cout << "[Filter] Date filter kept " << items.size() << " of " << before << " items\n";
        }

        if(!config_.advanced_filter.empty())
        {
            size_t before = items.size();
            std::erase_if(items, [&](const News::NewsItem& item)
            {
                return !config_.advanced_filter.matches(searchable_text(item));
            });
            std::cout << "[Filter] Advanced filter \"" << config_.advanced_filter.expression()
                      << "\" kept " << items.size() << " of " << before << " items\n";
        }

        if(config_.origin_link)
        {
            for(auto& item : items)
            {
                if(already_sent.count(item.guid))
                    continue;

                item.link = resolver_.resolve(item.link);
                for(auto& related : item.related)
                    related.link = resolver_.resolve(related.link);
            }
        }

        return items;
    }
}
