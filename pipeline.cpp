#include "pipeline.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "feed_parser.hpp"
#include "fetcher.hpp"
#include "filters.hpp"
#include "link_resolver.hpp"
#include "run_config.hpp"
#include "sender.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <utility>

namespace Pipeline
{
    std::string_view to_string(State state) noexcept
    {
        switch(state)
        {
            case State::Init: return "Init";
            case State::Fetching: return "Fetching";
            case State::Filtering: return "Filtering";
            case State::Diffing: return "Diffing";
            case State::Delivering: return "Delivering";
            case State::Persisting: return "Persisting";
            case State::Done: return "Done";
            case State::Aborted: return "Aborted";
        }
        return "Unknown";
    }

    std::vector<News::NewsItem> select_new(std::vector<News::NewsItem> items,
                                           const std::unordered_set<std::string>& known)
    {
        std::unordered_set<std::string> seen;
        std::vector<News::NewsItem> fresh;

        for(auto& item : items)
        {
            if(known.count(item.guid) || !seen.insert(item.guid).second)
                continue;
            fresh.push_back(std::move(item));
        }

        std::stable_sort(fresh.begin(), fresh.end(), [](const News::NewsItem& a, const News::NewsItem& b)
        {
            if(a.pub_date && b.pub_date)
                return *a.pub_date < *b.pub_date;
            return a.pub_date.has_value() && !b.pub_date.has_value();
        });

        return fresh;
    }

    Controller::Controller(const RunConfig& config, Http::Transport& transport, Http::Sleeper sleeper)
        : config_(config), transport_(transport), sleeper_(std::move(sleeper)) {}

    void Controller::transition(State next)
    {
        std::cout << "[Pipeline] " << to_string(state_) << " -> " << to_string(next) << '\n';
        state_ = next;
    }

    RunReport Controller::run()
    {
        RunReport report;
        state_ = State::Init;

        std::unique_ptr<NewsStore> store;
        std::unordered_set<std::string> known;

        auto fail = [&](const std::exception& e)
        {
            report.failed_in = state_;
            report.error = e.what();
            if(store)
                store->close();
            transition(State::Aborted);
            report.state = state_;
            std::cerr << "[Pipeline] Run aborted in " << to_string(report.failed_in) << ": " << report.error << '\n';
            return report;
        };

        auto run_start = std::chrono::steady_clock::now();

        try
        {
            if(config_.initialize)
                std::cout << "[Pipeline] Initialize mode: delivery history will be discarded\n";

            store = std::make_unique<NewsStore>(config_.state_db_path, config_.initialize);
            known = store->known_guids();
        }
        catch(const StoreError& e)
        {
            return fail(e);
        }

        std::vector<News::NewsItem> items;
        try
        {
            transition(State::Fetching);
            Fetcher fetcher(transport_, sleeper_);
            items = News::FeedParser::parse(fetcher.fetch(config_.feed.url));
            report.fetched = items.size();
        }
        catch(const FetchError& e)
        {
            return fail(e);
        }

        transition(State::Filtering);
        LinkResolver resolver(transport_);
        Filters::FilterEngine engine(config_, resolver);
        items = engine.apply(std::move(items), known);
        report.filtered = items.size();

        transition(State::Diffing);
        auto fresh = select_new(std::move(items), known);
        report.fresh = fresh.size();
        std::cout << "[Pipeline] " << report.fresh << " new of " << report.filtered << " filtered ("
                  << known.size() << " already delivered)\n";

        transition(State::Delivering);
        auto deliver_start = std::chrono::steady_clock::now();
        Delivery::WebhookSender sender(transport_, sleeper_, config_);

        std::vector<News::NewsItem> delivered;
        for(const auto& item : fresh)
        {
            auto result = sender.deliver(item);
            if(result.ok())
            {
                delivered.push_back(item);
                continue;
            }

            ++report.failed;
            std::cerr << "[Pipeline] Delivery of " << item.guid << " failed ("
                      << Delivery::to_string(*result.error) << "), will retry next run\n";
        }
        report.delivered = delivered.size();

        auto deliver_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - deliver_start).count();
        std::cout << "[Pipeline] Delivered " << report.delivered << "/" << report.fresh
                  << " in " << deliver_ms << " ms\n";

        try
        {
            transition(State::Persisting);
            store->record(delivered);
            store->close();
        }
        catch(const StoreError& e)
        {
            return fail(e);
        }

        transition(State::Done);
        report.state = state_;

        auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - run_start).count();
        std::cout << "[Pipeline] Run complete in " << total_ms << " ms: fetched " << report.fetched
                  << ", filtered " << report.filtered << ", new " << report.fresh
                  << ", delivered " << report.delivered << ", failed " << report.failed << '\n';
        return report;
    }
}
