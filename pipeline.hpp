#pragma once

#include "http_client.hpp"
#include "news_item.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

struct RunConfig;

namespace Pipeline
{
    enum class State
    {
        Init,
        Fetching,
        Filtering,
        Diffing,
        Delivering,
        Persisting,
        Done,
        Aborted
    };

    [[nodiscard]] std::string_view to_string(State state) noexcept;

    struct RunReport
    {
        State state = State::Init;
        State failed_in = State::Init;   // meaningful when Aborted
        std::size_t fetched = 0;
        std::size_t filtered = 0;
        std::size_t fresh = 0;
        std::size_t delivered = 0;
        std::size_t failed = 0;
        std::string error;

        [[nodiscard]] int exit_code() const noexcept { return state == State::Done ? 0 : 1; }
    };

    // Unknown and not repeated within the feed, oldest first.
    // Undated items follow the dated ones in feed order.
    [[nodiscard]] std::vector<News::NewsItem> select_new(std::vector<News::NewsItem> items,
                                                         const std::unordered_set<std::string>& known);

    // One fetch, filter, diff, deliver, persist cycle.
    class Controller
    {
    public:
        Controller(const RunConfig& config, Http::Transport& transport, Http::Sleeper sleeper);

        [[nodiscard]] RunReport run();

        [[nodiscard]] State state() const noexcept { return state_; }

    private:
        const RunConfig& config_;
        Http::Transport& transport_;
        Http::Sleeper sleeper_;
        State state_ = State::Init;

        void transition(State next);
    };
}
