#pragma once

#include "http_client.hpp"
#include "news_item.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

struct RunConfig;

namespace Delivery
{
    enum class DeliveryError
    {
        RateLimited,
        Rejected,
        ServerError,
        Network,
        Format
    };

    [[nodiscard]] std::string_view to_string(DeliveryError error) noexcept;

    struct DeliveryResult
    {
        std::optional<DeliveryError> error;
        int status = 0;
        int attempts = 0;
        std::string detail;

        [[nodiscard]] bool ok() const noexcept { return !error; }
    };

    // [ ] < > become full-width so titles cannot break Discord markdown.
    [[nodiscard]] std::string replace_brackets(std::string_view text);

    // Length as Discord counts it.
    [[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

    // Posts one item per message to a Discord webhook, sequentially.
    class WebhookSender
    {
    public:
        WebhookSender(Http::Transport& transport, Http::Sleeper sleeper, const RunConfig& config);

        // nullopt if the item cannot fit a message even without related coverage.
        [[nodiscard]] std::optional<std::string> format_message(const News::NewsItem& item) const;

        // {"content": ..., "username": ..., "avatar_url": ...}
        [[nodiscard]] std::string payload(const std::string& content) const;

        [[nodiscard]] DeliveryResult deliver(const News::NewsItem& item);

    private:
        Http::Transport& transport_;
        Http::Sleeper sleeper_;
        const RunConfig& config_;

        [[nodiscard]] std::string endpoint() const;
        [[nodiscard]] std::chrono::milliseconds retry_after(const Http::Response& res) const;
    };
}
