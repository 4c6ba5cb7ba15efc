#include "sender.hpp"
#include "config.hpp"
#include "dates.hpp"
#include "run_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace Delivery
{
    namespace
    {
        bool ends_with_space(const std::string& text)
        {
            return !text.empty() && std::isspace(static_cast<unsigned char>(text.back()));
        }

        bool is_korean(std::string_view language)
        {
            return language.rfind("ko", 0) == 0;
        }

        std::string related_line(const News::RelatedArticle& article)
        {
            std::string line = "- [" + replace_brackets(article.title) + "](<" + article.link + ">)";
            if(!article.press.empty())
                line += " | " + article.press;
            return line;
        }

        std::string compose(const std::string& head,
                            const std::vector<std::string>& related,
                            const std::string& coverage,
                            const std::string& date_line)
        {
            std::string body;
            for(const auto& line : related)
            {
                if(!body.empty()) body += '\n';
                body += line;
            }
            if(!coverage.empty())
            {
                if(!body.empty()) body += "\n\n";
                body += coverage;
            }

            std::string message = head;
            if(!body.empty())
                message += "\n>>> " + body + "\n\n";
            else
                message += "\n\n";
            return message + date_line;
        }
    }

    std::string_view to_string(DeliveryError error) noexcept
    {
        switch(error)
        {
            case DeliveryError::RateLimited: return "rate_limited";
            case DeliveryError::Rejected: return "rejected";
            case DeliveryError::ServerError: return "server_error";
            case DeliveryError::Network: return "network";
            case DeliveryError::Format: return "format";
        }
        return "unknown";
    }

    std::string replace_brackets(std::string_view text)
    {
        std::string out;
        for(size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            bool opening = c == '[' || c == '<';
            bool closing = c == ']' || c == '>';

            if(!opening && !closing)
            {
                out += c;
                continue;
            }

            if(opening && !out.empty() && !ends_with_space(out))
                out += ' ';

            switch(c)
            {
                case '[': out += "［"; break;
                case ']': out += "］"; break;
                case '<': out += "〈"; break;
                case '>': out += "〉"; break;
            }

            if(closing && i + 1 < text.size() && !std::isspace(static_cast<unsigned char>(text[i + 1])))
                out += ' ';
        }
        return out;
    }

    std::size_t utf8_length(std::string_view text) noexcept
    {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
            [](unsigned char c) { return (c & 0xC0) != 0x80; }));
    }

    WebhookSender::WebhookSender(Http::Transport& transport, Http::Sleeper sleeper, const RunConfig& config)
        : transport_(transport), sleeper_(std::move(sleeper)), config_(config) {}

    std::optional<std::string> WebhookSender::format_message(const News::NewsItem& item) const
    {
        std::string head = config_.feed.label.line() + "\n**" + replace_brackets(item.title) + "**\n" + item.link;
        std::string date_line = "📅 " + (item.pub_date ? Dates::format_utc(*item.pub_date) + " UTC" : std::string("unknown"));

        std::vector<std::string> related;
        related.reserve(item.related.size());
        for(const auto& article : item.related)
            related.push_back(related_line(article));

        std::string coverage;
        if(!item.coverage_link.empty())
        {
            coverage = is_korean(config_.feed.language)
                ? "▶️ [Google 뉴스에서 전체 콘텐츠 보기](<" + item.coverage_link + ">)"
                : "▶️ [View Full Coverage on Google News](<" + item.coverage_link + ">)";
        }

        // Related lines go first, then the coverage link; title and link are never cut.
        std::string message = compose(head, related, coverage, date_line);
        while(utf8_length(message) > config::DISCORD_MESSAGE_LIMIT)
        {
            if(!related.empty())
                related.pop_back();
            else if(!coverage.empty())
                coverage.clear();
            else
                return std::nullopt;

            message = compose(head, related, coverage, date_line);
        }
        return message;
    }

    std::string WebhookSender::payload(const std::string& content) const
    {
        json body;
        body["content"] = content;
        if(!config_.username.empty())
            body["username"] = config_.username;
        if(!config_.avatar_url.empty())
            body["avatar_url"] = config_.avatar_url;
        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::string WebhookSender::endpoint() const
    {
        const std::string& url = config_.webhook_url;
        if(url.find("wait=") != std::string::npos)
            return url;
        return url + (url.find('?') == std::string::npos ? "?wait=true" : "&wait=true");
    }

    std::chrono::milliseconds WebhookSender::retry_after(const Http::Response& res) const
    {
        std::optional<double> seconds;

        if(!res.body.empty())
        {
            try
            {
                auto body = json::parse(res.body);
                if(body.is_object() && body.contains("retry_after") && body["retry_after"].is_number())
                    seconds = body["retry_after"].get<double>();
            }
            catch(const json::exception& e)
            {
                std::cerr << "[Sender] 429 body is not JSON: " << e.what() << '\n';
            }
        }

        if(!seconds)
        {
            if(auto header = res.header("retry-after"))
            {
                try
                {
                    seconds = std::stod(*header);
                }
                catch(const std::exception& e)
                {
                    std::cerr << "[Sender] Unreadable Retry-After header \"" << *header << "\": " << e.what() << '\n';
                }
            }
        }

        const std::chrono::milliseconds longest = config::DELIVERY_MAX_RATE_LIMIT_WAIT;
        if(!seconds || !std::isfinite(*seconds) || *seconds < 0)
            return std::min<std::chrono::milliseconds>(config::DELIVERY_RETRY_DELAY, longest);

        double ms = std::ceil(std::min(*seconds * 1000.0, static_cast<double>(longest.count())));
        return std::chrono::milliseconds(static_cast<long long>(ms));
    }

    DeliveryResult WebhookSender::deliver(const News::NewsItem& item)
    {
        DeliveryResult result;

        auto content = format_message(item);
        if(!content)
        {
            result.error = DeliveryError::Format;
            result.detail = "message exceeds " + std::to_string(config::DISCORD_MESSAGE_LIMIT) + " characters";
            std::cerr << "[Sender] Cannot format " << item.guid << ": " << result.detail << '\n';
            return result;
        }

        const std::string body = payload(*content);
        const std::string url = endpoint();

        int failures = 0;
        int rate_limit_waits = 0;

        while(true)
        {
            ++result.attempts;
            auto send_start = std::chrono::steady_clock::now();
            auto res = transport_.post(url, body, "application/json", {});
            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - send_start).count();

            result.status = res.status;

            if(res.success())
            {
                result.error.reset();
                std::cout << "[Sender] Posted \"" << item.title << "\" (" << latency << " ms)\n";
                sleeper_(config::DELIVERY_PACING);
                return result;
            }

            if(!res.transport_ok())
            {
                result.error = DeliveryError::Network;
                result.detail = res.error;
            }
            else if(res.status == 429)
            {
                if(rate_limit_waits >= config::DELIVERY_MAX_RATE_LIMIT_WAITS)
                {
                    result.error = DeliveryError::RateLimited;
                    result.detail = "still rate limited after " + std::to_string(rate_limit_waits) + " waits";
                    std::cerr << "[Sender] " << result.detail << ": " << item.guid << '\n';
                    return result;
                }

                ++rate_limit_waits;
                auto wait = retry_after(res);
                std::cerr << "[Sender] Rate limited, waiting " << wait.count() << " ms\n";
                sleeper_(wait);
                continue;
            }
            else if(res.status >= 500)
            {
                result.error = DeliveryError::ServerError;
                result.detail = "HTTP " + std::to_string(res.status);
            }
            else
            {
                result.error = DeliveryError::Rejected;
                result.detail = "HTTP " + std::to_string(res.status) + ": " + res.body;
                std::cerr << "[Sender] Webhook rejected " << item.guid << " with HTTP " << res.status << '\n';
                return result;
            }

            ++failures;
            std::cerr << "[Sender] Attempt " << failures << "/" << config::DELIVERY_MAX_ATTEMPTS
                      << " failed (" << result.detail << ")\n";

            if(failures >= config::DELIVERY_MAX_ATTEMPTS)
                return result;

            sleeper_(config::DELIVERY_RETRY_DELAY);
        }
    }
}
