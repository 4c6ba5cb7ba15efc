#pragma once

#include "http_client.hpp"
#include "news_item.hpp"
#include "run_config.hpp"

#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace testing_support
{
    struct Request
    {
        std::string method;
        std::string url;
        std::string body;
        std::string content_type;
        std::map<std::string, std::string> headers;
    };

    inline Http::Response respond(int status, std::string body = "",
                                  std::map<std::string, std::string> headers = {})
    {
        Http::Response res;
        res.status = status;
        res.body = std::move(body);
        res.headers = std::move(headers);
        return res;
    }

    inline Http::Response network_error()
    {
        Http::Response res;
        res.failure = Http::Failure::Network;
        res.error = "Could not establish connection";
        return res;
    }

    inline Http::Response timeout_error()
    {
        Http::Response res;
        res.failure = Http::Failure::Timeout;
        res.error = "Connection timed out";
        return res;
    }

    // Scripted transport. Responses are queued per URL prefix; the last one
    // of a queue repeats. Unscripted URLs answer 404.
    class FakeTransport : public Http::Transport
    {
    public:
        void on_get(std::string url_prefix, Http::Response res)
        {
            gets_[std::move(url_prefix)].push_back(std::move(res));
        }

        void on_post(std::string url_prefix, Http::Response res)
        {
            posts_[std::move(url_prefix)].push_back(std::move(res));
        }

        Http::Response get(const std::string& url, bool) override
        {
            requests.push_back(Request{"GET", url, "", "", {}});
            auto res = next(gets_, url);
            if(res.location.empty())
                res.location = url;
            return res;
        }

        Http::Response post(const std::string& url,
                            const std::string& body,
                            const std::string& content_type,
                            const std::map<std::string, std::string>& headers) override
        {
            requests.push_back(Request{"POST", url, body, content_type, headers});
            return next(posts_, url);
        }

        [[nodiscard]] std::vector<Request> requests_to(std::string_view prefix) const
        {
            std::vector<Request> out;
            for(const auto& r : requests)
                if(r.url.rfind(prefix, 0) == 0) out.push_back(r);
            return out;
        }

        std::vector<Request> requests;

    private:
        using Script = std::map<std::string, std::deque<Http::Response>>;

        Script gets_;
        Script posts_;

        static Http::Response next(Script& script, const std::string& url)
        {
            // longest matching prefix wins
            Script::iterator match = script.end();
            for(auto it = script.begin(); it != script.end(); ++it)
            {
                if(url.rfind(it->first, 0) == 0 &&
                   (match == script.end() || it->first.size() > match->first.size()))
                    match = it;
            }

            if(match == script.end() || match->second.empty())
                return respond(404, "not scripted");

            auto& queue = match->second;
            Http::Response res = queue.front();
            if(queue.size() > 1)
                queue.pop_front();
            return res;
        }
    };

    struct SleepLog
    {
        std::vector<std::chrono::milliseconds> waits;

        Http::Sleeper sleeper()
        {
            return [this](std::chrono::milliseconds d) { waits.push_back(d); };
        }
    };

    // Unique path under the temp directory, removed with its journal files.
    class TempPath
    {
    public:
        explicit TempPath(std::string_view stem = "gnews_test")
        {
            std::random_device rd;
            path_ = (std::filesystem::temp_directory_path() /
                     (std::string(stem) + "_" + std::to_string(rd()) + ".db")).string();
        }

        ~TempPath()
        {
            std::error_code ec;
            for(const char* suffix : {"", "-journal", "-wal", "-shm"})
                std::filesystem::remove(path_ + suffix, ec);
        }

        TempPath(const TempPath&) = delete;
        TempPath& operator=(const TempPath&) = delete;

        [[nodiscard]] const std::string& str() const noexcept { return path_; }

        void write(std::string_view content) const
        {
            std::ofstream out(path_, std::ios::binary | std::ios::trunc);
            out << content;
        }

    private:
        std::string path_;
    };

    struct FeedEntry
    {
        std::string guid;
        std::string title;
        std::string link;
        std::string pub_date;   // RFC 822 text, empty for none
        std::string source;
    };

    inline std::string xml_escape(std::string_view text)
    {
        std::string out;
        for(char c : text)
        {
            switch(c)
            {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                default: out += c;
            }
        }
        return out;
    }

    inline std::string rss(const std::vector<FeedEntry>& entries)
    {
        std::string xml =
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<rss version=\"2.0\"><channel><title>Top stories</title>\n";

        for(const auto& e : entries)
        {
            xml += "<item>";
            if(!e.guid.empty()) xml += "<guid isPermaLink=\"false\">" + xml_escape(e.guid) + "</guid>";
            xml += "<title>" + xml_escape(e.title) + "</title>";
            if(!e.link.empty()) xml += "<link>" + xml_escape(e.link) + "</link>";
            if(!e.pub_date.empty()) xml += "<pubDate>" + e.pub_date + "</pubDate>";
            if(!e.source.empty()) xml += "<source url=\"https://example.com\">" + xml_escape(e.source) + "</source>";
            xml += "</item>\n";
        }

        return xml + "</channel></rss>\n";
    }

    inline std::string rfc822(News::Timestamp tp)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
        return buf;
    }

    constexpr const char* FEED_URL = "https://news.google.com/rss?hl=en-US&gl=US&ceid=US:en";
    constexpr const char* WEBHOOK_URL = "https://discord.com/api/webhooks/1/token";

    inline RunConfig make_config(const std::string& db_path)
    {
        RunConfig cfg;
        cfg.feed = GoogleNews::select_top("US");
        cfg.feed.url = FEED_URL;
        cfg.webhook_url = WEBHOOK_URL;
        cfg.username = "News Bot";
        cfg.origin_link = false;
        cfg.state_db_path = db_path;
        cfg.run_started = std::chrono::system_clock::now();
        return cfg;
    }
}
