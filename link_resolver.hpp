#pragma once

#include "http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

// Turns news.google.com/rss/articles/<id> links into the publisher URL.
class LinkResolver
{
public:
    explicit LinkResolver(Http::Transport& transport);

    // Never throws; returns the input link when every strategy fails.
    [[nodiscard]] std::string resolve(const std::string& link);

    // Article id of a news.google.com ".../articles/<id>" link, if it is one.
    [[nodiscard]] static std::optional<std::string> article_id(std::string_view link);

    // Payload embedded in an article id: the publisher URL, or an "AU_yqL..."
    // token that needs the batchexecute call.
    [[nodiscard]] static std::optional<std::string> decode_article_id(std::string_view id);

    [[nodiscard]] static std::optional<std::string> extract_url(std::string_view decoded);
    [[nodiscard]] static std::optional<std::string> extract_youtube_id(std::string_view decoded);

    // \uXXXX escapes and percent-encoding undone, stray backslashes removed.
    [[nodiscard]] static std::string clean_url(std::string_view url);

private:
    Http::Transport& transport_;

    std::optional<std::string> batch_execute(const std::string& id);
    std::optional<std::string> follow_redirects(const std::string& link);
};
