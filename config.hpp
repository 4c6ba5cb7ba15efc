#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace config
{
    inline constexpr std::string_view DB_PATH = "google_news.db";

    inline constexpr std::string_view GOOGLE_NEWS_HOST = "https://news.google.com";
    inline constexpr std::string_view DEFAULT_COUNTRY = "US";

    inline constexpr std::string_view USER_AGENT =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) gnews-relay/1.0";

    // HTTP
    inline constexpr std::chrono::seconds HTTP_CONNECT_TIMEOUT{10};
    inline constexpr std::chrono::seconds HTTP_READ_TIMEOUT{30};

    // Feed retrieval
    inline constexpr int FETCH_MAX_ATTEMPTS = 3;
    inline constexpr std::chrono::seconds FETCH_RETRY_DELAY{5};

    // Webhook delivery
    inline constexpr int DELIVERY_MAX_ATTEMPTS = 3;
    inline constexpr int DELIVERY_MAX_RATE_LIMIT_WAITS = 5;
    inline constexpr std::chrono::seconds DELIVERY_RETRY_DELAY{5};
    inline constexpr std::chrono::seconds DELIVERY_MAX_RATE_LIMIT_WAIT{60};
    inline constexpr std::chrono::milliseconds DELIVERY_PACING{3000};
    inline constexpr std::size_t DISCORD_MESSAGE_LIMIT = 2000;

    // Origin link lookup
    inline constexpr int LINK_RESOLVE_MAX_ATTEMPTS = 2;
}
