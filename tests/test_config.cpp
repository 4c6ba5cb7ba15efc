#include <gtest/gtest.h>

#include "errors.hpp"
#include "google_news.hpp"
#include "run_config.hpp"

#include <map>
#include <string>

namespace {

RunConfig::Lookup env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

const char* WEBHOOK = "https://discord.com/api/webhooks/1/token";

}

// ============================================================================
// Feed selection
// ============================================================================

TEST(GoogleNewsTest, TopStoriesUrlAndLabel) {
    auto feed = GoogleNews::select_top("us");

    EXPECT_EQ(feed.mode, GoogleNews::FeedMode::Top);
    EXPECT_EQ(feed.url, "https://news.google.com/rss?hl=en-US&gl=US&ceid=US%3Aen");
    EXPECT_EQ(feed.label.line(), "`Google News - Top Stories - United States \xF0\x9F\x87\xBA\xF0\x9F\x87\xB8`");
}

TEST(GoogleNewsTest, KoreanTopStories) {
    auto feed = GoogleNews::select_top("KR");

    EXPECT_EQ(feed.url, "https://news.google.com/rss?hl=ko&gl=KR&ceid=KR%3Ako");
    EXPECT_EQ(feed.label.prefix, "Google 뉴스");
    EXPECT_EQ(feed.label.category, "주요 뉴스");
}

TEST(GoogleNewsTest, TopicUsesLanguageSpecificId) {
    auto en = GoogleNews::select_topic("technology", "US");
    EXPECT_EQ(en.url,
        "https://news.google.com/rss/topics/CAAqJggKIiBDQkFTRWdvSUwyMHZNRGRqTVhZU0FtVnVHZ0pWVXlnQVAB"
        "?hl=en-US&gl=US&ceid=US%3Aen");
    EXPECT_EQ(en.label.category, "Topics");
    EXPECT_EQ(en.label.topic, "Technology");

    auto ko = GoogleNews::select_topic("Technology", "KR");
    EXPECT_EQ(ko.url,
        "https://news.google.com/rss/topics/CAAqJggKIiBDQkFTRWdvSUwyMHZNRGRqTVhZU0FtdHZHZ0pMVWlnQVAB"
        "?hl=ko&gl=KR&ceid=KR%3Ako");
    EXPECT_EQ(ko.label.topic, "기술");
}

TEST(GoogleNewsTest, UrlModeRecognisesTopicAndRegion) {
    auto feed = GoogleNews::select_url(
        "https://news.google.com/rss/topics/CAAqJggKIiBDQkFTRWdvSUwyMHZNRFp1ZEdvU0FtVnVHZ0pWVXlnQVAB?hl=de&gl=DE&ceid=DE:de");

    EXPECT_EQ(feed.mode, GoogleNews::FeedMode::Url);
    EXPECT_EQ(feed.language, "de");
    EXPECT_EQ(feed.country, "DE");
    EXPECT_EQ(feed.topic_keyword, "sports");
    EXPECT_EQ(feed.label.prefix, "Google Nachrichten");
    EXPECT_EQ(feed.label.topic, "Sports");
    EXPECT_EQ(feed.label.flag, "\xF0\x9F\x87\xA9\xF0\x9F\x87\xAA");
}

TEST(GoogleNewsTest, UnknownSelectorsThrow) {
    EXPECT_THROW((void)GoogleNews::select_top("XX"), ConfigError);
    EXPECT_THROW((void)GoogleNews::select_topic("gardening", "US"), ConfigError);
    EXPECT_THROW((void)GoogleNews::select_url(""), ConfigError);
    EXPECT_THROW((void)GoogleNews::parse_mode("everything"), ConfigError);
}

TEST(GoogleNewsTest, CountryFlag) {
    EXPECT_EQ(GoogleNews::country_flag("kr"), "\xF0\x9F\x87\xB0\xF0\x9F\x87\xB7");
    EXPECT_EQ(GoogleNews::country_flag("USA"), "");
    EXPECT_EQ(GoogleNews::country_flag(""), "");
}

// ============================================================================
// RunConfig
// ============================================================================

TEST(RunConfigTest, DefaultsFromMinimalEnvironment) {
    auto cfg = RunConfig::from_lookup(env({{"DISCORD_WEBHOOK", WEBHOOK}}));

    EXPECT_EQ(cfg.webhook_url, WEBHOOK);
    EXPECT_FALSE(cfg.initialize);
    EXPECT_TRUE(cfg.origin_link);
    EXPECT_FALSE(cfg.date_filter.active());
    EXPECT_TRUE(cfg.advanced_filter.empty());
    EXPECT_EQ(cfg.state_db_path, "google_news.db");
    EXPECT_EQ(cfg.feed.mode, GoogleNews::FeedMode::Top);
    EXPECT_EQ(cfg.feed.country, "US");
}

TEST(RunConfigTest, MissingWebhookIsConfigError) {
    EXPECT_THROW((void)RunConfig::from_lookup(env({})), ConfigError);
    EXPECT_THROW((void)RunConfig::from_lookup(env({{"DISCORD_WEBHOOK", "   "}})), ConfigError);
}

TEST(RunConfigTest, RssUrlImpliesUrlMode) {
    auto cfg = RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"RSS_URL", "https://news.google.com/rss/search?q=rust&hl=en-US&gl=US&ceid=US:en"},
    }));

    EXPECT_EQ(cfg.feed.mode, GoogleNews::FeedMode::Url);
    EXPECT_EQ(cfg.feed.url, "https://news.google.com/rss/search?q=rust&hl=en-US&gl=US&ceid=US:en");
    EXPECT_EQ(cfg.feed.label.category, "RSS");
}

TEST(RunConfigTest, TopicModeNeedsKeyword) {
    EXPECT_THROW((void)RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"FEED_MODE", "topic"},
    })), ConfigError);

    auto cfg = RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"FEED_MODE", "topic"},
        {"TOPIC_KEYWORD", "science"},
        {"TOP_COUNTRY", "GB"},
    }));
    EXPECT_EQ(cfg.feed.topic_keyword, "science");
    EXPECT_EQ(cfg.feed.country, "GB");
}

TEST(RunConfigTest, BooleansAndPaths) {
    auto cfg = RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"INITIALIZE_MODE", "True"},
        {"ORIGIN_LINK", "no"},
        {"STATE_DB_PATH", "/tmp/state.db"},
        {"DISCORD_USERNAME", "Relay"},
    }));

    EXPECT_TRUE(cfg.initialize);
    EXPECT_FALSE(cfg.origin_link);
    EXPECT_EQ(cfg.state_db_path, "/tmp/state.db");
    EXPECT_EQ(cfg.username, "Relay");

    auto unrecognised = RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"ORIGIN_LINK", "maybe"},
    }));
    EXPECT_TRUE(unrecognised.origin_link);
}

TEST(RunConfigTest, MalformedFiltersFailBeforeAnyIo) {
    EXPECT_THROW((void)RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"DATE_FILTER", "past:forever"},
    })), FilterError);

    EXPECT_THROW((void)RunConfig::from_lookup(env({
        {"DISCORD_WEBHOOK", WEBHOOK},
        {"ADVANCED_FILTER", "\"open quote"},
    })), FilterError);
}

TEST(RunConfigTest, ParseBool) {
    EXPECT_EQ(parse_bool("yes"), true);
    EXPECT_EQ(parse_bool(" 0 "), false);
    EXPECT_EQ(parse_bool("N"), false);
    EXPECT_FALSE(parse_bool("perhaps").has_value());
}
