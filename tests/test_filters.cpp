#include <gtest/gtest.h>

#include "dates.hpp"
#include "errors.hpp"
#include "filters.hpp"
#include "link_resolver.hpp"
#include "test_support.hpp"

#include <chrono>

using namespace std::chrono_literals;
using Filters::AdvancedFilter;
using Filters::DateFilter;

namespace {

News::Timestamp at(const char* iso) {
    return *Dates::parse_iso8601(iso);
}

News::NewsItem item(const std::string& guid, const std::string& title,
                    std::optional<News::Timestamp> pub_date = std::nullopt) {
    News::NewsItem n;
    n.guid = guid;
    n.title = title;
    n.link = "https://example.com/" + guid;
    n.pub_date = pub_date;
    return n;
}

}

// ============================================================================
// Date filter
// ============================================================================

TEST(DateFilterTest, EmptyExpressionIsInactive) {
    auto filter = DateFilter::parse("   ");
    EXPECT_FALSE(filter.active());
    EXPECT_TRUE(filter.accepts(std::nullopt, std::chrono::system_clock::now()));
}

TEST(DateFilterTest, PastOneHourWindow) {
    auto filter = DateFilter::parse("past:1h");
    auto now = std::chrono::system_clock::now();

    EXPECT_TRUE(filter.accepts(now - 30min, now));
    EXPECT_FALSE(filter.accepts(now - 2h, now));
}

TEST(DateFilterTest, PastUnits) {
    auto now = at("2026-10-19T12:00:00Z");

    EXPECT_TRUE(DateFilter::parse("past:2d").accepts(now - 47h, now));
    EXPECT_FALSE(DateFilter::parse("past:2d").accepts(now - 49h, now));
    EXPECT_TRUE(DateFilter::parse("past:1m").accepts(now - 24h * 29, now));
    EXPECT_FALSE(DateFilter::parse("past:1m").accepts(now - 24h * 31, now));
    EXPECT_TRUE(DateFilter::parse("past:1y").accepts(now - 24h * 364, now));
    EXPECT_FALSE(DateFilter::parse("past:1y").accepts(now - 24h * 366, now));
}

TEST(DateFilterTest, UnknownDateIsExcludedWhileActive) {
    auto filter = DateFilter::parse("past:1h");
    EXPECT_FALSE(filter.accepts(std::nullopt, std::chrono::system_clock::now()));
}

TEST(DateFilterTest, SinceUntilIsInclusiveByDay) {
    auto filter = DateFilter::parse("since:2026-10-01 until:2026-10-19");
    auto now = at("2026-10-25T00:00:00Z");

    EXPECT_FALSE(filter.accepts(at("2026-09-30T23:59:59Z"), now));
    EXPECT_TRUE(filter.accepts(at("2026-10-01T00:00:00Z"), now));
    EXPECT_TRUE(filter.accepts(at("2026-10-19T23:59:59Z"), now));
    EXPECT_FALSE(filter.accepts(at("2026-10-20T00:00:00Z"), now));
}

TEST(DateFilterTest, PastSupersedesSinceUntil) {
    auto filter = DateFilter::parse("since:2020-01-01 until:2020-01-02 past:1d");
    auto now = at("2026-10-19T12:00:00Z");

    EXPECT_TRUE(filter.accepts(now - 1h, now));
    EXPECT_FALSE(filter.accepts(at("2020-01-01T12:00:00Z"), now));
}

TEST(DateFilterTest, MalformedExpressionsThrow) {
    EXPECT_THROW((void)DateFilter::parse("past:1w"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("past:h"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("since:yesterday"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("after:2026-01-01"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("6h"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("since:2026-02-01 until:2026-01-01"), FilterError);
}

TEST(DateFilterTest, WindowBeyondClockRangeIsRejected) {
    EXPECT_THROW((void)DateFilter::parse("past:300y"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("past:999999d"), FilterError);
    EXPECT_THROW((void)DateFilter::parse("past:9999m"), FilterError);

    auto wide = DateFilter::parse("past:200y");
    auto now = at("2026-10-19T12:00:00Z");
    EXPECT_TRUE(wide.accepts(now - 30min, now));
    EXPECT_TRUE(wide.accepts(at("1900-01-01T00:00:00Z"), now));

    auto hours = DateFilter::parse("past:999999h");
    EXPECT_TRUE(hours.accepts(now - 30min, now));
}

// ============================================================================
// Advanced filter
// ============================================================================

TEST(AdvancedFilterTest, EmptyMatchesEverything) {
    auto filter = AdvancedFilter::parse("");
    EXPECT_TRUE(filter.empty());
    EXPECT_TRUE(filter.matches("anything"));
}

TEST(AdvancedFilterTest, IncludeKeywordsAreAndedCaseInsensitive) {
    auto filter = AdvancedFilter::parse("Apple +earnings");
    EXPECT_TRUE(filter.matches("APPLE reports record EARNINGS"));
    EXPECT_FALSE(filter.matches("Apple launches new phone"));
}

TEST(AdvancedFilterTest, ExcludeKeyword) {
    auto filter = AdvancedFilter::parse("apple -rumor");
    EXPECT_TRUE(filter.matches("Apple confirms event date"));
    EXPECT_FALSE(filter.matches("Apple rumor mill spins again"));
}

TEST(AdvancedFilterTest, QuotedPhrase) {
    auto filter = AdvancedFilter::parse("\"interest rates\" -\"rate cut\"");
    EXPECT_TRUE(filter.matches("Central bank holds interest rates steady"));
    EXPECT_FALSE(filter.matches("Interest rates fall after rate cut"));
    EXPECT_FALSE(filter.matches("Rates of interest"));
}

TEST(AdvancedFilterTest, OrGroups) {
    auto pipe = AdvancedFilter::parse("tesla | rivian -recall");
    EXPECT_TRUE(pipe.matches("Tesla recall widens"));
    EXPECT_TRUE(pipe.matches("Rivian posts deliveries"));
    EXPECT_FALSE(pipe.matches("Rivian recall announced"));
    EXPECT_FALSE(pipe.matches("Ford unveils truck"));

    auto word = AdvancedFilter::parse("tesla OR rivian");
    EXPECT_TRUE(word.matches("rivian"));
    EXPECT_TRUE(word.matches("TESLA"));
}

TEST(AdvancedFilterTest, RegexAtom) {
    auto filter = AdvancedFilter::parse("/gpt-?[0-9]+/ -/\\bdeal\\b/");
    EXPECT_TRUE(filter.matches("OpenAI ships GPT5"));
    EXPECT_TRUE(filter.matches("gpt-4 benchmarks"));
    EXPECT_FALSE(filter.matches("GPT-4 deal signed"));
    EXPECT_FALSE(filter.matches("Chatbot news"));
}

TEST(AdvancedFilterTest, MalformedExpressionsThrow) {
    EXPECT_THROW((void)AdvancedFilter::parse("\"unterminated phrase"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("/unterminated"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("/[unclosed/"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("apple -"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("apple + pie"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("\"\""), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("apple |"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("| apple"), FilterError);
    EXPECT_THROW((void)AdvancedFilter::parse("apple OR OR pie"), FilterError);
}

TEST(AdvancedFilterTest, SearchableTextIncludesSourceAndRelated) {
    auto n = item("a", "Headline");
    n.source = "Example Times";
    n.related.push_back(News::RelatedArticle{"Second angle", "https://x", "Daily Ledger"});

    auto text = Filters::searchable_text(n);
    EXPECT_NE(text.find("Headline"), std::string::npos);
    EXPECT_NE(text.find("Example Times"), std::string::npos);
    EXPECT_NE(text.find("Second angle"), std::string::npos);
    EXPECT_NE(text.find("Daily Ledger"), std::string::npos);

    EXPECT_TRUE(AdvancedFilter::parse("ledger").matches(text));
}

// ============================================================================
// Filter engine
// ============================================================================

class FilterEngineTest : public ::testing::Test {
protected:
    testing_support::FakeTransport transport;
    LinkResolver resolver{transport};
    RunConfig config = testing_support::make_config("unused.db");
};

TEST_F(FilterEngineTest, NoFiltersPassEverythingInOrder) {
    Filters::FilterEngine engine(config, resolver);
    auto out = engine.apply({item("a", "A"), item("b", "B"), item("c", "C")});

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].guid, "a");
    EXPECT_EQ(out[1].guid, "b");
    EXPECT_EQ(out[2].guid, "c");
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(FilterEngineTest, DateThenAdvancedFilter) {
    config.date_filter = DateFilter::parse("past:1h");
    config.advanced_filter = AdvancedFilter::parse("-sports");
    auto now = config.run_started;

    Filters::FilterEngine engine(config, resolver);
    auto out = engine.apply({
        item("recent", "Election results", now - 30min),
        item("old", "Election preview", now - 2h),
        item("sports", "Sports roundup", now - 10min),
        item("undated", "Undated story"),
    });

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].guid, "recent");
}

TEST_F(FilterEngineTest, OriginLinkFallsBackToAggregatorLink) {
    config.origin_link = true;
    const std::string google = "https://news.google.com/rss/articles/not-base64-at-all!!?oc=5";
    transport.on_get("https://news.google.com/rss/articles/", testing_support::network_error());

    auto n = item("a", "A");
    n.link = google;

    Filters::FilterEngine engine(config, resolver);
    auto out = engine.apply({n});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].link, google);
}

TEST_F(FilterEngineTest, OriginLinkRewritesDecodableLinks) {
    config.origin_link = true;

    auto n = item("a", "A");
    n.link = "https://news.google.com/rss/articles/CBMiKWh0dHBzOi8vd3d3LmV4YW1wbGUuY29tL25ld3Mvc3RvcnktMS5odG1s0gEA?oc=5";
    auto known = item("k", "Known");
    known.link = n.link;

    Filters::FilterEngine engine(config, resolver);
    auto out = engine.apply({n, known}, {"k"});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].link, "https://www.example.com/news/story-1.html");
    EXPECT_EQ(out[1].link, known.link);
    EXPECT_TRUE(transport.requests.empty());
}
