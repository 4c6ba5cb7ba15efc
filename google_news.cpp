#include "google_news.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace GoogleNews
{
    namespace
    {
        constexpr std::array countries =
        {
            Country{"KR", "ko", "KR:ko", "South Korea"},
            Country{"JP", "ja", "JP:ja", "Japan"},
            Country{"CN", "zh-CN", "CN:zh-Hans", "China"},
            Country{"TW", "zh-TW", "TW:zh-Hant", "Taiwan"},
            Country{"HK", "zh-HK", "HK:zh-Hant", "Hong Kong"},
            Country{"VN", "vi", "VN:vi", "Vietnam"},
            Country{"TH", "th", "TH:th", "Thailand"},
            Country{"PH", "en-PH", "PH:en", "Philippines"},
            Country{"MY", "ms-MY", "MY:ms", "Malaysia"},
            Country{"SG", "en-SG", "SG:en", "Singapore"},
            Country{"ID", "id", "ID:id", "Indonesia"},
            Country{"IN", "en-IN", "IN:en", "India"},
            Country{"BD", "bn", "BD:bn", "Bangladesh"},
            Country{"PK", "en-PK", "PK:en", "Pakistan"},
            Country{"IL", "he", "IL:he", "Israel"},
            Country{"AE", "ar", "AE:ar", "United Arab Emirates"},
            Country{"TR", "tr", "TR:tr", "Turkey"},
            Country{"LB", "ar", "LB:ar", "Lebanon"},
            Country{"AU", "en-AU", "AU:en", "Australia"},
            Country{"NZ", "en-NZ", "NZ:en", "New Zealand"},
            Country{"RU", "ru", "RU:ru", "Russia"},
            Country{"UA", "uk", "UA:uk", "Ukraine"},
            Country{"GR", "el", "GR:el", "Greece"},
            Country{"DE", "de", "DE:de", "Germany"},
            Country{"NL", "nl", "NL:nl", "Netherlands"},
            Country{"NO", "no", "NO:no", "Norway"},
            Country{"LV", "lv", "LV:lv", "Latvia"},
            Country{"LT", "lt", "LT:lt", "Lithuania"},
            Country{"RO", "ro", "RO:ro", "Romania"},
            Country{"BE", "fr", "BE:fr", "Belgium"},
            Country{"BG", "bg", "BG:bg", "Bulgaria"},
            Country{"SK", "sk", "SK:sk", "Slovakia"},
            Country{"SI", "sl", "SI:sl", "Slovenia"},
            Country{"CH", "de", "CH:de", "Switzerland"},
            Country{"ES", "es", "ES:es", "Spain"},
            Country{"SE", "sv", "SE:sv", "Sweden"},
            Country{"RS", "sr", "RS:sr", "Serbia"},
            Country{"AT", "de", "AT:de", "Austria"},
            Country{"IE", "en-IE", "IE:en", "Ireland"},
            Country{"EE", "et-EE", "EE:et", "Estonia"},
            Country{"IT", "it", "IT:it", "Italy"},
            Country{"CZ", "cs", "CZ:cs", "Czech Republic"},
            Country{"GB", "en-GB", "GB:en", "United Kingdom"},
            Country{"PL", "pl", "PL:pl", "Poland"},
            Country{"PT", "pt-PT", "PT:pt-150", "Portugal"},
            Country{"FI", "fi-FI", "FI:fi", "Finland"},
            Country{"FR", "fr", "FR:fr", "France"},
            Country{"HU", "hu", "HU:hu", "Hungary"},
            Country{"CA", "en-CA", "CA:en", "Canada"},
            Country{"MX", "es-419", "MX:es-419", "Mexico"},
            Country{"US", "en-US", "US:en", "United States"},
            Country{"CU", "es-419", "CU:es-419", "Cuba"},
            Country{"AR", "es-419", "AR:es-419", "Argentina"},
            Country{"BR", "pt-BR", "BR:pt-419", "Brazil"},
            Country{"CL", "es-419", "CL:es-419", "Chile"},
            Country{"CO", "es-419", "CO:es-419", "Colombia"},
            Country{"PE", "es-419", "PE:es-419", "Peru"},
            Country{"VE", "es-419", "VE:es-419", "Venezuela"},
            Country{"ZA", "en-ZA", "ZA:en", "South Africa"},
            Country{"NG", "en-NG", "NG:en", "Nigeria"},
            Country{"EG", "ar", "EG:ar", "Egypt"},
            Country{"KE", "en-KE", "KE:en", "Kenya"},
            Country{"MA", "fr", "MA:fr", "Morocco"},
            Country{"SN", "fr", "SN:fr", "Senegal"},
            Country{"UG", "en-UG", "UG:en", "Uganda"},
            Country{"TZ", "en-TZ", "TZ:en", "Tanzania"},
            Country{"ZW", "en-ZW", "ZW:en", "Zimbabwe"},
            Country{"ET", "en-ET", "ET:en", "Ethiopia"},
            Country{"GH", "en-GH", "GH:en", "Ghana"},
        };

        // Topic ids are language specific; Korean feeds use the ko id, all others en.
        constexpr std::array topics =
        {
            Topic{"headlines", "Headlines", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFZxYUdjU0FtVnVHZ0pWVXlnQVAB",
                  "헤드라인", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFZxYUdjU0FtdHZHZ0pMVWlnQVAB"},
            Topic{"korea", "South Korea", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRFp4WkRNU0FtVnVLQUFQAQ",
                  "대한민국", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRFp4WkRNU0FtdHZLQUFQAQ"},
            Topic{"us", "U.S.", "CAAqIggKIhxDQkFTRHdvSkwyMHZNRGxqTjNjd0VnSmxiaWdBUAE",
                  "미국", "CAAqIggKIhxDQkFTRHdvSkwyMHZNRGxqTjNjd0VnSnJieWdBUAE"},
            Topic{"japan", "Japan", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRE5mTTJRU0FtVnVLQUFQAQ",
                  "일본", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRE5mTTJRU0FtdHZLQUFQAQ"},
            Topic{"china", "China", "CAAqIggKIhxDQkFTRHdvSkwyMHZNR1F3TlhjekVnSmxiaWdBUAE",
                  "중국", "CAAqIggKIhxDQkFTRHdvSkwyMHZNR1F3TlhjekVnSnJieWdBUAE"},
            Topic{"world", "World", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGx1YlY4U0FtVnVHZ0pWVXlnQVAB",
                  "세계", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGx1YlY4U0FtdHZHZ0pMVWlnQVAB"},
            Topic{"politics", "Politics", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRFZ4ZERBU0FtVnVLQUFQAQ",
                  "정치", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNRFZ4ZERBU0FtdHZLQUFQAQ"},
            Topic{"entertainment", "Entertainment", "CAAqJggKIiBDQkFTRWdvSUwyMHZNREpxYW5RU0FtVnVHZ0pWVXlnQVAB",
                  "엔터테인먼트", "CAAqJggKIiBDQkFTRWdvSUwyMHZNREpxYW5RU0FtdHZHZ0pMVWlnQVAB"},
            Topic{"celebrity", "Celebrities", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNREZ5Wm5vU0FtVnVLQUFQAQ",
                  "연예", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNREZ5Wm5vU0FtdHZLQUFQAQ"},
            Topic{"sports", "Sports", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFp1ZEdvU0FtVnVHZ0pWVXlnQVAB",
                  "스포츠", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFp1ZEdvU0FtdHZHZ0pMVWlnQVAB"},
            Topic{"business", "Business", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGx6TVdZU0FtVnVHZ0pWVXlnQVAB",
                  "비즈니스", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGx6TVdZU0FtdHZHZ0pMVWlnQVAB"},
            Topic{"technology", "Technology", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGRqTVhZU0FtVnVHZ0pWVXlnQVAB",
                  "기술", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRGRqTVhZU0FtdHZHZ0pMVWlnQVAB"},
            Topic{"health", "Health", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNR3QwTlRFU0FtVnVLQUFQAQ",
                  "건강", "CAAqIQgKIhtDQkFTRGdvSUwyMHZNR3QwTlRFU0FtdHZLQUFQAQ"},
            Topic{"science", "Science", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFp0Y1RjU0FtVnVHZ0pWVXlnQVAB",
                  "과학", "CAAqJggKIiBDQkFTRWdvSUwyMHZNRFp0Y1RjU0FtdHZHZ0pMVWlnQVAB"},
        };

        struct Prefix
        {
            std::string_view language;
            std::string_view prefix;
        };

        constexpr std::array prefixes =
        {
            Prefix{"ar", "Google أخبار"},
            Prefix{"bn", "Google সংবাদ"},
            Prefix{"cs", "Google Zprávy"},
            Prefix{"da", "Google Nyheder"},
            Prefix{"de", "Google Nachrichten"},
            Prefix{"el", "Google Ειδήσεις"},
            Prefix{"es", "Google Noticias"},
            Prefix{"fi", "Google Uutiset"},
            Prefix{"fr", "Google Actualités"},
            Prefix{"hu", "Google Hírek"},
            Prefix{"id", "Google Berita"},
            Prefix{"it", "Google Notizie"},
            Prefix{"ja", "Google ニュース"},
            Prefix{"ko", "Google 뉴스"},
            Prefix{"ms", "Google Berita"},
            Prefix{"nl", "Google Nieuws"},
            Prefix{"no", "Google Nyheter"},
            Prefix{"pl", "Google Wiadomości"},
            Prefix{"pt", "Google Notícias"},
            Prefix{"ro", "Google Știri"},
            Prefix{"ru", "Google Новости"},
            Prefix{"sv", "Google Nyheter"},
            Prefix{"th", "Google ข่าว"},
            Prefix{"tr", "Google Haberler"},
            Prefix{"vi", "Google Tin tức"},
            Prefix{"zh", "Google 新闻"},
        };

        std::string upper(std::string_view text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        std::string lower(std::string_view text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // "en-US" -> "en"
        std::string primary_language(std::string_view hl)
        {
            auto dash = hl.find('-');
            return lower(hl.substr(0, dash));
        }

        std::string encode_ceid(std::string_view ceid)
        {
            std::string out;
            for(char c : ceid)
            {
                if(c == ':') out += "%3A";
                else out += c;
            }
            return out;
        }

        std::string region_params(const Country& country)
        {
            return "hl=" + std::string(country.hl) +
                   "&gl=" + std::string(country.code) +
                   "&ceid=" + encode_ceid(country.ceid);
        }

        const Country& require_country(std::string_view code)
        {
            const Country* country = find_country(code);
            if(!country)
                throw ConfigError("Unknown country code: " + std::string(code));
            return *country;
        }
    }

    std::string FeedLabel::line() const
    {
        std::string text = prefix;
        if(!category.empty()) text += " - " + category;
        if(!topic.empty()) text += " - " + topic;
        if(!flag.empty()) text += " " + flag;
        return "`" + text + "`";
    }

    const Country* find_country(std::string_view code)
    {
        std::string wanted = upper(code);
        auto it = std::find_if(countries.begin(), countries.end(),
            [&](const Country& c) { return c.code == wanted; });
        return it == countries.end() ? nullptr : &*it;
    }

    const Topic* find_topic(std::string_view keyword)
    {
        std::string wanted = lower(keyword);
        auto it = std::find_if(topics.begin(), topics.end(),
            [&](const Topic& t) { return t.keyword == wanted; });
        return it == topics.end() ? nullptr : &*it;
    }

    const Topic* find_topic_by_id(std::string_view id)
    {
        auto it = std::find_if(topics.begin(), topics.end(),
            [&](const Topic& t) { return t.id_en == id || t.id_ko == id; });
        return it == topics.end() ? nullptr : &*it;
    }

    std::string country_flag(std::string_view code)
    {
        if(code.size() != 2)
            return "";

        // Regional indicator symbols U+1F1E6..U+1F1FF
        std::string flag;
        for(char c : upper(code))
        {
            if(c < 'A' || c > 'Z')
                return "";
            flag += "\xF0\x9F\x87";
            flag += static_cast<char>(0xA6 + (c - 'A'));
        }
        return flag;
    }

    std::string news_prefix(std::string_view language)
    {
        std::string wanted = primary_language(language);
        auto it = std::find_if(prefixes.begin(), prefixes.end(),
            [&](const Prefix& p) { return p.language == wanted; });
        return it == prefixes.end() ? "Google News" : std::string(it->prefix);
    }

    std::string query_param(std::string_view url, std::string_view name)
    {
        auto query = url.find('?');
        if(query == std::string_view::npos)
            return "";

        std::string_view params = url.substr(query + 1);
        while(!params.empty())
        {
            auto amp = params.find('&');
            std::string_view pair = params.substr(0, amp);

            auto eq = pair.find('=');
            if(eq != std::string_view::npos && pair.substr(0, eq) == name)
                return std::string(pair.substr(eq + 1));

            if(amp == std::string_view::npos)
                break;
            params.remove_prefix(amp + 1);
        }
        return "";
    }

    FeedMode parse_mode(std::string_view mode)
    {
        std::string value = lower(mode);
        if(value == "top") return FeedMode::Top;
        if(value == "topic") return FeedMode::Topic;
        if(value == "url") return FeedMode::Url;
        throw ConfigError("Unknown feed mode: " + std::string(mode) + " (expected top, topic or url)");
    }

    FeedSelection select_top(std::string_view country_code)
    {
        const Country& country = require_country(country_code);

        FeedSelection selection;
        selection.mode = FeedMode::Top;
        selection.country = std::string(country.code);
        selection.language = primary_language(country.hl);
        selection.url = std::string(config::GOOGLE_NEWS_HOST) + "/rss?" + region_params(country);

        selection.label.prefix = news_prefix(selection.language);
        selection.label.category = selection.language == "ko" ? "주요 뉴스" : "Top Stories";
        selection.label.topic = std::string(country.name);
        selection.label.flag = country_flag(country.code);
        return selection;
    }

    FeedSelection select_topic(std::string_view keyword, std::string_view country_code)
    {
        const Topic* topic = find_topic(keyword);
        if(!topic)
            throw ConfigError("Unknown topic keyword: " + std::string(keyword));

        const Country& country = require_country(country_code);

        FeedSelection selection;
        selection.mode = FeedMode::Topic;
        selection.country = std::string(country.code);
        selection.topic_keyword = std::string(topic->keyword);
        selection.language = primary_language(country.hl);

        bool korean = selection.language == "ko";
        std::string_view id = korean ? topic->id_ko : topic->id_en;

        selection.url = std::string(config::GOOGLE_NEWS_HOST) + "/rss/topics/" + std::string(id) + "?" + region_params(country);

        selection.label.prefix = news_prefix(selection.language);
        selection.label.category = korean ? "주제" : "Topics";
        selection.label.topic = std::string(korean ? topic->name_ko : topic->name_en);
        selection.label.flag = country_flag(country.code);
        return selection;
    }

    FeedSelection select_url(std::string_view url)
    {
        if(url.empty())
            throw ConfigError("RSS_URL must be set when FEED_MODE is url");

        FeedSelection selection;
        selection.mode = FeedMode::Url;
        selection.url = std::string(url);

        std::string hl = query_param(url, "hl");
        selection.language = hl.empty() ? "en" : primary_language(hl);
        selection.country = upper(query_param(url, "gl"));

        selection.label.prefix = news_prefix(selection.language);
        selection.label.flag = country_flag(selection.country);

        std::string_view path = url.substr(0, url.find('?'));
        auto marker = path.find("/topics/");
        if(marker != std::string_view::npos)
        {
            std::string_view id = path.substr(marker + 8);
            id = id.substr(0, id.find('/'));

            selection.label.category = selection.language == "ko" ? "주제" : "Topics";
            if(const Topic* topic = find_topic_by_id(id))
            {
                selection.topic_keyword = std::string(topic->keyword);
                selection.label.topic = std::string(topic->id_ko == id ? topic->name_ko : topic->name_en);
            }
        }
        else
        {
            selection.label.category = "RSS";
        }

        return selection;
    }

    std::string_view to_string(FeedMode mode) noexcept
    {
        switch(mode)
        {
            case FeedMode::Top: return "top";
            case FeedMode::Topic: return "topic";
            case FeedMode::Url: return "url";
        }
        return "unknown";
    }
}
