#include "link_resolver.hpp"
#include "config.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <iostream>
#include <string>

namespace
{
    constexpr std::string_view BATCH_EXECUTE_URL =
        "https://news.google.com/_/DotsSplashUi/data/batchexecute?rpcids=Fbv4je";

    constexpr std::string_view PAYLOAD_PREFIX("\x08\x13\x22", 3);
    constexpr std::string_view PAYLOAD_SUFFIX("\xd2\x01\x00", 3);
    constexpr std::string_view YOUTUBE_MARKER("\x08\x20\x22\x0b", 4);
    constexpr std::string_view YOUTUBE_END("\x98\x01\x01", 3);

    constexpr std::string_view GARTURL_HEADER = R"([\"garturlres\",\")";
    constexpr std::string_view GARTURL_FOOTER = R"(\",)";

    std::optional<std::string> base64url_decode(std::string_view text)
    {
        std::string b64(text);
        for(char& c : b64)
        {
            if(c == '-') c = '+';
            else if(c == '_') c = '/';
        }

        while(!b64.empty() && b64.back() == '=')
            b64.pop_back();

        size_t pad = (4 - b64.size() % 4) % 4;
        if(pad == 3)
            return std::nullopt;
        b64.append(pad, '=');

        std::string out(b64.size() / 4 * 3, '\0');
        int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(b64.data()),
                                  static_cast<int>(b64.size()));
        if(len < 0)
            return std::nullopt;

        out.resize(static_cast<size_t>(len) - pad);
        return out;
    }

    int hex_value(char c)
    {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    void append_utf8(std::string& out, unsigned int cp)
    {
        if(cp < 0x80)
            out += static_cast<char>(cp);
        else if(cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string form_encode(std::string_view text)
    {
        std::string out;
        for(unsigned char c : text)
        {
            if(std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
                out += static_cast<char>(c);
            else if(c == ' ')
                out += '+';
            else
            {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", c);
                out += buf;
            }
        }
        return out;
    }

    bool is_google_news(std::string_view url)
    {
        return url.rfind("https://news.google.com", 0) == 0 ||
               url.rfind("http://news.google.com", 0) == 0;
    }
}

LinkResolver::LinkResolver(Http::Transport& transport) : transport_(transport) {}

std::optional<std::string> LinkResolver::article_id(std::string_view link)
{
    if(!is_google_news(link))
        return std::nullopt;

    std::string_view path = link.substr(0, link.find_first_of("?#"));
    auto last = path.rfind('/');
    if(last == std::string_view::npos || last + 1 >= path.size())
        return std::nullopt;

    std::string_view id = path.substr(last + 1);
    std::string_view parent = path.substr(0, last);
    auto prev = parent.rfind('/');
    if(prev == std::string_view::npos || parent.substr(prev + 1) != "articles")
        return std::nullopt;

    return std::string(id);
}

std::optional<std::string> LinkResolver::decode_article_id(std::string_view id)
{
    auto bytes = base64url_decode(id);
    if(!bytes)
        return std::nullopt;

    std::string_view decoded(*bytes);
    if(decoded.substr(0, PAYLOAD_PREFIX.size()) == PAYLOAD_PREFIX)
        decoded.remove_prefix(PAYLOAD_PREFIX.size());
    if(decoded.size() >= PAYLOAD_SUFFIX.size() &&
       decoded.substr(decoded.size() - PAYLOAD_SUFFIX.size()) == PAYLOAD_SUFFIX)
        decoded.remove_suffix(PAYLOAD_SUFFIX.size());

    if(decoded.empty())
        return std::nullopt;

    // Leading length byte, two bytes wide from 0x80 on.
    auto length = static_cast<unsigned char>(decoded[0]);
    if(length >= 0x80)
    {
        if(decoded.size() < 2)
            return std::nullopt;
        decoded = decoded.substr(2, length - 1);
    }
    else
        decoded = decoded.substr(1, length);

    if(decoded.empty())
        return std::nullopt;
    return std::string(decoded);
}

std::optional<std::string> LinkResolver::extract_url(std::string_view decoded)
{
    size_t pos = 0;
    while(pos < decoded.size())
    {
        // printable run
        size_t end = pos;
        while(end < decoded.size() && decoded[end] >= 0x20 && decoded[end] <= 0x7E)
            ++end;

        std::string_view run = decoded.substr(pos, end - pos);
        auto start = run.find("http://");
        auto secure = run.find("https://");
        if(secure != std::string_view::npos && (start == std::string_view::npos || secure < start))
            start = secure;

        if(start != std::string_view::npos)
        {
            std::string_view url = run.substr(start);
            return std::string(url.substr(0, url.find(' ')));
        }

        pos = end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> LinkResolver::extract_youtube_id(std::string_view decoded)
{
    auto marker = decoded.find(YOUTUBE_MARKER);
    if(marker == std::string_view::npos)
        return std::nullopt;

    std::string_view rest = decoded.substr(marker + YOUTUBE_MARKER.size());
    if(rest.size() < 11 + YOUTUBE_END.size() || rest.substr(11, YOUTUBE_END.size()) != YOUTUBE_END)
        return std::nullopt;

    std::string_view id = rest.substr(0, 11);
    for(unsigned char c : id)
    {
        if(!std::isalnum(c) && c != '_' && c != '-')
            return std::nullopt;
    }
    return std::string(id);
}

std::string LinkResolver::clean_url(std::string_view url)
{
    std::string unescaped;
    for(size_t i = 0; i < url.size(); ++i)
    {
        if(url[i] == '\\' && i + 5 < url.size() && url[i + 1] == 'u')
        {
            unsigned int cp = 0;
            bool ok = true;
            for(size_t k = 2; k < 6; ++k)
            {
                int v = hex_value(url[i + k]);
                if(v < 0) { ok = false; break; }
                cp = cp * 16 + static_cast<unsigned int>(v);
            }
            if(ok)
            {
                append_utf8(unescaped, cp);
                i += 5;
                continue;
            }
        }
        if(url[i] != '\\')
            unescaped += url[i];
    }

    std::string decoded;
    for(size_t i = 0; i < unescaped.size(); ++i)
    {
        if(unescaped[i] == '%' && i + 2 < unescaped.size())
        {
            int hi = hex_value(unescaped[i + 1]);
            int lo = hex_value(unescaped[i + 2]);
            if(hi >= 0 && lo >= 0)
            {
                decoded += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        decoded += unescaped[i];
    }

    // Re-encode only what cannot appear raw in a URL.
    std::string out;
    for(unsigned char c : decoded)
    {
        if(c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>')
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
        else
            out += static_cast<char>(c);
    }
    return out;
}

std::string LinkResolver::resolve(const std::string& link)
{
    auto id = article_id(link);
    if(!id)
        return link;

    if(auto payload = decode_article_id(*id))
    {
        if(payload->rfind("AU_yqL", 0) == 0)
        {
            if(auto url = batch_execute(*id))
                return clean_url(*url);
        }
        else if(auto url = extract_url(*payload))
            return clean_url(*url);
    }

    if(auto raw = base64url_decode(*id))
    {
        if(auto video = extract_youtube_id(*raw))
            return "https://www.youtube.com/watch?v=" + *video;
        if(auto url = extract_url(*raw))
            return clean_url(*url);
    }

    if(auto url = follow_redirects(link))
        return clean_url(*url);

    std::cerr << "[LinkResolver] Could not resolve " << link << ", keeping aggregator link\n";
    return link;
}

std::optional<std::string> LinkResolver::batch_execute(const std::string& id)
{
    const std::string request =
        R"([[["Fbv4je","[\"garturlreq\",[[\"en-US\",\"US\",[\"FINANCE_TOP_INDICES\",\"WEB_TEST_1_0_0\"],)"
        R"(null,null,1,1,\"US:en\",null,180,null,null,null,null,null,0,null,null,[1608992183,723341000]],)"
        R"(\"en-US\",\"US\",1,[2,3,4,8],1,0,\"655000234\",0,0,null,0],\")" +
        id +
        R"(\"]",null,"generic"]]])";

    auto res = transport_.post(std::string(BATCH_EXECUTE_URL),
                               "f.req=" + form_encode(request),
                               "application/x-www-form-urlencoded;charset=utf-8",
                               {{"Referer", "https://news.google.com/"}});

    if(!res.success())
    {
        std::cerr << "[LinkResolver] batchexecute failed: "
                  << (res.transport_ok() ? "HTTP " + std::to_string(res.status) : res.error) << '\n';
        return std::nullopt;
    }

    auto start = res.body.find(GARTURL_HEADER);
    if(start == std::string::npos)
    {
        std::cerr << "[LinkResolver] batchexecute response has no garturlres for " << id << '\n';
        return std::nullopt;
    }
    start += GARTURL_HEADER.size();

    auto end = res.body.find(GARTURL_FOOTER, start);
    if(end == std::string::npos)
        return std::nullopt;

    return res.body.substr(start, end - start);
}

std::optional<std::string> LinkResolver::follow_redirects(const std::string& link)
{
    for(int attempt = 1; attempt <= config::LINK_RESOLVE_MAX_ATTEMPTS; ++attempt)
    {
        auto res = transport_.get(link, true);
        if(res.success())
        {
            if(!res.location.empty() && res.location != link && !is_google_news(res.location))
                return res.location;
            return std::nullopt;
        }

        std::cerr << "[LinkResolver] GET " << link << " attempt " << attempt << " failed: "
                  << (res.transport_ok() ? "HTTP " + std::to_string(res.status) : res.error) << '\n';
    }
    return std::nullopt;
}
