#include "http_client.hpp"
#include "config.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <thread>
#include <utility>

namespace Http
{
    namespace
    {
        std::string lower(std::string_view text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        Response from_result(const httplib::Result& res)
        {
            Response response;

            if(!res)
            {
                auto error = res.error();
                response.failure = error == httplib::Error::ConnectionTimeout ? Failure::Timeout : Failure::Network;
                response.error = httplib::to_string(error);
                return response;
            }

            response.status = res->status;
            response.body = res->body;
            response.location = res->location;

            for(const auto& [key, value] : res->headers)
                response.headers[lower(key)] = value;

            return response;
        }
    }

    std::optional<std::string> Response::header(std::string_view name) const
    {
        auto it = headers.find(lower(name));
        if(it == headers.end())
            return std::nullopt;
        return it->second;
    }

    UrlParts split_url(std::string_view url)
    {
        std::string url_str(url);
        std::string scheme = "https";

        size_t protocol_pos = url_str.find("://");
        if (protocol_pos != std::string::npos)
        {
            scheme = url_str.substr(0, protocol_pos);
            url_str = url_str.substr(protocol_pos + 3);
        }

        UrlParts parts;
        parts.path = "/";

        size_t path_pos = url_str.find_first_of("/?");
        if (path_pos != std::string::npos)
        {
            parts.origin = scheme + "://" + url_str.substr(0, path_pos);
            parts.path = url_str.substr(path_pos);
            if(parts.path.front() == '?')
                parts.path.insert(parts.path.begin(), '/');
        }
        else parts.origin = scheme + "://" + url_str;

        return parts;
    }

    Sleeper thread_sleeper()
    {
        return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }

    HttplibTransport::HttplibTransport()
        : connect_timeout_(config::HTTP_CONNECT_TIMEOUT)
        , read_timeout_(config::HTTP_READ_TIMEOUT)
        , user_agent_(config::USER_AGENT)
    {
    }

    Response HttplibTransport::get(const std::string& url, bool follow_redirects)
    {
        auto parts = split_url(url);

        httplib::Client cli(parts.origin);
        cli.set_connection_timeout(connect_timeout_);
        cli.set_read_timeout(read_timeout_);
        cli.set_follow_location(follow_redirects);

        httplib::Headers headers = {{"User-Agent", user_agent_}};
        auto response = from_result(cli.Get(parts.path, headers));

        if(response.location.empty())
            response.location = url;
        return response;
    }

    Response HttplibTransport::post(const std::string& url,
                                    const std::string& body,
                                    const std::string& content_type,
                                    const std::map<std::string, std::string>& headers)
    {
        auto parts = split_url(url);

        httplib::Client cli(parts.origin);
        cli.set_connection_timeout(connect_timeout_);
        cli.set_read_timeout(read_timeout_);

        httplib::Headers request_headers = {{"User-Agent", user_agent_}};
        for(const auto& [key, value] : headers)
            request_headers.emplace(key, value);

        auto response = from_result(cli.Post(parts.path, request_headers, body, content_type));
        if(response.location.empty())
            response.location = url;
        return response;
    }
}
