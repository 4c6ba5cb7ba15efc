#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Http
{
    enum class Failure
    {
        None,
        Timeout,
        Network
    };

    struct Response
    {
        int status = 0;
        std::string body;
        std::map<std::string, std::string> headers;   // keys lower-cased
        std::string location;                         // final URL after redirects
        Failure failure = Failure::None;
        std::string error;

        [[nodiscard]] bool transport_ok() const noexcept { return failure == Failure::None; }
        [[nodiscard]] bool success() const noexcept { return transport_ok() && status >= 200 && status < 300; }
        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };

    struct UrlParts
    {
        std::string origin;   // scheme://host[:port]
        std::string path;     // path and query, at least "/"
    };

    [[nodiscard]] UrlParts split_url(std::string_view url);

    // Used for every retry and rate-limit wait.
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    [[nodiscard]] Sleeper thread_sleeper();

    // Blocking request seam used by the fetcher, link resolver and sender.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual Response get(const std::string& url, bool follow_redirects) = 0;
        virtual Response post(const std::string& url,
                              const std::string& body,
                              const std::string& content_type,
                              const std::map<std::string, std::string>& headers) = 0;
    };

    class HttplibTransport : public Transport
    {
    public:
        HttplibTransport();

        Response get(const std::string& url, bool follow_redirects) override;
        Response post(const std::string& url,
                      const std::string& body,
                      const std::string& content_type,
                      const std::map<std::string, std::string>& headers) override;

    private:
        std::chrono::seconds connect_timeout_;
        std::chrono::seconds read_timeout_;
        std::string user_agent_;
    };
}
