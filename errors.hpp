#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

// Corrupt or unreadable state file, or a failed commit.
class StoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class FetchError : public std::runtime_error
{
public:
    enum class Kind
    {
        Timeout,
        HttpStatus,
        Network,
        Parse
    };

    FetchError(Kind kind, const std::string& what, int status = 0)
        : std::runtime_error(what), kind_(kind), status_(status) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Kind kind_;
    int status_;
};

// Malformed date or advanced filter expression.
class FilterError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] inline std::string_view to_string(FetchError::Kind kind) noexcept
{
    switch (kind)
    {
        case FetchError::Kind::Timeout: return "timeout";
        case FetchError::Kind::HttpStatus: return "http_status";
        case FetchError::Kind::Network: return "network";
        case FetchError::Kind::Parse: return "parse";
    }
    return "unknown";
}
