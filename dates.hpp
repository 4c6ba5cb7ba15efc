#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace Dates
{
    using Timestamp = std::chrono::system_clock::time_point;

    // "Mon, 19 Oct 2026 08:15:00 GMT", weekday and seconds optional,
    // numeric offsets and the RFC 822 zone names accepted.
    [[nodiscard]] std::optional<Timestamp> parse_rfc822(std::string_view text);

    // "2026-10-19T08:15:00Z", fraction and "+hh:mm" / "+hhmm" offsets accepted.
    [[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

    // Tries RFC 822 first (RSS), then ISO 8601 (Atom).
    [[nodiscard]] std::optional<Timestamp> parse_feed_date(std::string_view text);

    // "YYYY-MM-DD" as UTC midnight.
    [[nodiscard]] std::optional<Timestamp> parse_ymd(std::string_view text);

    [[nodiscard]] std::string format_utc(Timestamp tp);        // 2026-10-19 08:15:00
    [[nodiscard]] std::string format_iso8601(Timestamp tp);    // 2026-10-19T08:15:00Z
}
