#include "dates.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Dates
{
    namespace
    {
        struct Fields
        {
            int year = 0;
            int month = 0;
            int day = 0;
            int hour = 0;
            int min = 0;
            int sec = 0;
        };

        // system_clock counts nanoseconds and ends in 2262.
        constexpr int MAX_YEAR = 2200;

        bool valid(const Fields& f)
        {
            return f.year >= 1900 && f.year <= MAX_YEAR && f.month >= 1 && f.month <= 12 &&
                   f.day >= 1 && f.day <= 31 &&
                   f.hour >= 0 && f.hour <= 23 &&
                   f.min >= 0 && f.min <= 59 &&
                   f.sec >= 0 && f.sec <= 60;
        }

        std::optional<Timestamp> to_utc(const Fields& f, int offset_minutes)
        {
            if(!valid(f))
                return std::nullopt;

            std::tm tm = {};
            tm.tm_year = f.year - 1900;
            tm.tm_mon = f.month - 1;
            tm.tm_mday = f.day;
            tm.tm_hour = f.hour;
            tm.tm_min = f.min;
            tm.tm_sec = f.sec;

            std::time_t time = timegm(&tm);
            if(time == -1)
                return std::nullopt;

            return std::chrono::system_clock::from_time_t(time) - std::chrono::minutes(offset_minutes);
        }

        int month_from_name(std::string_view name)
        {
            constexpr std::array<std::string_view, 12> months =
            {
                "jan", "feb", "mar", "apr", "may", "jun",
                "jul", "aug", "sep", "oct", "nov", "dec"
            };

            if(name.size() < 3)
                return 0;

            std::string lower;
            for(char c : name.substr(0, 3))
                lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

            for(std::size_t i = 0; i < months.size(); ++i)
                if(months[i] == lower)
                    return static_cast<int>(i) + 1;

            return 0;
        }

        // "+0900", "-05:00", "+09"; returns nullopt when malformed.
        std::optional<int> parse_numeric_offset(std::string_view zone)
        {
            if(zone.size() < 3 || (zone[0] != '+' && zone[0] != '-'))
                return std::nullopt;

            std::string digits;
            for(char c : zone.substr(1))
            {
                if(c == ':')
                    continue;
                if(!std::isdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
                digits += c;
            }

            if(digits.size() != 2 && digits.size() != 4)
                return std::nullopt;

            int hours = std::stoi(digits.substr(0, 2));
            int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
            if(hours > 23 || minutes > 59)
                return std::nullopt;

            int total = hours * 60 + minutes;
            return zone[0] == '-' ? -total : total;
        }

        std::optional<int> parse_zone(std::string_view zone)
        {
            if(zone.empty())
                return 0;

            if(auto numeric = parse_numeric_offset(zone))
                return numeric;

            std::string upper;
            for(char c : zone)
                upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

            if(upper == "GMT" || upper == "UT" || upper == "UTC" || upper == "Z") return 0;
            if(upper == "EST") return -5 * 60;
            if(upper == "EDT") return -4 * 60;
            if(upper == "CST") return -6 * 60;
            if(upper == "CDT") return -5 * 60;
            if(upper == "MST") return -7 * 60;
            if(upper == "MDT") return -6 * 60;
            if(upper == "PST") return -8 * 60;
            if(upper == "PDT") return -7 * 60;

            return std::nullopt;
        }

        std::string trim(std::string_view text)
        {
            auto start = text.find_first_not_of(" \t\r\n");
            if(start == std::string_view::npos)
                return {};
            auto end = text.find_last_not_of(" \t\r\n");
            return std::string(text.substr(start, end - start + 1));
        }
    }

    std::optional<Timestamp> parse_rfc822(std::string_view text)
    {
        std::string input = trim(text);

        // Weekday is optional: "Mon, 19 Oct ..." or "19 Oct ..."
        auto comma = input.find(',');
        if(comma != std::string::npos)
            input = input.substr(comma + 1);

        std::istringstream iss(input);
        std::vector<std::string> tokens;
        std::string token;
        while(iss >> token)
            tokens.push_back(token);

        if(tokens.size() < 4)
            return std::nullopt;

        Fields f;
        try
        {
            f.day = std::stoi(tokens[0]);
            f.month = month_from_name(tokens[1]);
            f.year = std::stoi(tokens[2]);
        }
        catch(const std::exception&)
        {
            return std::nullopt;
        }

        if(tokens[2].size() == 2)
            f.year += f.year < 50 ? 2000 : 1900;

        int parsed = std::sscanf(tokens[3].c_str(), "%d:%d:%d", &f.hour, &f.min, &f.sec);
        if(parsed < 2)
            return std::nullopt;

        auto offset = parse_zone(tokens.size() > 4 ? std::string_view(tokens[4]) : std::string_view{});
        if(!offset)
            return std::nullopt;

        return to_utc(f, *offset);
    }

    std::optional<Timestamp> parse_iso8601(std::string_view text)
    {
        std::string input = trim(text);

        Fields f;
        int consumed = 0;
        int parsed = std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                                 &f.year, &f.month, &f.day, &f.hour, &f.min, &f.sec, &consumed);
        if(parsed != 6)
        {
            // date and minutes only: 2026-10-19T08:15Z
            f.sec = 0;
            consumed = 0;
            parsed = std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d%n",
                                 &f.year, &f.month, &f.day, &f.hour, &f.min, &consumed);
            if(parsed != 5)
                return std::nullopt;
        }

        std::string_view rest(input);
        rest.remove_prefix(static_cast<std::size_t>(consumed));

        if(!rest.empty() && rest.front() == '.')
        {
            rest.remove_prefix(1);
            while(!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front())))
                rest.remove_prefix(1);
        }

        auto offset = parse_zone(rest);
        if(!offset)
            return std::nullopt;

        return to_utc(f, *offset);
    }

    std::optional<Timestamp> parse_feed_date(std::string_view text)
    {
        if(auto rfc = parse_rfc822(text))
            return rfc;
        return parse_iso8601(text);
    }

    std::optional<Timestamp> parse_ymd(std::string_view text)
    {
        std::string input = trim(text);
        if(input.size() != 10)
            return std::nullopt;

        Fields f;
        int consumed = 0;
        if(std::sscanf(input.c_str(), "%4d-%2d-%2d%n", &f.year, &f.month, &f.day, &consumed) != 3 || consumed != 10)
            return std::nullopt;

        return to_utc(f, 0);
    }

    std::string format_utc(Timestamp tp)
    {
        std::time_t time = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
        gmtime_r(&time, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::string format_iso8601(Timestamp tp)
    {
        std::time_t time = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
        gmtime_r(&time, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }
}
