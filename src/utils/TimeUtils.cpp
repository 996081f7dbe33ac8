#include "TimeUtils.hpp"

#include <cstdio>
#include <regex>

namespace utils
{

bool parseIso8601(const std::string& text, Timestamp& outTime)
{
    using namespace std::chrono;

    static const std::regex isoRegex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:[.,](\d{1,9}))?)?)?\s*(Z|z|[+-]\d{2}(?::?\d{2})?)?$)");
    std::smatch match;
    if (!std::regex_match(text, match, isoRegex))
    {
        return false;
    }

    const year_month_day ymd{ year{ std::stoi(match[1].str()) }, month{ static_cast<unsigned>(std::stoi(match[2].str())) },
                              day{ static_cast<unsigned>(std::stoi(match[3].str())) } };
    if (!ymd.ok())
    {
        return false;
    }

    int hour = match[4].matched ? std::stoi(match[4].str()) : 0;
    int minute = match[5].matched ? std::stoi(match[5].str()) : 0;
    int second = match[6].matched ? std::stoi(match[6].str()) : 0;
    if (hour > 23 || minute > 59 || second > 59)
    {
        return false;
    }

    nanoseconds fraction{ 0 };
    if (match[7].matched)
    {
        // right-pad to nanoseconds
        std::string digits = match[7].str();
        digits.resize(9, '0');
        fraction = nanoseconds{ std::stoll(digits) };
    }

    minutes offset{ 0 };
    if (match[8].matched)
    {
        std::string zone = match[8].str();
        if (zone != "Z" && zone != "z")
        {
            int sign = zone[0] == '-' ? -1 : 1;
            std::string digits;
            for (char c : zone.substr(1))
            {
                if (c != ':')
                {
                    digits.push_back(c);
                }
            }
            int offsetHours = std::stoi(digits.substr(0, 2));
            int offsetMinutes = digits.size() > 2 ? std::stoi(digits.substr(2, 2)) : 0;
            if (offsetHours > 23 || offsetMinutes > 59)
            {
                return false;
            }
            offset = minutes{ sign * (offsetHours * 60 + offsetMinutes) };
        }
    }

    auto localTime = sys_days{ ymd } + hours{ hour } + minutes{ minute } + seconds{ second } + fraction;
    outTime = time_point_cast<system_clock::duration>(localTime - offset);
    return true;
}

std::string formatIso8601(Timestamp time)
{
    using namespace std::chrono;

    auto secs = floor<seconds>(time);
    auto dayPoint = floor<days>(secs);
    year_month_day ymd{ dayPoint };
    hh_mm_ss<seconds> tod{ secs - dayPoint };

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()), static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buffer;
}

std::string formatDate(Timestamp time)
{
    using namespace std::chrono;

    year_month_day ymd{ floor<days>(time) };
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buffer;
}

Timestamp toSystemTime(std::filesystem::file_time_type fileTime)
{
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::filesystem::file_time_type::clock::to_sys(fileTime));
}

} // namespace utils
