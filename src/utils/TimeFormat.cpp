#include "TimeFormat.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::string FormatIso8601(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto secs = time_point_cast<seconds>(tp);
    if (secs > tp)
        secs -= seconds{ 1 };
    auto millis = duration_cast<milliseconds>(tp - secs).count();

    std::time_t tt = system_clock::to_time_t(secs);
    std::tm tm_buf{};
    gmtime_r(&tt, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

bool ParseIso8601(const std::string& text, std::chrono::system_clock::time_point& out)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6)
        return false;

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        return false;

    long millis = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            if (digits < 3)
            {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return false;
        for (; digits < 3; ++digits)
            millis *= 10;
    }

    if (pos >= text.size() || text[pos] != 'Z' || pos + 1 != text.size())
        return false;

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;

    std::time_t tt = timegm(&tm_buf);
    if (tt == static_cast<std::time_t>(-1))
        return false;

    out = std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds{ millis };
    return true;
}

} // namespace utils
