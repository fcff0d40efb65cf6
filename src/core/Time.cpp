// SPDX-License-Identifier: Apache-2.0
#include "Time.hpp"

#include <charconv>
#include <format>

namespace callscribe
{

namespace
{

    /// @brief Reads exactly @p width decimal digits starting at @p pos.
    auto readDigits(std::string_view text, size_t pos, size_t width, int& out) -> bool
    {
        if (pos + width > text.size())
            return false;
        auto const* first = text.data() + pos;
        auto const [ptr, ec] = std::from_chars(first, first + width, out);
        return ec == std::errc {} && ptr == first + width;
    }

    auto expectChar(std::string_view text, size_t pos, char c) -> bool
    {
        return pos < text.size() && text[pos] == c;
    }

} // namespace

auto nowUtc() -> Timestamp
{
    return std::chrono::floor<std::chrono::microseconds>(SystemClock::now());
}

auto formatIso8601(SystemClock::time_point instant) -> std::string
{
    auto const micros = std::chrono::floor<std::chrono::microseconds>(instant);
    return std::format("{:%Y-%m-%dT%H:%M:%S}+00:00", micros);
}

auto parseIso8601(std::string_view text) -> Result<Timestamp>
{
    auto const invalid = [&text]() {
        return makeError(ErrorCode::ProtocolError, std::format("Invalid ISO-8601 timestamp: '{}'", text));
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, 0, 4, year) || !expectChar(text, 4, '-') || !readDigits(text, 5, 2, month)
        || !expectChar(text, 7, '-') || !readDigits(text, 8, 2, day)
        || !(expectChar(text, 10, 'T') || expectChar(text, 10, ' ')) || !readDigits(text, 11, 2, hour)
        || !expectChar(text, 13, ':') || !readDigits(text, 14, 2, minute) || !expectChar(text, 16, ':')
        || !readDigits(text, 17, 2, second))
        return invalid();

    auto pos = size_t { 19 };
    auto micros = 0L;
    if (expectChar(text, pos, '.'))
    {
        ++pos;
        auto digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            if (digits < 6)
            {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return invalid();
        for (; digits < 6; ++digits)
            micros *= 10;
    }

    auto offsetMinutes = 0;
    if (pos < text.size())
    {
        if (text[pos] == 'Z' && pos + 1 == text.size())
        {
            pos += 1;
        }
        else if ((text[pos] == '+' || text[pos] == '-') && pos + 6 == text.size())
        {
            int offH = 0, offM = 0;
            if (!readDigits(text, pos + 1, 2, offH) || !expectChar(text, pos + 3, ':')
                || !readDigits(text, pos + 4, 2, offM))
                return invalid();
            offsetMinutes = (offH * 60 + offM) * (text[pos] == '-' ? -1 : 1);
            pos += 6;
        }
        else
        {
            return invalid();
        }
    }

    auto const date = std::chrono::year_month_day { std::chrono::year { year },
                                                    std::chrono::month { static_cast<unsigned>(month) },
                                                    std::chrono::day { static_cast<unsigned>(day) } };
    if (!date.ok() || hour > 23 || minute > 59 || second > 60)
        return invalid();

    auto const local = std::chrono::sys_days { date } + std::chrono::hours { hour }
                       + std::chrono::minutes { minute } + std::chrono::seconds { second }
                       + std::chrono::microseconds { micros };
    return Timestamp { local - std::chrono::minutes { offsetMinutes } };
}

} // namespace callscribe
