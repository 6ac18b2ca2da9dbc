// format_tools.cpp
#include "ctxhub_base.hpp"

#include <cctype>
#include <ctime>
#include <utility>

namespace ctxhub::format_tools
{

namespace
{

// Splits a time_point into whole local seconds and the 0..999999 microsecond remainder.
std::pair<std::tm, int> split_local(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
    {
        fractional_us += 1000000;
        secs -= std::chrono::seconds(1);
    }
    return {fmt::localtime(std::chrono::system_clock::to_time_t(secs)), fractional_us};
}

} // namespace

// Two-step formatting: whole seconds through fmt's std::tm support, then the fraction.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto [tm, fractional_us] = split_local(timestamp);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", tm, fractional_us);
}

std::string iso_timestamp(std::chrono::system_clock::time_point timestamp)
{
    auto [tm, fractional_us] = split_local(timestamp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", tm, fractional_us);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

bool is_truthy(std::string_view value) noexcept
{
    const auto trimmed = trim_whitespace(value);
    auto iequals = [trimmed](std::string_view word)
    {
        if (trimmed.size() != word.size())
        {
            return false;
        }
        for (size_t i = 0; i < word.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(trimmed[i])) != word[i])
            {
                return false;
            }
        }
        return true;
    };
    return iequals("1") || iequals("true") || iequals("yes") || iequals("on");
}

} // namespace ctxhub::format_tools
