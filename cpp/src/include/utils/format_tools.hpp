/**
 * @file format_tools.hpp
 * @brief Timestamp rendering and small string helpers.
 */
#pragma once
#include <chrono>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace ctxhub::format_tools
{

/// Local time as "YYYY-MM-DD HH:MM:SS.ffffff"; the log line prefix.
CTXHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Local time as "YYYY-MM-DDTHH:MM:SS.ffffff".
 *
 * Every timestamp ctxhub persists (message created_at/read_at, status
 * started_at/last_update) uses this form, so comparing the strings compares the times.
 */
CTXHUB_UTILS_EXPORT std::string iso_timestamp(std::chrono::system_clock::time_point timestamp);

/// @p str without leading and trailing ASCII whitespace.
CTXHUB_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/// "1", "true", "yes" and "on" (any case, surrounding blanks ignored) are true.
CTXHUB_UTILS_EXPORT bool is_truthy(std::string_view value) noexcept;

/// Formats into a fresh memory_buffer; the Logger queues these as record bodies.
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer body;
    fmt::format_to(std::back_inserter(body), fmt_str, std::forward<Args>(args)...);
    return body;
}

/// Last path component of a `__FILE__`-style path.
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto slash = file_path.rfind('/');
    return slash == std::string_view::npos ? file_path : file_path.substr(slash + 1);
}

} // namespace ctxhub::format_tools
