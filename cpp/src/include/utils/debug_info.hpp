/**
 * @file debug_info.hpp
 * @brief Fatal-error and diagnostic helpers shared by the utility modules.
 *
 * Everything here writes straight to `stderr`; none of it goes through the Logger,
 * because these paths run when the Logger is not available (or is the thing that broke).
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>
#include "utils/format_tools.hpp"

namespace ctxhub::debug
{

/// "file.cpp:123:function" for a source location, with the directory part stripped.
inline std::string where(const std::source_location &loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Writes the demangled call stack of the calling thread to `stderr`.
 */
CTXHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Reports a broken invariant and aborts the process.
 *
 * Used for programming errors only, e.g. touching a utility whose lifecycle module
 * was never started. Recoverable failures are reported through return values.
 */
template <typename... Args>
[[noreturn]] void panic(const std::source_location &loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[PANIC] {} -- {}\n", where(loc),
                   fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[PANIC] {} -- unformattable message '{}' ({})\n", where(loc),
                   fmt::string_view(fmt_str), e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/// Unconditional `[DBG]` line on `stderr`. Prefer the CTXHUB_DEBUG macro.
template <typename... Args>
void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DBG]  unformattable message '{}' ({})\n", fmt::string_view(fmt_str), e.what());
    }
}

} // namespace ctxhub::debug

#ifndef CTXHUB_PANIC
#define CTXHUB_PANIC(fmt, ...)                                                                     \
    ::ctxhub::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

// Debug chatter is compiled in only with CTXHUB_ENABLE_DEBUG_MESSAGES.
#ifndef CTXHUB_DEBUG
#if defined(CTXHUB_ENABLE_DEBUG_MESSAGES)
#define CTXHUB_DEBUG(fmt, ...) ::ctxhub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define CTXHUB_DEBUG(fmt, ...) static_cast<void>(0)
#endif
#endif
