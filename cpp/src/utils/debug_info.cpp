/**
 * @file debug_info.cpp
 * @brief Stack trace printing for ctxhub::debug::print_stack_trace()
 */
#include "ctxhub_base.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cxxabi.h>   // __cxa_demangle
#include <execinfo.h> // backtrace, backtrace_symbols
#include <string>

namespace ctxhub::debug
{

namespace
{

// backtrace_symbols() yields "module(mangled+0xoff) [0xaddr]"; demangle the middle part.
std::string demangle_frame(const char *raw)
{
    std::string frame(raw);
    const auto open = frame.find('(');
    const auto plus = frame.find('+', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || plus == std::string::npos || plus <= open + 1)
    {
        return frame;
    }

    const std::string mangled = frame.substr(open + 1, plus - open - 1);
    int status = 0;
    char *demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr)
    {
        std::free(demangled);
        return frame;
    }
    auto guard = basics::make_scope_guard([demangled]() { std::free(demangled); });
    return frame.substr(0, open + 1) + demangled + frame.substr(plus);
}

} // namespace

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 64;
    std::array<void *, kMaxFrames> frames{};
    const int count = ::backtrace(frames.data(), kMaxFrames);
    if (count <= 0)
    {
        fmt::print(stderr, "  [stack trace unavailable]\n");
        return;
    }

    char **symbols = ::backtrace_symbols(frames.data(), count);
    if (symbols == nullptr)
    {
        fmt::print(stderr, "  [backtrace_symbols failed]\n");
        return;
    }

    try
    {
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < count; ++i)
        {
            fmt::print(stderr, "  #{:<2} {}\n", i - 1, demangle_frame(symbols[i]));
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "  [stack trace formatting failed: {}]\n", e.what());
    }
    std::free(symbols);
    std::fflush(stderr);
}

} // namespace ctxhub::debug
