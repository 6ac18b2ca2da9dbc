#pragma once
/**
 * @file ctxhub_platform.hpp
 * @brief Layer 0: platform detection and the few OS queries ctxhub needs.
 *
 * Self-contained; safe to include first. The build may force a platform with
 * PLATFORM_LINUX or PLATFORM_APPLE, otherwise compiler macros decide.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_LINUX) || (!defined(PLATFORM_APPLE) && defined(__linux__))
#define CTXHUB_PLATFORM_LINUX 1
#elif defined(PLATFORM_APPLE) || (defined(__APPLE__) && defined(__MACH__))
#define CTXHUB_PLATFORM_APPLE 1
#else
#error "ctxhub supports Linux and macOS only (fork/setsid detach, flock, signals)."
#endif

#if __cplusplus < 202002L
#error "ctxhub needs C++20 (std::source_location, designated initializers)."
#endif

#include "ctxhub_utils_export.h"

namespace ctxhub::platform
{

/// Kernel thread id of the caller (gettid on Linux), for log lines.
CTXHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

CTXHUB_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Name of the running executable.
 * @param include_path true for the resolved absolute path, false for the file name.
 * @return "unknown" when the OS query fails.
 */
CTXHUB_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// "major.minor.patch" of this build.
CTXHUB_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief True when @p pid names an existing process, checked with kill(pid, 0).
 *
 * EPERM counts as alive. An exited but unreaped child also counts as alive.
 * PID 0 and values beyond pid_t are never alive.
 */
CTXHUB_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/// Steady-clock reading in nanoseconds; only differences are meaningful.
CTXHUB_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

} // namespace ctxhub::platform
