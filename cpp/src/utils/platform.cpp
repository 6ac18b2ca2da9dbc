/**
 * @file platform.cpp
 * @brief POSIX implementations of the ctxhub::platform queries.
 */
#include "ctxhub_base.hpp"
#include "ctxhub_version.h"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <limits>

#include <pthread.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(CTXHUB_PLATFORM_APPLE)
#include <mach-o/dyld.h>
#endif

namespace ctxhub::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(::getpid());
}

uint64_t get_native_thread_id() noexcept
{
#if defined(CTXHUB_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#endif
}

namespace
{
std::string executable_path()
{
#if defined(CTXHUB_PLATFORM_LINUX)
    char buf[PATH_MAX];
    const ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf));
    return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
#else
    char raw[PATH_MAX];
    uint32_t size = sizeof(raw);
    if (_NSGetExecutablePath(raw, &size) != 0)
        return {};
    char resolved[PATH_MAX];
    return ::realpath(raw, resolved) != nullptr ? std::string(resolved) : std::string(raw);
#endif
}
} // namespace

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        const std::string path = executable_path();
        if (path.empty())
            return "unknown";
        return include_path ? path : std::filesystem::path(path).filename().string();
    }
    catch (const std::exception &e)
    {
        CTXHUB_DEBUG("get_executable_name failed: {}", e.what());
        return "unknown";
    }
}

const char *get_version_string() noexcept
{
    return CTXHUB_VERSION_STRING;
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0 || pid > static_cast<uint64_t>(std::numeric_limits<pid_t>::max()))
        return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno == EPERM;
}

uint64_t monotonic_time_ns() noexcept
{
    const auto since = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since).count());
}

} // namespace ctxhub::platform
