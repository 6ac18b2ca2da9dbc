/**
 * @file daemon_lifecycle.cpp
 * @brief DaemonLifecycle state machine, PID lock handling and POSIX detach.
 */
#include "daemon_lifecycle.hpp"

#include "ctxhub_service.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ctxhub::coord
{
namespace fs = std::filesystem;
using utils::Result;

namespace
{
// Set by the SIGINT/SIGTERM handler; observed by every running loop.
std::atomic<int> g_stop_signal{0};

void handle_stop_signal(int signum)
{
    g_stop_signal.store(signum, std::memory_order_relaxed);
}

void set_errno_code(std::error_code *err_code, int errnum)
{
    if (err_code != nullptr)
    {
        *err_code = std::error_code(errnum, std::generic_category());
    }
}

// Reads exactly @p len bytes unless EOF comes first; returns the count read.
size_t read_full(int fd, void *buf, size_t len)
{
    size_t got = 0;
    auto *p = static_cast<char *>(buf);
    while (got < len)
    {
        const ssize_t n = ::read(fd, p + got, len - got);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        got += static_cast<size_t>(n);
    }
    return got;
}

void write_full(int fd, const void *buf, size_t len)
{
    const auto *p = static_cast<const char *>(buf);
    while (len > 0)
    {
        const ssize_t n = ::write(fd, p, len);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return;
        p += n;
        len -= static_cast<size_t>(n);
    }
}
} // namespace

const char *to_string(StartError e) noexcept
{
    switch (e)
    {
    case StartError::AlreadyRunning:
        return "already_running";
    case StartError::LockFailure:
        return "lock_failure";
    case StartError::DetachFailure:
        return "detach_failure";
    case StartError::StatusWriteFailure:
        return "status_write_failure";
    }
    return "unknown";
}

const char *to_string(StopError e) noexcept
{
    switch (e)
    {
    case StopError::NotRunning:
        return "not_running";
    case StopError::SignalFailed:
        return "signal_failed";
    case StopError::Timeout:
        return "timeout";
    }
    return "unknown";
}

// ============================================================================
// PosixDoubleForkDetacher
// ============================================================================

PosixDoubleForkDetacher::PosixDoubleForkDetacher(Options options) : m_options(std::move(options))
{
}

std::optional<uint64_t> PosixDoubleForkDetacher::launch_detached(std::error_code *err_code) noexcept
{
    try
    {
        // Everything the children need is prepared before fork(): after it, only
        // async-signal-safe calls are made until exec.
        std::vector<std::string> arg_storage;
        arg_storage.push_back(m_options.executable.string());
        arg_storage.insert(arg_storage.end(), m_options.args.begin(), m_options.args.end());
        std::vector<char *> argv;
        for (auto &a : arg_storage)
            argv.push_back(a.data());
        argv.push_back(nullptr);

        const std::string out_path = m_options.stdout_file.string();
        const std::string err_path = m_options.stderr_file.string();
        const std::string work_dir = m_options.working_dir.string();

        for (const auto &p : {m_options.stdout_file, m_options.stderr_file})
        {
            std::error_code ec;
            if (!p.parent_path().empty())
                fs::create_directories(p.parent_path(), ec);
        }

        int report[2];
        if (::pipe2(report, O_CLOEXEC) != 0)
        {
            const int errnum = errno;
            set_errno_code(err_code, errnum);
            LOGGER_ERROR("[daemon] pipe2 failed: {}", std::strerror(errnum));
            return std::nullopt;
        }

        const pid_t first = ::fork();
        if (first < 0)
        {
            const int errnum = errno;
            ::close(report[0]);
            ::close(report[1]);
            set_errno_code(err_code, errnum);
            LOGGER_ERROR("[daemon] fork #1 failed: {}", std::strerror(errnum));
            return std::nullopt;
        }

        if (first == 0)
        {
            // Intermediate child: new session, then hand off to the grandchild.
            ::close(report[0]);
            if (::setsid() < 0)
                ::_exit(1);
            const pid_t second = ::fork();
            if (second < 0)
                ::_exit(1);
            if (second > 0)
                ::_exit(0);

            // Grandchild: the daemon.
            ::umask(022);
            if (::chdir(work_dir.c_str()) != 0)
            {
                const int rc = ::chdir("/");
                (void)rc;
            }
            // Only the standard descriptors survive into the exec'd image.
            auto redirect = [](int fd, int target)
            {
                if (fd < 0 || fd == target)
                    return;
                ::dup2(fd, target);
                ::close(fd);
            };
            redirect(::open("/dev/null", O_RDONLY), STDIN_FILENO);
            redirect(::open(out_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644), STDOUT_FILENO);
            redirect(::open(err_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644), STDERR_FILENO);

            const uint64_t self = static_cast<uint64_t>(::getpid());
            write_full(report[1], &self, sizeof(self));
            ::execv(argv[0], argv.data());
            const int exec_errno = errno;
            write_full(report[1], &exec_errno, sizeof(exec_errno));
            ::_exit(127);
        }

        ::close(report[1]);
        auto close_read = basics::make_scope_guard([&]() { ::close(report[0]); });

        int wstatus = 0;
        while (::waitpid(first, &wstatus, 0) < 0 && errno == EINTR)
        {
        }
        if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0)
        {
            set_errno_code(err_code, ECHILD);
            LOGGER_ERROR("[daemon] detach failed: setsid or fork #2 failed in the intermediate "
                         "child");
            return std::nullopt;
        }

        uint64_t daemon_pid = 0;
        if (read_full(report[0], &daemon_pid, sizeof(daemon_pid)) != sizeof(daemon_pid))
        {
            set_errno_code(err_code, ECHILD);
            LOGGER_ERROR("[daemon] detach failed: the detached process did not report its pid");
            return std::nullopt;
        }
        int exec_errno = 0;
        if (read_full(report[0], &exec_errno, sizeof(exec_errno)) == sizeof(exec_errno))
        {
            set_errno_code(err_code, exec_errno);
            LOGGER_ERROR("[daemon] exec of '{}' failed: {}", arg_storage.front(),
                         std::strerror(exec_errno));
            return std::nullopt;
        }

        if (err_code != nullptr)
            *err_code = {};
        LOGGER_INFO("[daemon] detached instance launched (PID {})", daemon_pid);
        return daemon_pid;
    }
    catch (const std::exception &ex)
    {
        set_errno_code(err_code, ENOMEM);
        LOGGER_ERROR("[daemon] detach failed: {}", ex.what());
        return std::nullopt;
    }
}

// ============================================================================
// DaemonLifecycle::Impl
// ============================================================================

struct DaemonLifecycle::Impl
{
    Impl(DaemonOptions opts, std::unique_ptr<Detacher> det)
        : options(std::move(opts)), detacher(std::move(det)), pid_file(options.pid_file),
          status_store(options.status_file)
    {
    }

    DaemonOptions options;
    std::unique_ptr<Detacher> detacher;
    PidFile pid_file;
    StatusStore status_store;

    HealthScorer health_scorer;
    CleanupTask cleanup_task;
    StatusProvider status_provider;
    Hook on_running;
    Hook on_stopping;

    std::atomic<DaemonState> state{DaemonState::Stopped};
    std::atomic<bool> stop_requested{false};

    std::string started_at;
    nlohmann::json health_data = nlohmann::json::object();

    struct sigaction old_int{};
    struct sigaction old_term{};
    bool handlers_installed{false};

    bool stop_pending() const noexcept
    {
        return stop_requested.load(std::memory_order_acquire) ||
               g_stop_signal.load(std::memory_order_relaxed) != 0;
    }

    void install_signal_handlers()
    {
        if (!options.install_signal_handlers || handlers_installed)
            return;
        g_stop_signal.store(0, std::memory_order_relaxed);
        struct sigaction sa{};
        sa.sa_handler = &handle_stop_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        ::sigaction(SIGINT, &sa, &old_int);
        ::sigaction(SIGTERM, &sa, &old_term);
        handlers_installed = true;
    }

    void restore_signal_handlers()
    {
        if (!handlers_installed)
            return;
        ::sigaction(SIGINT, &old_int, nullptr);
        ::sigaction(SIGTERM, &old_term, nullptr);
        handlers_installed = false;
    }

    /// Returns the live pid holding the lock, after removing a stale one.
    std::optional<uint64_t> check_lock(uint64_t self)
    {
        const auto existing = pid_file.read_pid();
        if (!existing)
        {
            std::error_code ec;
            if (fs::exists(pid_file.path(), ec))
            {
                LOGGER_WARN("[daemon] unreadable PID file '{}' reclaimed", pid_file.path().string());
                pid_file.remove();
            }
            return std::nullopt;
        }
        if (*existing != self && platform::is_process_alive(*existing))
            return existing;
        if (*existing != self)
        {
            LOGGER_INFO("[daemon] removing stale PID file (PID {} not running)", *existing);
            pid_file.remove();
        }
        return std::nullopt;
    }

    Result<utils::Unit, StartError> acquire_lock(uint64_t self);

    bool write_status(DaemonState st, const nlohmann::json &extra = nlohmann::json::object())
    {
        DaemonStatus status;
        status.state = st;
        status.pid = platform::get_pid();
        status.started_at = started_at;
        status.data = options.static_data.is_object() ? options.static_data
                                                      : nlohmann::json::object();
        status.data.update(health_data);
        if (extra.is_object())
            status.data.update(extra);
        return status_store.write(std::move(status));
    }

    void sleep_one_tick()
    {
        const auto deadline = std::chrono::steady_clock::now() + options.tick;
        while (!stop_pending())
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                break;
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(options.poll_interval,
                                                              deadline - now));
        }
    }

    Result<StartOutcome, StartError> run_foreground();
    Result<StartOutcome, StartError> launch_background();
    void shutdown(bool faulted);
};

Result<utils::Unit, StartError> DaemonLifecycle::Impl::acquire_lock(uint64_t self)
{
    utils::FileLock guard(pid_file.path(), utils::LockMode::Blocking);
    if (!guard.valid())
    {
        return Result<utils::Unit, StartError>::error(
            StartError::LockFailure,
            fmt::format("Cannot lock '{}': {}", pid_file.path().string(),
                        guard.error_code().message()),
            guard.error_code().value());
    }

    if (const auto holder = check_lock(self))
    {
        return Result<utils::Unit, StartError>::error(
            StartError::AlreadyRunning, fmt::format("Daemon already running (PID: {})", *holder));
    }

    std::error_code ec;
    if (!pid_file.write_pid(self, &ec))
    {
        return Result<utils::Unit, StartError>::error(
            StartError::LockFailure,
            fmt::format("Cannot write PID file '{}': {}", pid_file.path().string(), ec.message()),
            ec.value());
    }
    return Result<utils::Unit, StartError>::ok(utils::Unit{});
}

Result<StartOutcome, StartError> DaemonLifecycle::Impl::run_foreground()
{
    const uint64_t self = platform::get_pid();
    auto lock = acquire_lock(self);
    if (lock.is_error())
        return Result<StartOutcome, StartError>::error(lock.error(), lock.error_message(),
                                                       lock.error_code());

    stop_requested.store(false, std::memory_order_release);
    started_at = format_tools::iso_timestamp(std::chrono::system_clock::now());
    health_data = nlohmann::json::object();
    state.store(DaemonState::Starting, std::memory_order_release);
    if (!write_status(DaemonState::Starting))
    {
        pid_file.remove();
        state.store(DaemonState::Stopped, std::memory_order_release);
        return Result<StartOutcome, StartError>::error(
            StartError::StatusWriteFailure,
            fmt::format("Cannot write status file '{}'", status_store.path().string()));
    }

    install_signal_handlers();
    LOGGER_SYSTEM("[daemon] started (PID {})", self);

    bool faulted = false;
    try
    {
        if (on_running)
            on_running();
        state.store(DaemonState::Running, std::memory_order_release);

        std::optional<std::chrono::steady_clock::time_point> last_health;
        std::optional<std::chrono::steady_clock::time_point> last_cleanup;
        while (!stop_pending())
        {
            const auto now = std::chrono::steady_clock::now();
            if (health_scorer && (!last_health || now - *last_health >= options.health_interval))
            {
                LOGGER_INFO("[daemon] running scheduled health check");
                const HealthScore hs = health_scorer();
                health_data["health_score"] = hs.score;
                health_data["critical"] = hs.critical;
                health_data["warnings"] = hs.warnings;
                health_data["last_health_check"] =
                    format_tools::iso_timestamp(std::chrono::system_clock::now());
                LOGGER_INFO("[daemon] health check complete, score {}", hs.score);
                last_health = now;
            }
            if (!last_cleanup || now - *last_cleanup >= options.cleanup_interval)
            {
                if (cleanup_task)
                    cleanup_task();
                health_data["last_cleanup"] =
                    format_tools::iso_timestamp(std::chrono::system_clock::now());
                last_cleanup = now;
            }

            nlohmann::json live = status_provider ? status_provider() : nlohmann::json::object();
            if (!write_status(DaemonState::Running, live))
                LOGGER_WARN("[daemon] status update failed; continuing");

            sleep_one_tick();
        }
    }
    catch (const std::exception &ex)
    {
        faulted = true;
        state.store(DaemonState::Error, std::memory_order_release);
        LOGGER_ERROR("[daemon] periodic callback failed: {}", ex.what());
        write_status(DaemonState::Error, nlohmann::json{{"error", ex.what()}});
    }

    if (const int sig = g_stop_signal.load(std::memory_order_relaxed); sig != 0)
        LOGGER_SYSTEM("[daemon] received signal {}, shutting down", sig);

    shutdown(faulted);
    return Result<StartOutcome, StartError>::ok(faulted ? StartOutcome::Faulted
                                                        : StartOutcome::Stopped);
}

void DaemonLifecycle::Impl::shutdown(bool faulted)
{
    if (!faulted)
    {
        state.store(DaemonState::Stopping, std::memory_order_release);
        write_status(DaemonState::Stopping);
    }
    if (on_stopping)
    {
        try
        {
            on_stopping();
        }
        catch (const std::exception &ex)
        {
            LOGGER_ERROR("[daemon] stop hook failed: {}", ex.what());
        }
    }
    if (!faulted)
    {
        write_status(DaemonState::Stopped);
        state.store(DaemonState::Stopped, std::memory_order_release);
    }
    pid_file.remove();
    restore_signal_handlers();
    g_stop_signal.store(0, std::memory_order_relaxed);
    LOGGER_SYSTEM("[daemon] stopped");
}

Result<StartOutcome, StartError> DaemonLifecycle::Impl::launch_background()
{
    {
        utils::FileLock guard(pid_file.path(), utils::LockMode::Blocking);
        if (!guard.valid())
        {
            return Result<StartOutcome, StartError>::error(
                StartError::LockFailure,
                fmt::format("Cannot lock '{}': {}", pid_file.path().string(),
                            guard.error_code().message()));
        }
        if (const auto holder = check_lock(platform::get_pid()))
        {
            return Result<StartOutcome, StartError>::error(
                StartError::AlreadyRunning,
                fmt::format("Daemon already running (PID: {})", *holder));
        }
    }

    if (!detacher)
    {
        return Result<StartOutcome, StartError>::error(StartError::DetachFailure,
                                                       "No detach mechanism configured");
    }

    std::error_code ec;
    const auto launched = detacher->launch_detached(&ec);
    if (!launched)
    {
        return Result<StartOutcome, StartError>::error(
            StartError::DetachFailure, fmt::format("Cannot detach: {}", ec.message()),
            ec.value());
    }

    const auto deadline = std::chrono::steady_clock::now() + options.launch_wait;
    while (std::chrono::steady_clock::now() < deadline)
    {
        const auto recorded = pid_file.read_pid();
        if (recorded && *recorded == *launched)
            return Result<StartOutcome, StartError>::ok(StartOutcome::Launched);
        if (!platform::is_process_alive(*launched))
        {
            return Result<StartOutcome, StartError>::error(
                StartError::DetachFailure,
                fmt::format("Detached daemon (PID {}) exited during startup", *launched));
        }
        std::this_thread::sleep_for(options.poll_interval);
    }
    LOGGER_WARN("[daemon] detached daemon (PID {}) has not recorded its PID yet", *launched);
    return Result<StartOutcome, StartError>::ok(StartOutcome::Launched);
}

// ============================================================================
// DaemonLifecycle
// ============================================================================

DaemonLifecycle::DaemonLifecycle(DaemonOptions options, std::unique_ptr<Detacher> detacher)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(detacher)))
{
}

DaemonLifecycle::~DaemonLifecycle() = default;

void DaemonLifecycle::set_health_scorer(HealthScorer scorer)
{
    pImpl->health_scorer = std::move(scorer);
}

void DaemonLifecycle::set_cleanup_task(CleanupTask task)
{
    pImpl->cleanup_task = std::move(task);
}

void DaemonLifecycle::set_status_provider(StatusProvider provider)
{
    pImpl->status_provider = std::move(provider);
}

void DaemonLifecycle::set_hooks(Hook on_running, Hook on_stopping)
{
    pImpl->on_running = std::move(on_running);
    pImpl->on_stopping = std::move(on_stopping);
}

Result<StartOutcome, StartError> DaemonLifecycle::start(bool foreground)
{
    if (pImpl->state.load(std::memory_order_acquire) != DaemonState::Stopped &&
        pImpl->state.load(std::memory_order_acquire) != DaemonState::Error)
    {
        return Result<StartOutcome, StartError>::error(
            StartError::AlreadyRunning,
            fmt::format("Daemon already running (PID: {})", platform::get_pid()));
    }
    return foreground ? pImpl->run_foreground() : pImpl->launch_background();
}

void DaemonLifecycle::request_stop() noexcept
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

DaemonState DaemonLifecycle::state() const noexcept
{
    return pImpl->state.load(std::memory_order_acquire);
}

nlohmann::json DaemonLifecycle::status() const
{
    const auto pid = pImpl->pid_file.read_pid();
    if (!pid)
        return {{"running", false}, {"message", "Daemon is not running (no PID file)"}};

    if (!platform::is_process_alive(*pid))
    {
        return {{"running", false},
                {"stale", true},
                {"pid", *pid},
                {"message", fmt::format("Daemon is not running (stale PID file: {})", *pid)}};
    }

    if (auto recorded = pImpl->status_store.read())
    {
        nlohmann::json j = recorded->to_json();
        j["running"] = true;
        j["pid"] = *pid;
        return j;
    }
    return {{"running", true}, {"pid", *pid}, {"message", "Daemon is running"}};
}

Result<uint64_t, StopError> DaemonLifecycle::stop_running(std::chrono::milliseconds wait) const
{
    const auto pid = pImpl->pid_file.read_pid();
    if (!pid)
        return Result<uint64_t, StopError>::error(StopError::NotRunning,
                                                  "Daemon is not running (no PID file)");
    if (!platform::is_process_alive(*pid))
    {
        return Result<uint64_t, StopError>::error(
            StopError::NotRunning, fmt::format("Daemon is not running (stale PID file: {})", *pid));
    }

    if (::kill(static_cast<pid_t>(*pid), SIGTERM) != 0)
    {
        const int errnum = errno;
        return Result<uint64_t, StopError>::error(
            StopError::SignalFailed, fmt::format("Cannot signal PID {}: {}", *pid,
                                                 std::strerror(errnum)),
            errnum);
    }
    LOGGER_INFO("[daemon] sent SIGTERM to PID {}", *pid);

    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (!platform::is_process_alive(*pid))
            return Result<uint64_t, StopError>::ok(*pid);
        std::this_thread::sleep_for(pImpl->options.poll_interval);
    }
    if (!platform::is_process_alive(*pid))
        return Result<uint64_t, StopError>::ok(*pid);
    return Result<uint64_t, StopError>::error(
        StopError::Timeout, fmt::format("PID {} still running after {} ms", *pid, wait.count()));
}

Result<StartOutcome, StartError> DaemonLifecycle::restart(std::chrono::milliseconds wait)
{
    auto stopped = stop_running(wait);
    if (stopped.is_ok())
        LOGGER_INFO("[daemon] restart: stopped PID {}", stopped.content());
    else
        LOGGER_INFO("[daemon] restart: {}", stopped.error_message());
    return start(false);
}

} // namespace ctxhub::coord
