#pragma once
/**
 * @file daemon_lifecycle.hpp
 * @brief Single-instance daemon supervisor: PID lock, detach, tick loop, status.
 *
 * State machine: stopped -> starting -> running -> stopping -> stopped, with
 * running -> error when a periodic callback throws.
 *
 * start(foreground=true) records the PID and runs the tick loop on the calling
 * thread until request_stop() (or SIGINT/SIGTERM) and then performs the stop
 * sequence. start(foreground=false) reclaims a stale lock, asks the Detacher to
 * launch a detached instance (which runs `start --foreground` itself) and
 * returns once that instance has recorded its PID.
 *
 * Each tick runs the health check and the cleanup task when their own
 * intervals have elapsed, then rewrites the status document. The sleep between
 * ticks is sliced into poll intervals so a stop request is seen promptly.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "status_store.hpp"
#include "utils/result.hpp"

namespace ctxhub::coord
{

enum class StartError
{
    AlreadyRunning,
    LockFailure,
    DetachFailure,
    StatusWriteFailure
};

enum class StartOutcome
{
    Stopped,  ///< Foreground run finished with an orderly stop
    Launched, ///< A detached instance is running
    Faulted   ///< Foreground run ended in the error state
};

enum class StopError
{
    NotRunning,
    SignalFailed,
    Timeout
};

const char *to_string(StartError e) noexcept;
const char *to_string(StopError e) noexcept;

// ============================================================================
// Detacher
// ============================================================================

/**
 * @brief Launches a copy of the daemon that outlives the calling terminal.
 */
class Detacher
{
  public:
    virtual ~Detacher() = default;

    /**
     * @brief Starts the detached instance.
     * @return Its process id, or nullopt on failure (err_code set).
     */
    virtual std::optional<uint64_t> launch_detached(std::error_code *err_code) noexcept = 0;
};

/**
 * @brief fork, setsid, fork again, redirect stdio, exec.
 *
 * The grandchild is a fresh process image, so none of the launcher's threads
 * or open locks leak into the daemon.
 */
class PosixDoubleForkDetacher final : public Detacher
{
  public:
    struct Options
    {
        std::filesystem::path executable;
        std::vector<std::string> args; ///< argv[1..]
        std::filesystem::path stdout_file;
        std::filesystem::path stderr_file;
        std::filesystem::path working_dir{"/"};
    };

    explicit PosixDoubleForkDetacher(Options options);

    std::optional<uint64_t> launch_detached(std::error_code *err_code) noexcept override;

  private:
    Options m_options;
};

// ============================================================================
// DaemonLifecycle
// ============================================================================

struct DaemonOptions
{
    std::filesystem::path pid_file;
    std::filesystem::path status_file;
    std::chrono::milliseconds tick{std::chrono::seconds(30)};
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds health_interval{std::chrono::seconds(300)};
    std::chrono::milliseconds cleanup_interval{std::chrono::seconds(1800)};
    /// How long a background start waits for the detached instance's PID.
    std::chrono::milliseconds launch_wait{std::chrono::seconds(5)};
    bool install_signal_handlers{true};
    nlohmann::json static_data = nlohmann::json::object(); ///< Merged into every status
};

struct HealthScore
{
    int score{100};
    size_t critical{0};
    size_t warnings{0};
};

class DaemonLifecycle
{
  public:
    using HealthScorer = std::function<HealthScore()>;
    using CleanupTask = std::function<void()>;
    using StatusProvider = std::function<nlohmann::json()>;
    using Hook = std::function<void()>;

    explicit DaemonLifecycle(DaemonOptions options, std::unique_ptr<Detacher> detacher = nullptr);
    ~DaemonLifecycle();

    DaemonLifecycle(const DaemonLifecycle &) = delete;
    DaemonLifecycle &operator=(const DaemonLifecycle &) = delete;

    void set_health_scorer(HealthScorer scorer);
    void set_cleanup_task(CleanupTask task);
    /// Live fields (active context, activity) merged into `data` on every tick.
    void set_status_provider(StatusProvider provider);
    /// Called on the loop thread after the lock is taken / before the final status.
    void set_hooks(Hook on_running, Hook on_stopping);

    utils::Result<StartOutcome, StartError> start(bool foreground);

    /// Async-signal-safe; the loop notices within one poll interval.
    void request_stop() noexcept;

    DaemonState state() const noexcept;

    /**
     * @brief Reports the daemon recorded in the PID file.
     * @details Never modifies the PID file; a dead PID is reported as stale.
     */
    nlohmann::json status() const;

    /**
     * @brief Sends SIGTERM to the recorded daemon and waits for it to exit.
     * @return The stopped PID.
     */
    utils::Result<uint64_t, StopError> stop_running(std::chrono::milliseconds wait) const;

    /// Best-effort stop of the running instance, then start(foreground=false).
    utils::Result<StartOutcome, StartError> restart(std::chrono::milliseconds wait);

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ctxhub::coord
