#pragma once
/**
 * @file file_activity_watcher.hpp
 * @brief inotify-backed recursive directory watcher feeding an ActivityTracker.
 *
 * Each context registers its watch directories; every existing directory is
 * watched recursively, and directories created later are picked up as they
 * appear. Raw events pass through on_raw_event(), which drops noise paths
 * (VCS metadata, caches, logs) and repeats of the same path inside the
 * debounce interval before forwarding to ActivityTracker::record().
 *
 * A directory that cannot be watched is logged and skipped; the others keep
 * working.
 */

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "activity_tracker.hpp"

namespace ctxhub::coord
{

class FileActivityWatcher
{
  public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    FileActivityWatcher(ActivityTracker &tracker, std::chrono::duration<double> debounce,
                        Clock clock = {});
    ~FileActivityWatcher();

    FileActivityWatcher(const FileActivityWatcher &) = delete;
    FileActivityWatcher &operator=(const FileActivityWatcher &) = delete;

    /**
     * @brief Registers @p dirs for @p context.
     * @details Missing directories are skipped silently. May be called before or
     *          after start(); before start() the watches are installed by start().
     * @return Number of directories (including subdirectories) now watched for @p context.
     */
    size_t add_context(const std::string &context, const std::vector<std::filesystem::path> &dirs);

    /** @brief Opens the inotify instance and starts the reader thread. */
    bool start(std::error_code *err_code = nullptr) noexcept;

    /** @brief Stops the reader thread and closes every watch. Idempotent. */
    void stop() noexcept;

    [[nodiscard]] bool is_running() const noexcept;
    size_t watch_count() const;

    /**
     * @brief Filters, debounces and forwards one event.
     * @return true when the event reached the tracker.
     */
    bool on_raw_event(std::string_view context, const std::filesystem::path &path,
                      ActivityKind kind, bool is_directory = false);

    /**
     * @brief Noise filter applied to every event and every directory before it is watched.
     * @details Substrings __pycache__, .pyc, .git, node_modules and .DS_Store; path
     *          components venv, .venv and .env; suffixes .log, .swp, .swo, .swx, .tmp and ~.
     */
    static bool is_ignored(std::string_view path) noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ctxhub::coord
