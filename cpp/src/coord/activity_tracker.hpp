#pragma once
/**
 * @file activity_tracker.hpp
 * @brief Per-context activity buffers and "active context" resolution.
 *
 * The tracker keeps, for every known context, the last N events and the time
 * of the most recent one. The active context is the one with the newest
 * last-seen time inside the activity window; equal times resolve to the
 * lexically smallest context id. State lives in memory only.
 *
 * All members are safe to call from the watcher thread and the daemon loop
 * concurrently.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "context_registry.hpp"

namespace ctxhub::coord
{

enum class ActivityKind
{
    Created,
    Modified,
    Deleted
};

const char *to_string(ActivityKind kind) noexcept;

struct ActivityEvent
{
    std::string context;
    std::string path;
    ActivityKind kind{ActivityKind::Modified};
    std::chrono::system_clock::time_point timestamp;
};

struct ContextActivity
{
    std::optional<std::chrono::system_clock::time_point> last_activity;
    std::optional<int64_t> seconds_ago;
    size_t recent_files{0}; ///< Events inside the window
};

class ActivityTracker
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param registry Valid-context set; events for other names are rejected.
     * @param window Trailing interval that counts as "active".
     * @param buffer_size Events kept per context.
     * @param clock Time source; defaults to system_clock::now.
     */
    ActivityTracker(const ContextRegistry &registry, std::chrono::seconds window,
                    size_t buffer_size = 100, Clock clock = {});

    /// @return false for an unknown context (nothing recorded).
    bool record(std::string_view context, std::string_view path, ActivityKind kind);

    /// Active context, or nullopt when no context had activity inside the window.
    std::optional<std::string> active_context() const;

    /// One entry per known context, in registry order.
    std::vector<std::pair<std::string, ContextActivity>> activity_summary() const;

    /// {ctx: {last_activity, seconds_ago, recent_files}} with nulls for no activity.
    nlohmann::json summary_json() const;

    /// Buffered events of @p context, oldest first.
    std::vector<ActivityEvent> recent_events(std::string_view context) const;

    std::chrono::seconds window() const noexcept { return m_window; }

  private:
    struct Entry
    {
        std::deque<ActivityEvent> events;
        std::optional<std::chrono::system_clock::time_point> last_seen;
    };

    const ContextRegistry &m_registry;
    std::chrono::seconds m_window;
    size_t m_buffer_size;
    Clock m_clock;

    mutable std::mutex m_mutex;
    std::map<std::string, Entry, std::less<>> m_entries;
};

} // namespace ctxhub::coord
