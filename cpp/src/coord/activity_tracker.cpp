/**
 * @file activity_tracker.cpp
 * @brief ActivityTracker implementation.
 */
#include "activity_tracker.hpp"

#include "ctxhub_service.hpp"

namespace ctxhub::coord
{

const char *to_string(ActivityKind kind) noexcept
{
    switch (kind)
    {
    case ActivityKind::Created:
        return "created";
    case ActivityKind::Modified:
        return "modified";
    case ActivityKind::Deleted:
        return "deleted";
    }
    return "modified";
}

ActivityTracker::ActivityTracker(const ContextRegistry &registry, std::chrono::seconds window,
                                 size_t buffer_size, Clock clock)
    : m_registry(registry), m_window(window), m_buffer_size(buffer_size == 0 ? 1 : buffer_size),
      m_clock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
    for (const auto &id : m_registry.ids())
        m_entries.emplace(id, Entry{});
}

bool ActivityTracker::record(std::string_view context, std::string_view path, ActivityKind kind)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(context);
    if (it == m_entries.end())
    {
        LOGGER_WARN("[activity] event for unknown context '{}' ignored", context);
        return false;
    }

    const auto now = m_clock();
    Entry &entry = it->second;
    entry.events.push_back(ActivityEvent{std::string(context), std::string(path), kind, now});
    while (entry.events.size() > m_buffer_size)
        entry.events.pop_front();
    entry.last_seen = now;

    LOGGER_DEBUG("[activity] {} {} ({})", context, path, to_string(kind));
    return true;
}

std::optional<std::string> ActivityTracker::active_context() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();

    // m_entries iterates in lexical order, so the strict '>' keeps the smallest id on ties.
    const std::string *best = nullptr;
    std::chrono::system_clock::time_point best_seen{};
    for (const auto &[id, entry] : m_entries)
    {
        if (!entry.last_seen)
            continue;
        if (now - *entry.last_seen >= m_window)
            continue;
        if (best == nullptr || *entry.last_seen > best_seen)
        {
            best = &id;
            best_seen = *entry.last_seen;
        }
    }
    if (best == nullptr)
        return std::nullopt;
    return *best;
}

std::vector<std::pair<std::string, ContextActivity>> ActivityTracker::activity_summary() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = m_clock();

    std::vector<std::pair<std::string, ContextActivity>> out;
    for (const auto &id : m_registry.ids())
    {
        ContextActivity act;
        auto it = m_entries.find(id);
        if (it != m_entries.end() && it->second.last_seen)
        {
            act.last_activity = it->second.last_seen;
            act.seconds_ago =
                std::chrono::duration_cast<std::chrono::seconds>(now - *it->second.last_seen)
                    .count();
            for (const auto &ev : it->second.events)
            {
                if (now - ev.timestamp < m_window)
                    ++act.recent_files;
            }
        }
        out.emplace_back(id, act);
    }
    return out;
}

nlohmann::json ActivityTracker::summary_json() const
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[id, act] : activity_summary())
    {
        nlohmann::json e;
        e["last_activity"] = act.last_activity
                                 ? nlohmann::json(format_tools::iso_timestamp(*act.last_activity))
                                 : nlohmann::json(nullptr);
        e["seconds_ago"] = act.seconds_ago ? nlohmann::json(*act.seconds_ago)
                                           : nlohmann::json(nullptr);
        e["recent_files"] = act.recent_files;
        j[id] = std::move(e);
    }
    return j;
}

std::vector<ActivityEvent> ActivityTracker::recent_events(std::string_view context) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(context);
    if (it == m_entries.end())
        return {};
    return {it->second.events.begin(), it->second.events.end()};
}

} // namespace ctxhub::coord
