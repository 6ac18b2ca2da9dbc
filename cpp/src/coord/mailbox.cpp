/**
 * @file mailbox.cpp
 * @brief HandoffPolicy and Mailbox.
 */
#include "mailbox.hpp"

#include "ctxhub_service.hpp"

#include <fmt/ranges.h>

namespace ctxhub::coord
{

using utils::Result;
using utils::Unit;

const char *to_string(SendError e) noexcept
{
    switch (e)
    {
    case SendError::UnknownContext:
        return "unknown_context";
    case SendError::PolicyViolation:
        return "policy_violation";
    case SendError::StorageFailure:
        return "storage_failure";
    }
    return "unknown";
}

Result<Unit, SendError> HandoffPolicy::check(std::string_view from, std::string_view to,
                                             std::string_view type) const
{
    if (!m_registry.contains(from))
        return Result<Unit, SendError>::error(SendError::UnknownContext,
                                              fmt::format("Unknown context: {}", from));
    if (to == "all")
    {
        if (m_registry.is_coordinator(from))
            return Result<Unit, SendError>::ok(Unit{});
        return Result<Unit, SendError>::error(
            SendError::PolicyViolation,
            fmt::format("{} cannot broadcast; only the coordinator may send to all", from));
    }
    if (!m_registry.contains(to))
        return Result<Unit, SendError>::error(SendError::UnknownContext,
                                              fmt::format("Unknown context: {}", to));

    if (m_registry.is_coordinator(from) || m_registry.is_coordinator(to) ||
        m_registry.rule_allows(from, to, type))
    {
        return Result<Unit, SendError>::ok(Unit{});
    }

    const auto allowed = m_registry.allowed_types(from, to);
    return Result<Unit, SendError>::error(
        SendError::PolicyViolation,
        fmt::format("{} cannot send '{}' to {}. Allowed: [{}]", from, type, to,
                    fmt::join(allowed, ", ")));
}

Mailbox::Mailbox(const ContextRegistry &registry, MessageStore &store)
    : m_registry(registry), m_store(store), m_policy(registry)
{
}

Result<Message, SendError> Mailbox::send(std::string_view from, std::string_view to,
                                         std::string_view type, std::string_view content,
                                         Priority priority, std::string_view subject)
{
    auto verdict = m_policy.check(from, to, type);
    if (verdict.is_error())
    {
        LOGGER_INFO("[mailbox] rejected {} -> {} ({}): {}", from, to, type,
                    verdict.error_message());
        return Result<Message, SendError>::error(verdict.error(), verdict.error_message());
    }

    Message draft;
    draft.from = std::string(from);
    draft.to = std::string(to);
    draft.type = std::string(type);
    draft.subject = subject.empty() ? fmt::format("[{}] from {}", type, from)
                                    : std::string(subject);
    draft.content = std::string(content);
    draft.priority = priority;

    std::error_code ec;
    auto stored = m_store.append(std::move(draft), &ec);
    if (!stored)
    {
        return Result<Message, SendError>::error(
            SendError::StorageFailure, fmt::format("Cannot store message: {}", ec.message()),
            ec.value());
    }

    LOGGER_INFO("[mailbox] #{} {} -> {} [{}] ({})", stored->id, stored->from, stored->to,
                stored->type, to_string(stored->priority));
    return Result<Message, SendError>::ok(std::move(*stored));
}

std::vector<Message> Mailbox::inbox(std::string_view context, bool unread_only,
                                    std::error_code *err_code) const
{
    if (!m_registry.contains(context))
    {
        LOGGER_WARN("[mailbox] inbox requested for unknown context '{}'", context);
        if (err_code != nullptr)
            *err_code = std::make_error_code(std::errc::invalid_argument);
        return {};
    }
    return m_store.inbox(context, unread_only, err_code);
}

bool Mailbox::mark_read(uint64_t id, std::error_code *err_code)
{
    return m_store.mark_read(id, err_code);
}

size_t Mailbox::pending_count(std::string_view context) const
{
    return inbox(context, true).size();
}

} // namespace ctxhub::coord
