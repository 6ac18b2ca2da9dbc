#pragma once
/**
 * @file mailbox.hpp
 * @brief Policy-gated handoff messaging between contexts.
 *
 * The Mailbox validates every send against the ContextRegistry and its
 * HandoffPolicy before anything is written; a rejected send leaves the log
 * untouched. Storage is delegated to a MessageStore.
 *
 * @code
 *   FileMessageStore store(data_dir / ".ctxhub_messages.json");
 *   Mailbox mailbox(registry, store);
 *   auto r = mailbox.send("dev", "dash", "new_feature_available", "Preset editor is live");
 *   if (r.is_error())
 *       fmt::print("{}\n", r.error_message());
 * @endcode
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "context_registry.hpp"
#include "message.hpp"
#include "message_store.hpp"
#include "utils/result.hpp"

namespace ctxhub::coord
{

enum class SendError
{
    UnknownContext,
    PolicyViolation,
    StorageFailure
};

const char *to_string(SendError e) noexcept;

/**
 * @brief The routing decision, independent of storage.
 *
 * A send is allowed when the sender is the coordinator, the recipient is the
 * coordinator, or the type is listed in the rule table for (from, to).
 * Broadcasts ("all") are reserved to the coordinator.
 */
class HandoffPolicy
{
  public:
    explicit HandoffPolicy(const ContextRegistry &registry) : m_registry(registry) {}

    utils::Result<utils::Unit, SendError> check(std::string_view from, std::string_view to,
                                                std::string_view type) const;

  private:
    const ContextRegistry &m_registry;
};

class Mailbox
{
  public:
    Mailbox(const ContextRegistry &registry, MessageStore &store);

    /**
     * @brief Validates and stores one message.
     * @param subject Empty selects "[<type>] from <from>".
     */
    utils::Result<Message, SendError> send(std::string_view from, std::string_view to,
                                           std::string_view type, std::string_view content,
                                           Priority priority = Priority::Normal,
                                           std::string_view subject = {});

    /// Unknown contexts yield an empty list (logged).
    std::vector<Message> inbox(std::string_view context, bool unread_only = true,
                               std::error_code *err_code = nullptr) const;

    /// Idempotent; false when nothing changed.
    bool mark_read(uint64_t id, std::error_code *err_code = nullptr);

    size_t pending_count(std::string_view context) const;

    const HandoffPolicy &policy() const noexcept { return m_policy; }

  private:
    const ContextRegistry &m_registry;
    MessageStore &m_store;
    HandoffPolicy m_policy;
};

} // namespace ctxhub::coord
