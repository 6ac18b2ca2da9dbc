#pragma once
/**
 * @file message_store.hpp
 * @brief Storage capability behind the Mailbox, with the JSON-file default.
 *
 * A MessageStore persists messages and answers inbox queries; it performs no
 * policy checks. FileMessageStore keeps the whole log as one JSON array and
 * runs every mutation as a locked read-modify-write through JsonStore, so a
 * CLI invocation and the daemon may write the same log concurrently.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

#include "message.hpp"
#include "utils/json_store.hpp"

namespace ctxhub::coord
{

class MessageStore
{
  public:
    virtual ~MessageStore() = default;

    /**
     * @brief Persists @p draft under a new id (max existing id + 1).
     * @return The stored message; nullopt on storage failure.
     */
    virtual std::optional<Message> append(Message draft, std::error_code *err_code = nullptr) = 0;

    /// Every message, in log order.
    virtual std::vector<Message> all(std::error_code *err_code = nullptr) const = 0;

    /// Messages addressed to @p context or "all", in inbox order.
    virtual std::vector<Message> inbox(std::string_view context, bool unread_only,
                                       std::error_code *err_code = nullptr) const = 0;

    /**
     * @brief Sets read_at on message @p id if it is unread.
     * @return true when the message changed; false for unknown or already-read ids.
     */
    virtual bool mark_read(uint64_t id, std::error_code *err_code = nullptr) = 0;
};

class FileMessageStore final : public MessageStore
{
  public:
    /**
     * @param log_file JSON array file.
     * @param max_messages Retention bound applied after each append; 0 disables it.
     */
    explicit FileMessageStore(std::filesystem::path log_file, size_t max_messages = 500);

    std::optional<Message> append(Message draft, std::error_code *err_code = nullptr) override;
    std::vector<Message> all(std::error_code *err_code = nullptr) const override;
    std::vector<Message> inbox(std::string_view context, bool unread_only,
                               std::error_code *err_code = nullptr) const override;
    bool mark_read(uint64_t id, std::error_code *err_code = nullptr) override;

    const std::filesystem::path &path() const noexcept { return m_store.path(); }

  private:
    /// Moves an unparsable log aside so the next write starts a fresh one.
    /// Ids found in it raise m_id_floor so they are never reissued.
    bool quarantine_corrupt_log();

    utils::JsonStore m_store;
    size_t m_max_messages;
    uint64_t m_id_floor = 0;
};

/**
 * @brief Drops messages until at most @p max_messages remain.
 * @details Oldest read messages go first, then the oldest unread ones. "Oldest"
 *          is the lowest id.
 * @return Number of messages removed.
 */
size_t apply_retention(nlohmann::json &log, size_t max_messages);

} // namespace ctxhub::coord
