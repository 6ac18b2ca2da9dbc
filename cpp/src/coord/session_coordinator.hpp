#pragma once
/**
 * @file session_coordinator.hpp
 * @brief Front door for handoffs, active-context queries and session prompts.
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "context_registry.hpp"
#include "mailbox.hpp"
#include "utils/result.hpp"

namespace ctxhub::coord
{

enum class SessionError
{
    UnknownContext,
    ContextFileMissing,
    PromptWriteFailure,
    LaunchFailure
};

const char *to_string(SessionError e) noexcept;

struct SpawnResult
{
    std::string session_id;
    std::string context;
    std::optional<std::string> task;
    std::string context_file;
    std::string prompt_file;
    std::string command; ///< Empty when no editor is configured
    std::string spawned_at;
    bool success{false};

    nlohmann::json to_json() const;
};

class SessionCoordinator
{
  public:
    using ActiveContextSource = std::function<std::optional<std::string>()>;
    using ActivitySource = std::function<nlohmann::json()>;

    SessionCoordinator(const ContextRegistry &registry, Mailbox &mailbox,
                       std::filesystem::path project_root);

    /// Where active_context() and activity_summary() get their data.
    void set_activity_sources(ActiveContextSource active, ActivitySource summary);

    /// Rejects unknown endpoints before the Mailbox sees the request.
    utils::Result<Message, SendError> send(std::string_view from, std::string_view to,
                                           std::string_view type, std::string_view content,
                                           Priority priority = Priority::Normal,
                                           std::string_view subject = {});

    std::optional<std::string> active_context() const;
    nlohmann::json activity_summary() const;

    /**
     * @brief Resume text for @p context.
     * @details The registry's resume_prompt, else "Read @<context_path><file> first.",
     *          then the task line, then the live block (pending count, active flag).
     */
    utils::Result<std::string, SessionError>
    resume_text(std::string_view context, const std::optional<std::string> &task = {}) const;

    /// Writes resume_text() to prompt_file().
    utils::Result<std::filesystem::path, SessionError>
    write_prompt(std::string_view context, const std::optional<std::string> &task = {}) const;

    /**
     * @brief Prepares a session for @p context and launches @p editor_command if set.
     * @details Fails when the context document does not exist. The editor gets
     *          `<project_root> <context_file>` appended to its arguments and runs
     *          in its own session.
     */
    utils::Result<SpawnResult, SessionError> spawn(std::string_view context,
                                                   const std::optional<std::string> &task,
                                                   const std::string &editor_command) const;

    /// `<prefix><HHMM>` for the current local time.
    std::string next_session_id(std::string_view context) const;

    std::filesystem::path prompt_file() const { return m_project_root / ".ctxhub_prompt"; }

  private:
    const ContextRegistry &m_registry;
    Mailbox &m_mailbox;
    std::filesystem::path m_project_root;
    ActiveContextSource m_active_source;
    ActivitySource m_activity_source;
};

} // namespace ctxhub::coord
