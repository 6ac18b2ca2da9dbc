/**
 * @file session_coordinator.cpp
 * @brief SessionCoordinator: validated sends, resume prompts and session spawn.
 */
#include "session_coordinator.hpp"

#include "ctxhub_service.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ctxhub::coord
{
namespace fs = std::filesystem;
using utils::Result;

namespace
{
std::vector<std::string> split_words(const std::string &s)
{
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string w;
    while (in >> w)
        out.push_back(w);
    return out;
}

// Double fork so the editor is never our child: the intermediate calls setsid,
// forks the editor and exits, and is reaped here. Exec failure comes back through
// a close-on-exec pipe.
bool launch_in_new_session(const std::vector<std::string> &args, std::error_code &ec)
{
    std::vector<std::string> storage = args;
    std::vector<char *> argv;
    for (auto &a : storage)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    int report[2];
    if (::pipe2(report, O_CLOEXEC) != 0)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    const pid_t first = ::fork();
    if (first < 0)
    {
        ec = std::error_code(errno, std::generic_category());
        ::close(report[0]);
        ::close(report[1]);
        return false;
    }
    if (first == 0)
    {
        ::close(report[0]);
        if (::setsid() < 0)
            ::_exit(1);
        const pid_t second = ::fork();
        if (second < 0)
            ::_exit(1);
        if (second > 0)
            ::_exit(0);

        ::execvp(argv[0], argv.data());
        const int exec_errno = errno;
        const ssize_t n = ::write(report[1], &exec_errno, sizeof(exec_errno));
        (void)n;
        ::_exit(127);
    }

    ::close(report[1]);
    int wstatus = 0;
    while (::waitpid(first, &wstatus, 0) < 0 && errno == EINTR)
    {
    }
    if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0)
    {
        ::close(report[0]);
        ec = std::make_error_code(std::errc::no_child_process);
        return false;
    }

    int exec_errno = 0;
    ssize_t n = 0;
    do
    {
        n = ::read(report[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(report[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        ec = std::error_code(exec_errno, std::generic_category());
        return false;
    }
    ec = {};
    return true;
}
} // namespace

const char *to_string(SessionError e) noexcept
{
    switch (e)
    {
    case SessionError::UnknownContext:
        return "unknown_context";
    case SessionError::ContextFileMissing:
        return "context_file_missing";
    case SessionError::PromptWriteFailure:
        return "prompt_write_failure";
    case SessionError::LaunchFailure:
        return "launch_failure";
    }
    return "unknown";
}

nlohmann::json SpawnResult::to_json() const
{
    return {{"session_id", session_id},
            {"context", context},
            {"task", task ? nlohmann::json(*task) : nlohmann::json(nullptr)},
            {"context_file", context_file},
            {"prompt_file", prompt_file},
            {"command", command},
            {"spawned_at", spawned_at},
            {"success", success}};
}

SessionCoordinator::SessionCoordinator(const ContextRegistry &registry, Mailbox &mailbox,
                                       std::filesystem::path project_root)
    : m_registry(registry), m_mailbox(mailbox), m_project_root(std::move(project_root))
{
}

void SessionCoordinator::set_activity_sources(ActiveContextSource active, ActivitySource summary)
{
    m_active_source = std::move(active);
    m_activity_source = std::move(summary);
}

Result<Message, SendError> SessionCoordinator::send(std::string_view from, std::string_view to,
                                                    std::string_view type,
                                                    std::string_view content, Priority priority,
                                                    std::string_view subject)
{
    if (!m_registry.contains(from))
        return Result<Message, SendError>::error(SendError::UnknownContext,
                                                 fmt::format("Unknown context: {}", from));
    if (to != "all" && !m_registry.contains(to))
        return Result<Message, SendError>::error(SendError::UnknownContext,
                                                 fmt::format("Unknown context: {}", to));
    return m_mailbox.send(from, to, type, content, priority, subject);
}

std::optional<std::string> SessionCoordinator::active_context() const
{
    return m_active_source ? m_active_source() : std::nullopt;
}

nlohmann::json SessionCoordinator::activity_summary() const
{
    return m_activity_source ? m_activity_source() : nlohmann::json::object();
}

Result<std::string, SessionError>
SessionCoordinator::resume_text(std::string_view context,
                                const std::optional<std::string> &task) const
{
    const ContextInfo *ci = m_registry.find(context);
    if (ci == nullptr)
        return Result<std::string, SessionError>::error(
            SessionError::UnknownContext, fmt::format("Unknown context: {}", context));

    std::string text = ci->resume_prompt
                           ? *ci->resume_prompt
                           : fmt::format("Read @{}{} first.", m_registry.context_path(), ci->file);
    if (task && !task->empty())
        text += fmt::format("\n\nCurrent task: {}", *task);

    const auto active = active_context();
    text += fmt::format("\n\nPending messages: {}\nCurrently active: {}",
                        m_mailbox.pending_count(context),
                        (active && *active == context) ? "yes" : "no");
    return Result<std::string, SessionError>::ok(std::move(text));
}

Result<fs::path, SessionError>
SessionCoordinator::write_prompt(std::string_view context,
                                 const std::optional<std::string> &task) const
{
    auto text = resume_text(context, task);
    if (text.is_error())
        return Result<fs::path, SessionError>::error(text.error(), text.error_message());

    const fs::path target = prompt_file();
    std::ofstream out(target, std::ios::trunc);
    if (!out.is_open() || !(out << text.content()) || !out.flush())
    {
        const int errnum = errno;
        LOGGER_ERROR("[session] cannot write prompt file '{}': {}", target.string(),
                     std::strerror(errnum));
        return Result<fs::path, SessionError>::error(
            SessionError::PromptWriteFailure,
            fmt::format("Cannot write {}: {}", target.string(), std::strerror(errnum)), errnum);
    }
    LOGGER_INFO("[session] prompt for '{}' written to '{}'", context, target.string());
    return Result<fs::path, SessionError>::ok(target);
}

std::string SessionCoordinator::next_session_id(std::string_view context) const
{
    const ContextInfo *ci = m_registry.find(context);
    const std::string prefix = (ci != nullptr && !ci->prefix.empty()) ? ci->prefix : "S";
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return fmt::format("{}{:02}{:02}", prefix, local.tm_hour, local.tm_min);
}

Result<SpawnResult, SessionError>
SessionCoordinator::spawn(std::string_view context, const std::optional<std::string> &task,
                          const std::string &editor_command) const
{
    if (!m_registry.contains(context))
        return Result<SpawnResult, SessionError>::error(
            SessionError::UnknownContext, fmt::format("Unknown context: {}", context));

    const fs::path context_file = m_registry.context_file(m_project_root, context);
    std::error_code ec;
    if (!fs::exists(context_file, ec))
        return Result<SpawnResult, SessionError>::error(
            SessionError::ContextFileMissing,
            fmt::format("Context file not found: {}", context_file.string()));

    auto prompt = write_prompt(context, task);
    if (prompt.is_error())
        return Result<SpawnResult, SessionError>::error(prompt.error(), prompt.error_message(),
                                                        prompt.error_code());

    SpawnResult result;
    result.session_id = next_session_id(context);
    result.context = std::string(context);
    result.task = task;
    result.context_file = context_file.string();
    result.prompt_file = prompt.content().string();
    result.spawned_at = format_tools::iso_timestamp(std::chrono::system_clock::now());

    std::vector<std::string> cmd = split_words(editor_command);
    if (cmd.empty())
    {
        result.success = true;
        LOGGER_INFO("[session] {} session {} prepared (no editor configured)", context,
                    result.session_id);
        return Result<SpawnResult, SessionError>::ok(std::move(result));
    }

    cmd.push_back(m_project_root.string());
    cmd.push_back(context_file.string());
    for (size_t i = 0; i < cmd.size(); ++i)
        result.command += (i == 0 ? "" : " ") + cmd[i];

    std::error_code launch_ec;
    if (!launch_in_new_session(cmd, launch_ec))
    {
        LOGGER_ERROR("[session] cannot launch '{}': {}", result.command, launch_ec.message());
        return Result<SpawnResult, SessionError>::error(
            SessionError::LaunchFailure,
            fmt::format("Cannot launch '{}': {}", result.command, launch_ec.message()),
            launch_ec.value());
    }
    result.success = true;
    LOGGER_INFO("[session] spawned {} session {}", context, result.session_id);
    return Result<SpawnResult, SessionError>::ok(std::move(result));
}

} // namespace ctxhub::coord
