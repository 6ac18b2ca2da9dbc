/**
 * @file status_store.cpp
 * @brief DaemonStatus serialization, StatusStore and PidFile.
 */
#include "status_store.hpp"

#include "ctxhub_service.hpp"

#include <charconv>
#include <fstream>
#include <string>

namespace ctxhub::coord
{
namespace fs = std::filesystem;

namespace
{
void set_code(std::error_code *err_code, std::error_code value)
{
    if (err_code != nullptr)
    {
        *err_code = value;
    }
}
} // namespace

const char *to_string(DaemonState state) noexcept
{
    switch (state)
    {
    case DaemonState::Stopped:
        return "stopped";
    case DaemonState::Starting:
        return "starting";
    case DaemonState::Running:
        return "running";
    case DaemonState::Stopping:
        return "stopping";
    case DaemonState::Error:
        return "error";
    }
    return "unknown";
}

std::optional<DaemonState> parse_daemon_state(std::string_view s) noexcept
{
    if (s == "stopped")
        return DaemonState::Stopped;
    if (s == "starting")
        return DaemonState::Starting;
    if (s == "running")
        return DaemonState::Running;
    if (s == "stopping")
        return DaemonState::Stopping;
    if (s == "error")
        return DaemonState::Error;
    return std::nullopt;
}

nlohmann::json DaemonStatus::to_json() const
{
    return {{"state", to_string(state)},
            {"pid", pid},
            {"started_at", started_at},
            {"last_update", last_update},
            {"data", data.is_object() ? data : nlohmann::json::object()}};
}

DaemonStatus DaemonStatus::from_json(const nlohmann::json &j)
{
    DaemonStatus st;
    if (!j.is_object())
        return st;

    if (j.contains("state") && j["state"].is_string())
        st.state = parse_daemon_state(j["state"].get<std::string>()).value_or(DaemonState::Error);
    if (j.contains("pid") && j["pid"].is_number_unsigned())
        st.pid = j["pid"].get<uint64_t>();
    if (j.contains("started_at") && j["started_at"].is_string())
        st.started_at = j["started_at"].get<std::string>();
    if (j.contains("last_update") && j["last_update"].is_string())
        st.last_update = j["last_update"].get<std::string>();
    if (j.contains("data") && j["data"].is_object())
        st.data = j["data"];
    return st;
}

// ============================================================================
// StatusStore
// ============================================================================

StatusStore::StatusStore(std::filesystem::path status_file) : m_store(std::move(status_file)) {}

bool StatusStore::write(DaemonStatus status, std::error_code *err_code) noexcept
{
    try
    {
        status.last_update = format_tools::iso_timestamp(std::chrono::system_clock::now());
        return m_store.write(status.to_json(), err_code);
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("[status] cannot serialize status for '{}': {}", path().string(), ex.what());
        return false;
    }
}

std::optional<DaemonStatus> StatusStore::read(std::error_code *err_code) const noexcept
{
    std::error_code ec;
    nlohmann::json doc = m_store.read_or(nlohmann::json(nullptr), &ec);
    set_code(err_code, ec);
    if (ec || doc.is_null())
        return std::nullopt;
    if (!doc.is_object())
    {
        set_code(err_code, std::make_error_code(std::errc::illegal_byte_sequence));
        LOGGER_ERROR("[status] '{}' is not a JSON object; ignoring it", path().string());
        return std::nullopt;
    }
    try
    {
        return DaemonStatus::from_json(doc);
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::illegal_byte_sequence));
        LOGGER_ERROR("[status] cannot decode '{}': {}", path().string(), ex.what());
        return std::nullopt;
    }
}

// ============================================================================
// PidFile
// ============================================================================

PidFile::PidFile(std::filesystem::path path) : m_path(std::move(path)) {}

std::optional<uint64_t> PidFile::read_pid() const noexcept
{
    try
    {
        std::ifstream in(m_path);
        if (!in.is_open())
            return std::nullopt;
        std::string text;
        std::getline(in, text);
        text = std::string(format_tools::trim_whitespace(text));
        uint64_t pid = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
        if (ec != std::errc{} || ptr != text.data() + text.size() || pid == 0)
        {
            LOGGER_WARN("[status] PID file '{}' holds '{}', not a process id", m_path.string(),
                        text);
            return std::nullopt;
        }
        return pid;
    }
    catch (const std::exception &ex)
    {
        LOGGER_ERROR("[status] cannot read PID file '{}': {}", m_path.string(), ex.what());
        return std::nullopt;
    }
}

bool PidFile::write_pid(uint64_t pid, std::error_code *err_code) noexcept
{
    std::error_code ec;
    utils::JsonStore::atomic_write_text(m_path, std::to_string(pid) + "\n", &ec);
    set_code(err_code, ec);
    if (ec)
    {
        LOGGER_ERROR("[status] cannot write PID file '{}': {}", m_path.string(), ec.message());
        return false;
    }
    return true;
}

bool PidFile::remove(std::error_code *err_code) noexcept
{
    std::error_code ec;
    fs::remove(m_path, ec);
    set_code(err_code, ec);
    if (ec)
    {
        LOGGER_ERROR("[status] cannot remove PID file '{}': {}", m_path.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace ctxhub::coord
