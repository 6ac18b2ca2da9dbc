#pragma once
/**
 * @file status_store.hpp
 * @brief Daemon status document and PID lock file.
 *
 * The status document is rewritten wholesale on every change (last writer
 * wins); readers tolerate absence and corruption. The PID lock is a plain-text
 * decimal process id.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/json_store.hpp"

namespace ctxhub::coord
{

enum class DaemonState
{
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

const char *to_string(DaemonState state) noexcept;
std::optional<DaemonState> parse_daemon_state(std::string_view s) noexcept;

struct DaemonStatus
{
    DaemonState state{DaemonState::Stopped};
    uint64_t pid{0};
    std::string started_at;
    std::string last_update;
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json to_json() const;
    /// Missing or mistyped fields fall back to their defaults.
    static DaemonStatus from_json(const nlohmann::json &j);
};

class StatusStore
{
  public:
    explicit StatusStore(std::filesystem::path status_file);

    const std::filesystem::path &path() const noexcept { return m_store.path(); }

    /** @brief Stamps last_update and replaces the document. */
    bool write(DaemonStatus status, std::error_code *err_code = nullptr) noexcept;

    /**
     * @brief Reads the last written status.
     * @return nullopt when absent, or when corrupt (err_code set, logged).
     */
    std::optional<DaemonStatus> read(std::error_code *err_code = nullptr) const noexcept;

  private:
    utils::JsonStore m_store;
};

class PidFile
{
  public:
    explicit PidFile(std::filesystem::path path);

    const std::filesystem::path &path() const noexcept { return m_path; }

    /// The recorded pid; nullopt when absent or unparsable.
    std::optional<uint64_t> read_pid() const noexcept;

    /// Atomically replaces the file with @p pid.
    bool write_pid(uint64_t pid, std::error_code *err_code = nullptr) noexcept;

    /// Removes the file; a missing file is not an error.
    bool remove(std::error_code *err_code = nullptr) noexcept;

  private:
    std::filesystem::path m_path;
};

} // namespace ctxhub::coord
