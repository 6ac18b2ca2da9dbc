#pragma once

/**
 * @file json_store.hpp
 * @brief Process-safe JSON documents on disk.
 *
 * A JsonStore is bound to one file path. Every read and write holds a
 * `ctxhub::utils::FileLock` on the file, and every write goes through
 * atomic_write_json(): temp file in the same directory, fsync, rename over the
 * target, fsync of the directory. Readers therefore see either the old or the
 * new document, never a torn one.
 *
 * Read-modify-write cycles (the message log, the status file) use
 * with_json_write(), which keeps the lock across the whole cycle:
 *
 * @code
 *   JsonStore store(data_dir / ".ctxhub_messages.json");
 *   std::error_code ec;
 *   store.with_json_write(nlohmann::json::array(),
 *                         [&](nlohmann::json &doc) { doc.push_back(msg); return true; }, &ec);
 * @endcode
 */

#include <filesystem>
#include <functional>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "ctxhub_base.hpp"

namespace ctxhub::utils
{

class CTXHUB_UTILS_EXPORT JsonStore
{
  public:
    explicit JsonStore(std::filesystem::path path);

    const std::filesystem::path &path() const noexcept { return m_path; }
    [[nodiscard]] bool exists() const noexcept;

    /**
     * @brief Reads the document.
     * @return The parsed document; @p fallback when the file does not exist (no error)
     *         or cannot be parsed (error set, logged at ERROR).
     */
    nlohmann::json read_or(const nlohmann::json &fallback,
                           std::error_code *err_code = nullptr) const noexcept;

    /** @brief Replaces the document atomically. */
    bool write(const nlohmann::json &snapshot, std::error_code *err_code = nullptr) noexcept;

    /**
     * @brief Locked read-modify-write.
     *
     * Loads the document (or @p fallback when absent), hands it to @p mutator and
     * commits when the mutator returns true. An unparsable file is an error and
     * the mutator is not called, so corrupt data is never silently replaced.
     * An exception from the mutator aborts the cycle without writing.
     */
    bool with_json_write(const nlohmann::json &fallback,
                         const std::function<bool(nlohmann::json &)> &mutator,
                         std::error_code *err_code = nullptr) noexcept;

    /**
     * @brief Atomically writes @p json_snapshot (indent 2) to @p target.
     * @details Refuses to replace a symbolic link (errc::operation_not_permitted).
     *          The caller is responsible for cross-process locking.
     */
    static void atomic_write_json(const std::filesystem::path &target,
                                  const nlohmann::json &json_snapshot,
                                  std::error_code *err_code) noexcept;

    /// Same temp-fsync-rename sequence for arbitrary text, such as a pid file.
    static void atomic_write_text(const std::filesystem::path &target, std::string_view contents,
                                  std::error_code *err_code) noexcept;

    /** @brief Lifecycle module "ctxhub::utils::JsonStore"; needs FileLock and Logger. */
    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

  private:
    bool load_unlocked(nlohmann::json &out, const nlohmann::json &fallback,
                       std::error_code *err_code) const noexcept;

    std::filesystem::path m_path;
};

} // namespace ctxhub::utils
