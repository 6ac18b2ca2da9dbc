#pragma once
/**
 * @file file_lock.hpp
 * @brief Exclusive advisory lock on a sidecar `<path>.lock` file.
 *
 * Threads of one process queue on an in-process table keyed by the lock file,
 * since flock(2) alone does not order them reliably; other processes are held
 * off by an exclusive flock on the sidecar. The lock lives as long as the
 * object. Construction never throws: check valid() and error_code().
 *
 * Guards every read-modify-write of the message log, every JsonStore write
 * and the daemon's pid file check-and-claim.
 */

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include "ctxhub_base.hpp"

namespace ctxhub::utils
{

enum class LockMode
{
    Blocking,
    NonBlocking
};

class CTXHUB_UTILS_EXPORT FileLock
{
  public:
    FileLock(const std::filesystem::path &resource, LockMode mode) noexcept;
    /** @brief Waits at most @p timeout; fails with errc::timed_out. */
    FileLock(const std::filesystem::path &resource, std::chrono::milliseconds timeout) noexcept;
    ~FileLock();

    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    /** @brief Like the constructor, but yields std::nullopt instead of an invalid lock. */
    [[nodiscard]] static std::optional<FileLock> try_lock(const std::filesystem::path &resource,
                                                          LockMode mode) noexcept;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;

    /** @brief `<absolute resource>.lock`; empty when @p resource is empty or has control chars. */
    static std::filesystem::path lock_path_for(const std::filesystem::path &resource) noexcept;

    /** @brief Lifecycle module "ctxhub::utils::FileLock"; no dependencies. */
    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

  private:
    struct Impl;
    explicit FileLock(std::unique_ptr<Impl> impl) noexcept;
    static std::unique_ptr<Impl> make_impl(const std::filesystem::path &resource) noexcept;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ctxhub::utils
