/**
 * @file json_store.cpp
 * @brief Locked, atomic JSON document storage.
 */
#include "ctxhub_service.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ctxhub::utils
{
namespace fs = std::filesystem;

static std::atomic<bool> g_jsonstore_initialized{false};

namespace
{
constexpr int kRenameRetries = 5;
constexpr int kRenameDelayMs = 100;
constexpr int kJsonIndent = 2;
constexpr std::chrono::milliseconds kJsonStoreShutdownTimeoutMs{1000};

void set_errno_code(std::error_code *err_code, int errnum)
{
    if (err_code != nullptr)
    {
        *err_code = std::error_code(errnum, std::generic_category());
    }
}

void set_code(std::error_code *err_code, std::error_code value)
{
    if (err_code != nullptr)
    {
        *err_code = value;
    }
}

bool ensure_parent_dir(const fs::path &target, std::error_code *err_code)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
    {
        return true;
    }
    std::error_code create_ec;
    fs::create_directories(parent, create_ec);
    if (create_ec)
    {
        set_code(err_code, create_ec);
        LOGGER_ERROR("atomic_write: create_directories failed for {}: {}", parent.string(),
                     create_ec.message());
        return false;
    }
    return true;
}

bool reject_if_symlink(const fs::path &target, std::error_code *err_code)
{
    struct stat lstat_buf{};
    if (::lstat(target.c_str(), &lstat_buf) != 0 || !S_ISLNK(lstat_buf.st_mode))
    {
        return true;
    }
    set_code(err_code, std::make_error_code(std::errc::operation_not_permitted));
    LOGGER_ERROR("atomic_write: target '{}' is a symbolic link, refusing to write",
                 target.string());
    return false;
}

// Creates "<dir>/<name>.tmp.XXXXXX" with mode 0600.
std::optional<std::pair<std::string, int>> create_temp(const fs::path &target,
                                                       std::error_code *err_code)
{
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    const std::string tmpl = (parent / (target.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    const int file_fd = ::mkstemp(tmpl_buf.data());
    if (file_fd == -1)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: mkstemp failed for '{}'. Error: {}", tmpl_buf.data(),
                     std::strerror(errnum));
        return std::nullopt;
    }
    return std::pair{std::string(tmpl_buf.data()), file_fd};
}

// On failure the temp file is removed; on success it is closed and left for rename.
bool write_fsync_close(int file_fd, const std::string &tmp_path, std::string_view out,
                       const fs::path &target, std::error_code *err_code)
{
    int fd = file_fd;
    auto cleanup = basics::make_scope_guard(
        [&]()
        {
            if (fd != -1)
            {
                ::close(fd);
            }
            ::unlink(tmp_path.c_str());
        });

    size_t written = 0;
    while (written < out.size())
    {
        const ssize_t nwritten = ::write(fd, out.data() + written, out.size() - written);
        if (nwritten < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int errnum = errno;
            set_errno_code(err_code, errnum);
            LOGGER_ERROR("atomic_write: write failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }
        written += static_cast<size_t>(nwritten);
    }
    if (::fsync(fd) != 0)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: fsync(file) failed for '{}'. Error: {}", tmp_path,
                     std::strerror(errnum));
        return false;
    }
    // Keep the target's permissions; mkstemp creates 0600.
    struct stat stat_buf{};
    const mode_t mode = (::stat(target.c_str(), &stat_buf) == 0) ? stat_buf.st_mode : 0644;
    if (::fchmod(fd, mode & 07777) != 0)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: fchmod failed for '{}'. Error: {}", tmp_path,
                     std::strerror(errnum));
        return false;
    }
    const int close_rc = ::close(fd);
    fd = -1;
    if (close_rc != 0)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: close failed for '{}'. Error: {}", tmp_path,
                     std::strerror(errnum));
        return false;
    }
    cleanup.dismiss();
    return true;
}

bool atomic_rename(const std::string &tmp_path, const fs::path &target, std::error_code *err_code)
{
    int last_errnum = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (std::rename(tmp_path.c_str(), target.c_str()) == 0)
        {
            return true;
        }
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
        {
            break;
        }
        LOGGER_WARN("atomic_write: rename hit transient error {} for '{}', retrying...",
                    std::strerror(last_errnum), target.string());
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    ::unlink(tmp_path.c_str());
    set_errno_code(err_code, last_errnum);
    LOGGER_ERROR("atomic_write: rename failed for '{}'. Error: {}", target.string(),
                 std::strerror(last_errnum));
    return false;
}

// Makes the rename itself durable.
bool fsync_parent(const fs::path &target, std::error_code *err_code)
{
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    const int dfd = ::open(parent.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: open(dir) failed for fsync: '{}'. Error: {}",
                     parent.string(), std::strerror(errnum));
        return false;
    }
    bool success = true;
    if (::fsync(dfd) != 0)
    {
        const int errnum = errno;
        set_errno_code(err_code, errnum);
        LOGGER_ERROR("atomic_write: fsync(dir) failed for '{}'. Error: {}", parent.string(),
                     std::strerror(errnum));
        success = false;
    }
    ::close(dfd);
    return success;
}

} // namespace

JsonStore::JsonStore(std::filesystem::path path) : m_path(std::move(path))
{
    if (!lifecycle_initialized())
    {
        CTXHUB_PANIC("JsonStore created before its module was initialized via LifecycleManager. "
                     "Aborting.");
    }
}

bool JsonStore::exists() const noexcept
{
    std::error_code ec;
    return fs::exists(m_path, ec);
}

bool JsonStore::load_unlocked(nlohmann::json &out, const nlohmann::json &fallback,
                              std::error_code *err_code) const noexcept
{
    try
    {
        std::ifstream input_stream(m_path);
        if (!input_stream.is_open())
        {
            // A missing document is not an error; callers decide the default.
            out = fallback;
            set_code(err_code, {});
            return true;
        }
        out = nlohmann::json::parse(input_stream);
        set_code(err_code, {});
        return true;
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::illegal_byte_sequence));
        LOGGER_ERROR("JsonStore: cannot parse '{}': {}", m_path.string(), ex.what());
        return false;
    }
}

nlohmann::json JsonStore::read_or(const nlohmann::json &fallback,
                                  std::error_code *err_code) const noexcept
{
    FileLock file_lock(m_path, LockMode::Blocking);
    if (!file_lock.valid())
    {
        set_code(err_code, file_lock.error_code());
        LOGGER_ERROR("JsonStore: cannot lock '{}' for reading: {}", m_path.string(),
                     file_lock.error_code().message());
        return fallback;
    }
    nlohmann::json doc;
    if (!load_unlocked(doc, fallback, err_code))
    {
        return fallback;
    }
    return doc;
}

bool JsonStore::write(const nlohmann::json &snapshot, std::error_code *err_code) noexcept
{
    FileLock file_lock(m_path, LockMode::Blocking);
    if (!file_lock.valid())
    {
        set_code(err_code, file_lock.error_code());
        LOGGER_ERROR("JsonStore: cannot lock '{}' for writing: {}", m_path.string(),
                     file_lock.error_code().message());
        return false;
    }
    std::error_code local_ec;
    atomic_write_json(m_path, snapshot, &local_ec);
    set_code(err_code, local_ec);
    return !local_ec;
}

bool JsonStore::with_json_write(const nlohmann::json &fallback,
                                const std::function<bool(nlohmann::json &)> &mutator,
                                std::error_code *err_code) noexcept
{
    FileLock file_lock(m_path, LockMode::Blocking);
    if (!file_lock.valid())
    {
        set_code(err_code, file_lock.error_code());
        LOGGER_ERROR("JsonStore: cannot lock '{}' for update: {}", m_path.string(),
                     file_lock.error_code().message());
        return false;
    }

    nlohmann::json doc;
    if (!load_unlocked(doc, fallback, err_code))
    {
        return false;
    }

    try
    {
        if (!mutator(doc))
        {
            set_code(err_code, {});
            return false;
        }
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::invalid_argument));
        LOGGER_ERROR("JsonStore: update of '{}' aborted: {}", m_path.string(), ex.what());
        return false;
    }

    std::error_code local_ec;
    atomic_write_json(m_path, doc, &local_ec);
    set_code(err_code, local_ec);
    return !local_ec;
}

void JsonStore::atomic_write_text(const std::filesystem::path &target, std::string_view contents,
                                  std::error_code *err_code) noexcept
{
    set_code(err_code, {});
    try
    {
        if (!ensure_parent_dir(target, err_code) || !reject_if_symlink(target, err_code))
        {
            return;
        }
        auto temp = create_temp(target, err_code);
        if (!temp.has_value())
        {
            return;
        }
        if (!write_fsync_close(temp->second, temp->first, contents, target, err_code))
        {
            return;
        }
        if (!atomic_rename(temp->first, target, err_code))
        {
            return;
        }
        fsync_parent(target, err_code);
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("atomic_write: exception: {}", ex.what());
    }
}

void JsonStore::atomic_write_json(const std::filesystem::path &target,
                                  const nlohmann::json &json_snapshot,
                                  std::error_code *err_code) noexcept
{
    std::string out;
    try
    {
        out = json_snapshot.dump(kJsonIndent);
    }
    catch (const std::exception &ex)
    {
        set_code(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("atomic_write_json: cannot serialize for '{}': {}", target.string(),
                     ex.what());
        return;
    }
    atomic_write_text(target, out, err_code);
}

// Lifecycle Integration
bool JsonStore::lifecycle_initialized() noexcept
{
    return g_jsonstore_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_jsonstore_startup(const char *arg)
{
    (void)arg;
    g_jsonstore_initialized.store(true, std::memory_order_release);
}
void do_jsonstore_shutdown(const char *arg)
{
    (void)arg;
    g_jsonstore_initialized.store(false, std::memory_order_release);
}
} // namespace

ModuleDef JsonStore::GetLifecycleModule()
{
    ModuleDef module("ctxhub::utils::JsonStore");
    module.add_dependency("ctxhub::utils::FileLock");
    module.add_dependency("ctxhub::utils::Logger");
    module.set_startup(&do_jsonstore_startup);
    module.set_shutdown(&do_jsonstore_shutdown, kJsonStoreShutdownTimeoutMs);
    return module;
}

} // namespace ctxhub::utils
