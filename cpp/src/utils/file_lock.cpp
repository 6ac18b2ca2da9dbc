// file_lock.cpp
#include "ctxhub_base.hpp"

#include "utils/file_lock.hpp"
#include "utils/lifecycle.hpp"

#include <condition_variable>
#include <mutex>
#include <new>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace ctxhub::utils
{

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace
{

std::atomic<bool> g_filelock_initialized{false};

constexpr auto kFlockRetryInterval = std::chrono::milliseconds(20);

// One slot per lock file that some thread of this process holds or waits for.
struct Slot
{
    bool held = false;
    int waiters = 0;
    std::condition_variable released;
};

std::mutex g_table_mutex;
std::unordered_map<std::string, std::shared_ptr<Slot>> g_table;

std::error_code errno_code(int err)
{
    return {err, std::generic_category()};
}

} // namespace

struct FileLock::Impl
{
    fs::path lock_path;
    std::shared_ptr<Slot> slot;
    int fd = -1;
    std::error_code ec;

    ~Impl() { release(); }

    bool acquire(LockMode mode, std::optional<Clock::time_point> deadline);
    bool enter_slot(LockMode mode, std::optional<Clock::time_point> deadline);
    void leave_slot();
    bool take_flock(LockMode mode, std::optional<Clock::time_point> deadline);
    void release();
};

bool FileLock::Impl::enter_slot(LockMode mode, std::optional<Clock::time_point> deadline)
{
    std::unique_lock<std::mutex> lock(g_table_mutex);
    auto &entry = g_table[lock_path.string()];
    if (!entry)
        entry = std::make_shared<Slot>();
    slot = entry;

    if (slot->held)
    {
        if (mode == LockMode::NonBlocking)
        {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            slot.reset();
            return false;
        }
        ++slot->waiters;
        auto not_waiting = basics::make_scope_guard([this] { --slot->waiters; });
        const auto is_free = [this] { return !slot->held; };
        if (deadline)
        {
            if (!slot->released.wait_until(lock, *deadline, is_free))
            {
                ec = std::make_error_code(std::errc::timed_out);
                not_waiting.invoke();
                if (slot->waiters == 0 && !slot->held)
                    g_table.erase(lock_path.string());
                slot.reset();
                return false;
            }
        }
        else
        {
            slot->released.wait(lock, is_free);
        }
    }
    slot->held = true;
    return true;
}

void FileLock::Impl::leave_slot()
{
    if (!slot)
        return;
    std::lock_guard<std::mutex> lock(g_table_mutex);
    slot->held = false;
    if (slot->waiters > 0)
        slot->released.notify_one();
    else
        g_table.erase(lock_path.string());
    slot.reset();
}

bool FileLock::Impl::take_flock(LockMode mode, std::optional<Clock::time_point> deadline)
{
    fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (fd < 0)
    {
        ec = errno_code(errno);
        return false;
    }

    const int op = (mode == LockMode::Blocking && !deadline) ? LOCK_EX : (LOCK_EX | LOCK_NB);
    for (;;)
    {
        if (::flock(fd, op) == 0)
            return true;
        const int err = errno;
        const bool busy = err == EWOULDBLOCK || err == EINTR;
        if (!busy)
            ec = errno_code(err);
        else if (mode == LockMode::NonBlocking)
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
        else if (deadline && Clock::now() >= *deadline)
            ec = std::make_error_code(std::errc::timed_out);
        if (ec)
        {
            ::close(fd);
            fd = -1;
            return false;
        }
        if (op & LOCK_NB)
            std::this_thread::sleep_for(kFlockRetryInterval);
    }
}

bool FileLock::Impl::acquire(LockMode mode, std::optional<Clock::time_point> deadline)
{
    if (lock_path.empty())
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (!enter_slot(mode, deadline))
        return false;

    std::error_code mkdir_ec;
    fs::create_directories(lock_path.parent_path(), mkdir_ec);
    if (mkdir_ec)
    {
        ec = mkdir_ec;
        leave_slot();
        return false;
    }
    if (!take_flock(mode, deadline))
    {
        leave_slot();
        return false;
    }
    CTXHUB_DEBUG("pid {} holds {}", ::getpid(), lock_path.string());
    return true;
}

void FileLock::Impl::release()
{
    if (fd >= 0)
    {
        ::flock(fd, LOCK_UN);
        ::close(fd);
        fd = -1;
    }
    leave_slot();
}

fs::path FileLock::lock_path_for(const fs::path &resource) noexcept
{
    try
    {
        if (resource.empty())
            return {};
        for (const char c : resource.native())
        {
            if (static_cast<unsigned char>(c) < 0x20)
                return {};
        }
        std::error_code ec;
        fs::path target = fs::weakly_canonical(resource, ec);
        if (ec)
            target = fs::absolute(resource).lexically_normal();
        target += ".lock";
        return target;
    }
    catch (const std::exception &e)
    {
        CTXHUB_DEBUG("lock_path_for('{}') failed: {}", resource.string(), e.what());
        return {};
    }
}

std::unique_ptr<FileLock::Impl> FileLock::make_impl(const fs::path &resource) noexcept
{
    std::unique_ptr<Impl> impl(new (std::nothrow) Impl);
    if (impl)
        impl->lock_path = lock_path_for(resource);
    return impl;
}

FileLock::FileLock(const fs::path &resource, LockMode mode) noexcept : pImpl(make_impl(resource))
{
    if (!lifecycle_initialized())
        CTXHUB_PANIC("FileLock('{}') used before its lifecycle module started.", resource.string());
    if (pImpl)
        pImpl->acquire(mode, std::nullopt);
}

FileLock::FileLock(const fs::path &resource, std::chrono::milliseconds timeout) noexcept
    : pImpl(make_impl(resource))
{
    if (!lifecycle_initialized())
        CTXHUB_PANIC("FileLock('{}') used before its lifecycle module started.", resource.string());
    if (pImpl)
        pImpl->acquire(LockMode::Blocking, Clock::now() + timeout);
}

FileLock::FileLock(std::unique_ptr<Impl> impl) noexcept : pImpl(std::move(impl)) {}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

std::optional<FileLock> FileLock::try_lock(const fs::path &resource, LockMode mode) noexcept
{
    if (!lifecycle_initialized())
        return std::nullopt;
    auto impl = make_impl(resource);
    if (!impl || !impl->acquire(mode, std::nullopt))
        return std::nullopt;
    return FileLock(std::move(impl));
}

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->fd >= 0;
}

std::error_code FileLock::error_code() const noexcept
{
    return pImpl ? pImpl->ec : std::make_error_code(std::errc::not_enough_memory);
}

bool FileLock::lifecycle_initialized() noexcept
{
    return g_filelock_initialized.load(std::memory_order_acquire);
}

ModuleDef FileLock::GetLifecycleModule()
{
    ModuleDef module("ctxhub::utils::FileLock");
    module.set_startup([](const char *) { g_filelock_initialized.store(true); });
    module.set_shutdown([](const char *) { g_filelock_initialized.store(false); },
                        std::chrono::milliseconds(2000));
    return module;
}

} // namespace ctxhub::utils
