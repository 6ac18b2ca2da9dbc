/**
 * @file file_activity_watcher.cpp
 * @brief FileActivityWatcher: inotify reader thread, ignore filter and debounce.
 */
#include "file_activity_watcher.hpp"

#include "ctxhub_service.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace ctxhub::coord
{
namespace fs = std::filesystem;

namespace
{
constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;
constexpr int kPollTimeoutMs = 100;
constexpr size_t kDebouncePruneThreshold = 1024;

constexpr std::array<std::string_view, 5> kIgnoredFragments = {
    "__pycache__", ".pyc", ".git", "node_modules", ".DS_Store"};
// Whole path components: virtualenvs and dotenv files.
constexpr std::array<std::string_view, 3> kIgnoredComponents = {"venv", ".venv", ".env"};
// Logs, editor swap/backup files and temporaries.
constexpr std::array<std::string_view, 6> kIgnoredSuffixes = {".log", ".swp", ".swo",
                                                              ".swx", ".tmp", "~"};

bool has_component(std::string_view path, std::string_view name) noexcept
{
    size_t start = 0;
    while (start <= path.size())
    {
        const size_t slash = path.find('/', start);
        const size_t end = slash == std::string_view::npos ? path.size() : slash;
        if (path.substr(start, end - start) == name)
            return true;
        if (slash == std::string_view::npos)
            break;
        start = slash + 1;
    }
    return false;
}
} // namespace

struct FileActivityWatcher::Impl
{
    struct Watch
    {
        std::string context;
        fs::path dir;
    };

    Impl(ActivityTracker &t, std::chrono::duration<double> d, Clock c)
        : tracker(t), debounce(std::chrono::duration_cast<std::chrono::steady_clock::duration>(d)),
          clock(c ? std::move(c) : Clock([] { return std::chrono::steady_clock::now(); }))
    {
    }

    ActivityTracker &tracker;
    std::chrono::steady_clock::duration debounce;
    Clock clock;

    mutable std::mutex watch_mutex;
    std::map<std::string, std::vector<fs::path>> roots;
    std::unordered_map<int, Watch> watches;
    int inotify_fd{-1};

    std::mutex debounce_mutex;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_event;

    std::thread reader;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    // Caller holds watch_mutex.
    size_t add_watch_recursive_locked(const std::string &context, const fs::path &dir)
    {
        if (inotify_fd < 0)
            return 0;

        const int wd = ::inotify_add_watch(inotify_fd, dir.c_str(), kWatchMask);
        if (wd < 0)
        {
            LOGGER_WARN("[watcher] cannot watch '{}' for '{}': {}", dir.string(), context,
                        std::strerror(errno));
            return 0;
        }
        watches[wd] = Watch{context, dir};
        size_t added = 1;

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            LOGGER_WARN("[watcher] cannot list '{}': {}", dir.string(), ec.message());
            return added;
        }
        for (fs::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                LOGGER_WARN("[watcher] error while listing '{}': {}", dir.string(), ec.message());
                break;
            }
            std::error_code type_ec;
            if (it->is_symlink(type_ec) || !it->is_directory(type_ec))
                continue;
            if (FileActivityWatcher::is_ignored(it->path().string()))
                continue;
            added += add_watch_recursive_locked(context, it->path());
        }
        return added;
    }

    size_t install_root_locked(const std::string &context, const fs::path &dir)
    {
        if (inotify_fd < 0)
            return 0;
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            LOGGER_DEBUG("[watcher] '{}' for '{}' does not exist; skipped", dir.string(), context);
            return 0;
        }
        const size_t n = add_watch_recursive_locked(context, dir);
        LOGGER_INFO("[watcher] watching '{}' for '{}' ({} directories)", dir.string(), context, n);
        return n;
    }

    void handle_event(const struct inotify_event *ev)
    {
        std::string context;
        fs::path full;
        bool is_dir = (ev->mask & IN_ISDIR) != 0;
        {
            std::lock_guard<std::mutex> lock(watch_mutex);
            auto wit = watches.find(ev->wd);
            if (wit == watches.end())
                return;
            if ((ev->mask & IN_IGNORED) != 0 || (ev->mask & IN_DELETE_SELF) != 0)
            {
                LOGGER_DEBUG("[watcher] watch on '{}' removed", wit->second.dir.string());
                watches.erase(wit);
                return;
            }
            context = wit->second.context;
            full = (ev->len > 0) ? wit->second.dir / ev->name : wit->second.dir;

            if (is_dir && (ev->mask & (IN_CREATE | IN_MOVED_TO)) != 0 &&
                !FileActivityWatcher::is_ignored(full.string()))
            {
                add_watch_recursive_locked(context, full);
            }
        }

        ActivityKind kind = ActivityKind::Modified;
        if ((ev->mask & (IN_CREATE | IN_MOVED_TO)) != 0)
            kind = ActivityKind::Created;
        else if ((ev->mask & (IN_DELETE | IN_MOVED_FROM)) != 0)
            kind = ActivityKind::Deleted;
        owner->on_raw_event(context, full, kind, is_dir);
    }

    void run()
    {
        alignas(struct inotify_event) std::array<char, 8192> buf{};
        while (!stop_requested.load(std::memory_order_acquire))
        {
            struct pollfd pfd{inotify_fd, POLLIN, 0};
            const int rc = ::poll(&pfd, 1, kPollTimeoutMs);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                LOGGER_ERROR("[watcher] poll failed: {}; watcher stops", std::strerror(errno));
                break;
            }
            if (rc == 0)
                continue;

            const ssize_t len = ::read(inotify_fd, buf.data(), buf.size());
            if (len < 0)
            {
                if (errno == EAGAIN || errno == EINTR)
                    continue;
                LOGGER_ERROR("[watcher] read failed: {}; watcher stops", std::strerror(errno));
                break;
            }

            const char *ptr = buf.data();
            while (ptr < buf.data() + len)
            {
                const auto *ev = reinterpret_cast<const struct inotify_event *>(ptr);
                ptr += sizeof(struct inotify_event) + ev->len;
                if ((ev->mask & IN_Q_OVERFLOW) != 0)
                {
                    LOGGER_WARN("[watcher] kernel event queue overflowed; events were lost");
                    continue;
                }
                handle_event(ev);
            }
        }
        running.store(false, std::memory_order_release);
    }

    FileActivityWatcher *owner{nullptr};
};

FileActivityWatcher::FileActivityWatcher(ActivityTracker &tracker,
                                         std::chrono::duration<double> debounce, Clock clock)
    : pImpl(std::make_unique<Impl>(tracker, debounce, std::move(clock)))
{
    pImpl->owner = this;
}

FileActivityWatcher::~FileActivityWatcher()
{
    stop();
}

size_t FileActivityWatcher::add_context(const std::string &context,
                                        const std::vector<std::filesystem::path> &dirs)
{
    std::lock_guard<std::mutex> lock(pImpl->watch_mutex);
    auto &roots = pImpl->roots[context];
    size_t count = 0;
    for (const auto &dir : dirs)
    {
        roots.push_back(dir);
        count += pImpl->install_root_locked(context, dir);
    }
    return count;
}

bool FileActivityWatcher::start(std::error_code *err_code) noexcept
{
    if (pImpl->running.load(std::memory_order_acquire))
        return true;

    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0)
    {
        const int errnum = errno;
        if (err_code != nullptr)
            *err_code = std::error_code(errnum, std::generic_category());
        LOGGER_ERROR("[watcher] inotify_init1 failed: {}", std::strerror(errnum));
        return false;
    }

    try
    {
        size_t total = 0;
        {
            std::lock_guard<std::mutex> lock(pImpl->watch_mutex);
            pImpl->inotify_fd = fd;
            for (const auto &[context, dirs] : pImpl->roots)
            {
                for (const auto &dir : dirs)
                    total += pImpl->install_root_locked(context, dir);
            }
        }

        pImpl->stop_requested.store(false, std::memory_order_release);
        pImpl->running.store(true, std::memory_order_release);
        pImpl->reader = std::thread([this] { pImpl->run(); });
        LOGGER_INFO("[watcher] started with {} watched directories", total);
    }
    catch (const std::exception &ex)
    {
        pImpl->running.store(false, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(pImpl->watch_mutex);
            pImpl->watches.clear();
            pImpl->inotify_fd = -1;
        }
        ::close(fd);
        if (err_code != nullptr)
            *err_code = std::make_error_code(std::errc::resource_unavailable_try_again);
        LOGGER_ERROR("[watcher] cannot start: {}", ex.what());
        return false;
    }
    if (err_code != nullptr)
        *err_code = {};
    return true;
}

void FileActivityWatcher::stop() noexcept
{
    pImpl->stop_requested.store(true, std::memory_order_release);
    if (pImpl->reader.joinable())
        pImpl->reader.join();
    pImpl->running.store(false, std::memory_order_release);

    std::lock_guard<std::mutex> lock(pImpl->watch_mutex);
    if (pImpl->inotify_fd >= 0)
    {
        ::close(pImpl->inotify_fd); // releases every watch descriptor
        pImpl->inotify_fd = -1;
        pImpl->watches.clear();
        LOGGER_INFO("[watcher] stopped");
    }
}

bool FileActivityWatcher::is_running() const noexcept
{
    return pImpl->running.load(std::memory_order_acquire);
}

size_t FileActivityWatcher::watch_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->watch_mutex);
    return pImpl->watches.size();
}

bool FileActivityWatcher::is_ignored(std::string_view path) noexcept
{
    for (const auto fragment : kIgnoredFragments)
    {
        if (path.find(fragment) != std::string_view::npos)
            return true;
    }
    for (const auto component : kIgnoredComponents)
    {
        if (has_component(path, component))
            return true;
    }
    for (const auto suffix : kIgnoredSuffixes)
    {
        if (path.ends_with(suffix))
            return true;
    }
    return false;
}

bool FileActivityWatcher::on_raw_event(std::string_view context, const std::filesystem::path &path,
                                       ActivityKind kind, bool is_directory)
{
    if (is_directory)
        return false;
    const std::string key = path.string();
    if (is_ignored(key))
        return false;

    {
        std::lock_guard<std::mutex> lock(pImpl->debounce_mutex);
        const auto now = pImpl->clock();
        auto it = pImpl->last_event.find(key);
        if (it != pImpl->last_event.end() && now - it->second < pImpl->debounce)
            return false;

        if (pImpl->last_event.size() > kDebouncePruneThreshold)
        {
            std::erase_if(pImpl->last_event,
                          [&](const auto &kv) { return now - kv.second >= pImpl->debounce; });
        }
        pImpl->last_event[key] = now;
    }

    return pImpl->tracker.record(context, key, kind);
}

} // namespace ctxhub::coord
