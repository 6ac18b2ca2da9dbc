/*******************************************************************************
 * @file logger.cpp
 * @brief Worker thread, command queue and sink management for Logger.
 ******************************************************************************/

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

#include "ctxhub_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/rotating_file_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace ctxhub::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Control calls before startup are a wiring bug in the host program.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        CTXHUB_PANIC("{} called before the Logger lifecycle module was started.", function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{

constexpr size_t kMaxQueuedRecords = 10000;
constexpr int kSystemLevel = static_cast<int>(Logger::Level::L_SYSTEM);

using Ack = std::shared_ptr<std::promise<bool>>;

struct SwitchSink
{
    std::unique_ptr<Sink> sink;
    Ack ack;
};
struct Flush
{
    Ack ack;
};
struct SetAnnounce
{
    bool enabled;
    Ack ack;
};

using Command = std::variant<LogRecord, SwitchSink, Flush, SetAnnounce>;

void acknowledge(const Ack &ack, bool value) noexcept
{
    if (!ack)
        return;
    try
    {
        ack->set_value(value);
    }
    catch (const std::future_error &e)
    {
        CTXHUB_DEBUG("logger command acknowledged twice: {}", e.what());
    }
}

Ack ack_of(Command &cmd)
{
    return std::visit(
        [](auto &c) -> Ack
        {
            if constexpr (std::is_same_v<std::decay_t<decltype(c)>, LogRecord>)
                return nullptr;
            else
                return c.ack;
        },
        cmd);
}

bool check_writable(const std::filesystem::path &dir, std::error_code &ec)
{
    const auto scratch =
        dir / fmt::format(".ctxhub_log_check_{}_{}", platform::get_pid(),
                          std::chrono::steady_clock::now().time_since_epoch().count());
    const int fd = ::open(scratch.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        ec.assign(errno, std::generic_category());
        return false;
    }
    ::close(fd);
    ::unlink(scratch.c_str());
    return true;
}

} // namespace

struct Logger::Impl
{
    Impl() : sink(std::make_unique<ConsoleSink>()) {}
    ~Impl() { stop(); }

    void start();
    void stop();
    bool push(Command &&cmd);
    bool submit_and_wait(Command &&cmd, std::future<bool> reply);
    void run();
    void apply(Command &cmd);
    void write_record(const LogRecord &rec);
    void replace_sink(std::unique_ptr<Sink> next);
    template <typename MakeSink> bool switch_sink(const char *what, MakeSink &&make_sink);

    std::thread worker;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Command> queue;
    bool stopping = false;
    size_t dropped = 0;

    // Owned by the worker thread once it runs.
    std::unique_ptr<Sink> sink;
    bool announce_switches = true;

    std::atomic<Level> level{Level::L_INFO};
};

void Logger::Impl::start()
{
    if (!worker.joinable())
        worker = std::thread([this] { run(); });
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping && !worker.joinable())
            return;
        stopping = true;
    }
    cv.notify_one();
    if (worker.joinable())
        worker.join();
}

bool Logger::Impl::push(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        const bool is_record = std::holds_alternative<LogRecord>(cmd);
        if (stopping || (is_record && queue.size() >= kMaxQueuedRecords))
        {
            if (!stopping)
                ++dropped;
            acknowledge(ack_of(cmd), false);
            return false;
        }
        queue.push_back(std::move(cmd));
    }
    cv.notify_one();
    return true;
}

bool Logger::Impl::submit_and_wait(Command &&cmd, std::future<bool> reply)
{
    if (!push(std::move(cmd)))
        return false;
    return reply.get();
}

void Logger::Impl::write_record(const LogRecord &rec)
{
    if (sink)
        sink->write(rec);
}

void Logger::Impl::replace_sink(std::unique_ptr<Sink> next)
{
    const std::string old_desc = sink ? sink->description() : "none";
    if (announce_switches && sink)
    {
        write_record(make_log_record(
            kSystemLevel, format_tools::make_buffer("Switching log sink to: {}",
                                                    next->description())));
        sink->flush();
    }
    sink = std::move(next);
    if (announce_switches)
    {
        write_record(make_log_record(
            kSystemLevel, format_tools::make_buffer("Log sink switched from: {}", old_desc)));
    }
}

void Logger::Impl::apply(Command &cmd)
{
    if (auto *rec = std::get_if<LogRecord>(&cmd))
    {
        if (rec->level >= static_cast<int>(level.load(std::memory_order_relaxed)))
            write_record(*rec);
    }
    else if (auto *sw = std::get_if<SwitchSink>(&cmd))
    {
        replace_sink(std::move(sw->sink));
        acknowledge(sw->ack, true);
    }
    else if (auto *fl = std::get_if<Flush>(&cmd))
    {
        if (sink)
            sink->flush();
        acknowledge(fl->ack, true);
    }
    else if (auto *an = std::get_if<SetAnnounce>(&cmd))
    {
        announce_switches = an->enabled;
        acknowledge(an->ack, true);
    }
}

void Logger::Impl::run()
{
    std::deque<Command> batch;
    for (;;)
    {
        size_t dropped_now = 0;
        bool last_round = false;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return stopping || !queue.empty(); });
            batch.swap(queue);
            dropped_now = std::exchange(dropped, 0);
            last_round = stopping && batch.empty();
        }

        for (auto &cmd : batch)
        {
            try
            {
                apply(cmd);
            }
            catch (const std::exception &e)
            {
                // The sink is what failed, so the report goes to stderr.
                fmt::print(stderr, "[LOGGER] sink '{}' failed: {}\n",
                           sink ? sink->description() : "none", e.what());
                acknowledge(ack_of(cmd), false);
            }
        }
        batch.clear();

        if (dropped_now > 0)
        {
            try
            {
                write_record(make_log_record(
                    static_cast<int>(Level::L_WARNING),
                    format_tools::make_buffer("Logger queue full: {} messages dropped.",
                                              dropped_now)));
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[LOGGER] {} messages dropped; report failed: {}\n",
                           dropped_now, e.what());
            }
        }

        if (last_round)
            break;
    }

    try
    {
        if (sink)
        {
            if (announce_switches)
                write_record(make_log_record(kSystemLevel,
                                             format_tools::make_buffer("Logger is shutting down.")));
            sink->flush();
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] final flush failed: {}\n", e.what());
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

// Builds the sink on the caller's thread; construction errors never reach the worker.
template <typename MakeSink>
bool Logger::Impl::switch_sink(const char *what, MakeSink &&make_sink)
{
    std::unique_ptr<Sink> next;
    try
    {
        next = make_sink();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] cannot create {}: {}\n", what, e.what());
        return false;
    }
    auto ack = std::make_shared<std::promise<bool>>();
    auto reply = ack->get_future();
    return submit_and_wait(SwitchSink{std::move(next), ack}, std::move(reply));
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    return pImpl->switch_sink("console sink", [] { return std::make_unique<ConsoleSink>(); });
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    return pImpl->switch_sink(
        "file sink", [&] { return std::make_unique<FileSink>(std::filesystem::path(utf8_path)); });
}

bool Logger::set_rotating_logfile(const std::filesystem::path &base_filepath,
                                  size_t max_file_size_bytes, size_t max_backup_files,
                                  std::error_code &ec) noexcept
{
    ec.clear();
    if (!logger_is_loggable("Logger::set_rotating_logfile"))
    {
        ec = std::make_error_code(std::errc::not_supported);
        return false;
    }

    try
    {
        const auto target = std::filesystem::absolute(base_filepath).lexically_normal();
        const auto dir = target.parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec || !check_writable(dir, ec))
                return false;
        }
        const bool ok = pImpl->switch_sink(
            "rotating file sink",
            [&]
            {
                return std::make_unique<RotatingFileSink>(target, max_file_size_bytes,
                                                          max_backup_files);
            });
        if (!ok)
            ec = std::make_error_code(std::errc::io_error);
        return ok;
    }
    catch (const std::exception &e)
    {
        CTXHUB_DEBUG("set_rotating_logfile('{}') failed: {}", base_filepath.string(), e.what());
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto ack = std::make_shared<std::promise<bool>>();
    auto reply = ack->get_future();
    (void)pImpl->submit_and_wait(Flush{ack}, std::move(reply));
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level.load(std::memory_order_relaxed);
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto ack = std::make_shared<std::promise<bool>>();
    auto reply = ack->get_future();
    (void)pImpl->submit_and_wait(SetAnnounce{enabled, ack}, std::move(reply));
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::enqueue(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        (void)pImpl->push(make_log_record(static_cast<int>(lvl), std::move(body)));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOGGER] enqueue failed: {}\n", e.what());
    }
}

// Lifecycle callbacks.
void do_logger_startup(const char *)
{
    Logger::instance().pImpl->start();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *)
{
    LoggerState expected = LoggerState::Initialized;
    if (!g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                                std::memory_order_acq_rel))
    {
        return;
    }
    Logger::instance().pImpl->stop();
    g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("ctxhub::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace ctxhub::utils
