#pragma once
/**
 * @file logger.hpp
 * @brief Asynchronous, lifecycle-managed logger.
 *
 * Callers format on their own thread into a `fmt::memory_buffer` and hand the
 * buffer to a queue; a single worker thread drains the queue into the current
 * sink (console, file or rotating file). Sink switches and flushes are queued
 * commands, so they are ordered with the messages around them.
 *
 * Use the LOGGER_* macros; they check the format string at compile time.
 * The queue is bounded: once full, new records are dropped and the worker
 * writes a single warning with the count when it catches up.
 */

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include "ctxhub_base.hpp"

// Initial reserve for the per-message fmt::memory_buffer.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

// DEBUG/INFO/WARN calls below this level compile to nothing (1 = DEBUG ... 3 = WARN).
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

namespace ctxhub::utils
{

class CTXHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /** @brief Lifecycle module "ctxhub::utils::Logger"; no dependencies. */
    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // Sink switches block until the worker thread has applied them.
    bool set_console();
    /// Appends to @p utf8_path, creating it if needed.
    bool set_logfile(const std::string &utf8_path);
    /**
     * @brief Logs to @p base_filepath, rotating at @p max_file_size_bytes.
     *
     * The parent directory is created and checked for write access before the
     * switch is queued, so @p ec carries the real cause of a failure.
     */
    bool set_rotating_logfile(const std::filesystem::path &base_filepath,
                              size_t max_file_size_bytes, size_t max_backup_files,
                              std::error_code &ec) noexcept;

    /// Returns once every record queued before the call has reached the sink.
    void flush();

    void set_level(Level lvl);
    Level level() const;
    /// Controls the "Switching log sink to ..." lines and the closing "Logger is shutting down.".
    void set_log_sink_messages_enabled(bool enabled);

    bool should_log(Level lvl) const noexcept;

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!should_log(lvl))
            return;
        try
        {
            fmt::memory_buffer mb;
            mb.reserve(static_cast<size_t>(LOGGER_FMT_BUFFER_RESERVE));
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::print(stderr, "[LOGGER] dropped a message that failed to format: {}\n",
                       ex.what());
        }
    }

  private:
    Logger();
    ~Logger();

    void enqueue(Level lvl, fmt::memory_buffer &&body) noexcept;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ctxhub::utils

#define CTXHUB_LOGGER_CALL_(lvl, fmt, ...)                                                      \
    ::ctxhub::utils::Logger::instance().log_fmt<::ctxhub::utils::Logger::Level::lvl>(             \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#if LOGGER_COMPILE_LEVEL <= 1
#define LOGGER_DEBUG(fmt, ...) CTXHUB_LOGGER_CALL_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_DEBUG(fmt, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 2
#define LOGGER_INFO(fmt, ...) CTXHUB_LOGGER_CALL_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_INFO(fmt, ...) ((void)0)
#endif

#if LOGGER_COMPILE_LEVEL <= 3
#define LOGGER_WARN(fmt, ...) CTXHUB_LOGGER_CALL_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGGER_WARN(fmt, ...) ((void)0)
#endif

#define LOGGER_ERROR(fmt, ...) CTXHUB_LOGGER_CALL_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) CTXHUB_LOGGER_CALL_(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)
