#pragma once
/**
 * @file sink.hpp
 * @brief Destination interface for the asynchronous Logger.
 */

#include "ctxhub_base.hpp"

namespace ctxhub::utils
{

/// One queued log event. `level` mirrors Logger::Level as an int.
struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id = 0;
    uint64_t thread_id = 0;
    int level = 0;
    fmt::memory_buffer body;
};

/// Builds a record stamped with the calling process and thread.
LogRecord make_log_record(int level, fmt::memory_buffer &&body);

/// "DEBUG", "INFO", ...; "UNK" for anything out of range.
const char *log_level_name(int level) noexcept;

/// Renders one line: "[LEVEL ] [time] [PID:... TID:...] body\n".
std::string render_log_line(const LogRecord &rec);

class Sink
{
  public:
    virtual ~Sink() = default;

    /// Called on the logger worker thread only. May throw std::system_error.
    virtual void write(const LogRecord &rec) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

} // namespace ctxhub::utils
