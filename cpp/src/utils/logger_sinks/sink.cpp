#include "utils/logger_sinks/sink.hpp"

#include <array>

namespace ctxhub::utils
{

const char *log_level_name(int level) noexcept
{
    static constexpr std::array<const char *, 6> kNames = {"TRACE", "DEBUG", "INFO",
                                                           "WARN",  "ERROR", "SYSTEM"};
    if (level < 0 || static_cast<size_t>(level) >= kNames.size())
        return "UNK";
    return kNames[static_cast<size_t>(level)];
}

LogRecord make_log_record(int level, fmt::memory_buffer &&body)
{
    LogRecord rec;
    rec.timestamp = std::chrono::system_clock::now();
    rec.process_id = platform::get_pid();
    rec.thread_id = platform::get_native_thread_id();
    rec.level = level;
    rec.body = std::move(body);
    return rec;
}

std::string render_log_line(const LogRecord &rec)
{
    return fmt::format("[{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", log_level_name(rec.level),
                       format_tools::formatted_time(rec.timestamp), rec.process_id,
                       rec.thread_id, std::string_view(rec.body.data(), rec.body.size()));
}

} // namespace ctxhub::utils
