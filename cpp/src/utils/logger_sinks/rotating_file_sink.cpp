#include "utils/logger_sinks/rotating_file_sink.hpp"

#include <system_error>

namespace ctxhub::utils
{

namespace fs = std::filesystem;

RotatingFileSink::RotatingFileSink(fs::path path, size_t max_bytes, size_t max_backups)
    : FileSink(std::move(path)), m_max_bytes(max_bytes > 0 ? max_bytes : 1),
      m_max_backups(max_backups)
{
    m_current_bytes = file_size();
}

fs::path RotatingFileSink::backup_path(size_t index) const
{
    return fs::path(fmt::format("{}.{}", path().string(), index));
}

void RotatingFileSink::write(const LogRecord &rec)
{
    if (m_current_bytes >= m_max_bytes)
        rotate();
    m_current_bytes += append(render_log_line(rec));
}

std::string RotatingFileSink::description() const
{
    return fmt::format("RotatingFile: path='{}', max_size={}, max_files={}", path().string(),
                       m_max_bytes, m_max_backups);
}

// Drops the oldest backup and renames the rest one slot up, then retires the live file.
bool RotatingFileSink::shift_backups()
{
    std::error_code ec;
    if (m_max_backups == 0)
    {
        fs::remove(path(), ec);
        return !ec;
    }

    fs::remove(backup_path(m_max_backups), ec);
    if (ec)
        return false;
    for (size_t i = m_max_backups - 1; i >= 1; --i)
    {
        if (fs::exists(backup_path(i)))
        {
            fs::rename(backup_path(i), backup_path(i + 1), ec);
            if (ec)
                return false;
        }
    }
    fs::rename(path(), backup_path(1), ec);
    return !ec;
}

void RotatingFileSink::rotate()
{
    close_file();
    const bool shifted = shift_backups();
    if (!shifted)
    {
        CTXHUB_DEBUG("log rotation of '{}' failed; continuing in the current file",
                     path().string());
    }

    // Reopen either the fresh file or, after a failed shift, the oversized one.
    open_file();
    m_current_bytes = shifted ? 0 : file_size();
    if (shifted)
    {
        m_current_bytes += append(render_log_line(
            make_log_record(5, format_tools::make_buffer("--- log rotated ---"))));
    }
}

} // namespace ctxhub::utils
