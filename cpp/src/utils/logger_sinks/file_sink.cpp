#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ctxhub::utils
{

FileSink::FileSink(std::filesystem::path path) : m_path(std::move(path))
{
    open_file();
}

FileSink::~FileSink()
{
    close_file();
}

void FileSink::open_file()
{
    close_file();
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("cannot open log file '{}'", m_path.string()));
    }
}

void FileSink::close_file() noexcept
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

size_t FileSink::append(std::string_view text)
{
    if (!is_open())
        return 0;

    ::flock(m_fd, LOCK_EX);
    auto unlock = basics::make_scope_guard([this] { ::flock(m_fd, LOCK_UN); });

    size_t done = 0;
    while (done < text.size())
    {
        const ssize_t n = ::write(m_fd, text.data() + done, text.size() - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(),
                                    fmt::format("write to '{}' failed", m_path.string()));
        }
        done += static_cast<size_t>(n);
    }
    return done;
}

size_t FileSink::file_size() const noexcept
{
    struct stat st{};
    if (!is_open() || ::fstat(m_fd, &st) != 0)
        return 0;
    return static_cast<size_t>(st.st_size);
}

void FileSink::write(const LogRecord &rec)
{
    append(render_log_line(rec));
}

void FileSink::flush()
{
    if (is_open())
        ::fsync(m_fd);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace ctxhub::utils
