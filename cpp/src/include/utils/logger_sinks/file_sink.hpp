#pragma once
/**
 * @file file_sink.hpp
 * @brief Append-only log file shared safely between processes.
 *
 * Each record is written whole under an exclusive advisory `flock`, so the
 * daemon and a concurrent CLI invocation can log to the same file without
 * interleaving partial lines.
 */

#include "sink.hpp"

#include <filesystem>

namespace ctxhub::utils
{

class FileSink : public Sink
{
  public:
    /// @throws std::system_error if the file cannot be opened.
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogRecord &rec) override;
    void flush() override;
    std::string description() const override;

    const std::filesystem::path &path() const noexcept { return m_path; }

  protected:
    void open_file();
    void close_file() noexcept;
    bool is_open() const noexcept { return m_fd >= 0; }
    /// Appends @p text under the lock; returns the byte count written.
    size_t append(std::string_view text);
    /// Current on-disk size, 0 when closed or on error.
    size_t file_size() const noexcept;

  private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

} // namespace ctxhub::utils
