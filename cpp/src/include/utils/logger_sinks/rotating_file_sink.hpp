#pragma once

#include "file_sink.hpp"

namespace ctxhub::utils
{

/**
 * @class RotatingFileSink
 * @brief FileSink that starts a fresh file once the current one reaches a size cap.
 *
 * Retired files are kept as `<path>.1` (newest) through `<path>.N` (oldest);
 * with N == 0 the full file is simply discarded.
 */
class RotatingFileSink : public FileSink
{
  public:
    RotatingFileSink(std::filesystem::path path, size_t max_bytes, size_t max_backups);

    void write(const LogRecord &rec) override;
    std::string description() const override;

  private:
    std::filesystem::path backup_path(size_t index) const;
    bool shift_backups();
    void rotate();

    size_t m_max_bytes;
    size_t m_max_backups;
    size_t m_current_bytes = 0;
};

} // namespace ctxhub::utils
