// tests/test_framework/shared_test_helpers.h
#pragma once

/**
 * @file shared_test_helpers.h
 * @brief File and timing helpers shared by every ctxhub test executable.
 */

#include "ctxhub_platform.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <unistd.h>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace ctxhub::tests::helper
{

/**
 * @brief Captures everything written to a file descriptor while alive.
 *
 * GetOutput() restores the descriptor and returns what was captured.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture);
    ~StringCapture();

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput();

  private:
    void restore();

    int fd_to_capture_;
    int original_fd_{-1};
    int pipe_fds_[2]{-1, -1};
};

/**
 * @brief A unique scratch directory under the system temp dir, removed on destruction.
 */
class TempDir
{
  public:
    explicit TempDir(std::string_view tag);
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const noexcept { return path_; }
    fs::path operator/(const fs::path &rel) const { return path_ / rel; }

  private:
    fs::path path_;
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const fs::path &path, std::string &out);

/// Creates parent directories as needed and writes @p content.
bool write_file_contents(const fs::path &path, std::string_view content);

size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until the expected string is found or a timeout is reached.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @brief Polls @p predicate every 10 ms until it holds or @p timeout elapses.
 */
template <typename Pred>
bool wait_until(Pred predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

/**
 * @brief A PID that is guaranteed not to belong to a live process.
 * @details Forks a child that exits immediately and reaps it.
 */
uint64_t reaped_child_pid();

} // namespace ctxhub::tests::helper
