// tests/test_framework/test_process_utils.h
#pragma once

/**
 * @file test_process_utils.h
 * @brief Runs a program as a child process and collects its exit status and output.
 */

#include "shared_test_helpers.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace ctxhub::tests::helper
{

struct ProcessOutcome
{
    int exit_code{-1};   ///< WEXITSTATUS, or -1 when the child did not exit normally.
    int term_signal{0};  ///< Signal that ended the child, 0 if it exited.
    bool timed_out{false};
    std::string out;
    std::string err;
};

/**
 * @brief fork + execve of a program with stdout and stderr captured to files.
 *
 * The child gets the parent's environment minus every CTXHUB_* variable, so a
 * developer's shell settings cannot leak into the run. A child still running
 * when the object is destroyed is killed with SIGKILL and reaped.
 */
class ProgramRun
{
  public:
    ProgramRun(const std::filesystem::path &program, const std::vector<std::string> &args);
    ~ProgramRun();

    ProgramRun(const ProgramRun &) = delete;
    ProgramRun &operator=(const ProgramRun &) = delete;

    [[nodiscard]] bool started() const noexcept { return pid_ > 0; }
    pid_t pid() const noexcept { return pid_; }

    /// Waits for the child; after @p timeout it is killed and `timed_out` is set.
    ProcessOutcome wait(std::chrono::milliseconds timeout = std::chrono::seconds(30));

  private:
    TempDir capture_{"proc_capture"};
    std::string out_path_;
    std::string err_path_;
    pid_t pid_{-1};
    bool reaped_{false};
};

/// ProgramRun followed by wait().
ProcessOutcome run_program(const std::filesystem::path &program,
                           const std::vector<std::string> &args,
                           std::chrono::milliseconds timeout = std::chrono::seconds(30));

} // namespace ctxhub::tests::helper
