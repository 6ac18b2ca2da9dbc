// tests/test_framework/test_process_utils.cpp
#include "test_process_utils.h"

#include <cerrno>
#include <csignal>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace ctxhub::tests::helper
{

ProgramRun::ProgramRun(const std::filesystem::path &program, const std::vector<std::string> &args)
    : out_path_((capture_ / "stdout").string()), err_path_((capture_ / "stderr").string())
{
    // Built before fork(): the child may only make async-signal-safe calls.
    const std::string program_str = program.string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(program_str.c_str()));
    for (const auto &a : args)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<char *> envp;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e)
    {
        if (std::string_view(*e).starts_with("CTXHUB_"))
            continue;
        envp.push_back(*e);
    }
    envp.push_back(nullptr);

    pid_ = ::fork();
    if (pid_ == 0)
    {
        const int out_fd =
            ::open(out_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        const int err_fd =
            ::open(err_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
        if (out_fd < 0 || err_fd < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 ||
            ::dup2(err_fd, STDERR_FILENO) < 0)
        {
            ::_exit(126);
        }
        ::execve(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }
}

ProgramRun::~ProgramRun()
{
    if (pid_ <= 0 || reaped_)
        return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR)
    {
    }
}

ProcessOutcome ProgramRun::wait(std::chrono::milliseconds timeout)
{
    ProcessOutcome outcome;
    if (pid_ <= 0 || reaped_)
        return outcome;

    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_)
            break;
        if (r < 0 && errno != EINTR)
            return outcome;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &status, 0);
            outcome.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reaped_ = true;

    if (WIFEXITED(status))
        outcome.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        outcome.term_signal = WTERMSIG(status);
    read_file_contents(out_path_, outcome.out);
    read_file_contents(err_path_, outcome.err);
    return outcome;
}

ProcessOutcome run_program(const std::filesystem::path &program,
                           const std::vector<std::string> &args,
                           std::chrono::milliseconds timeout)
{
    ProgramRun run(program, args);
    return run.wait(timeout);
}

} // namespace ctxhub::tests::helper
