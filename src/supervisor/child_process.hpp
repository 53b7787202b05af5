#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// How to launch the engine
struct EngineCommand {
    std::string binary;
    std::vector<std::string> args;
    std::string working_dir;                  // empty = inherit
    std::map<std::string, std::string> env;   // added to / overriding the host environment
    bool merge_stderr = false;                // capture stderr into the same stream
};

/// Exit status of a reaped child
struct ExitStatus {
    bool exited = false;    // normal exit; code is valid
    int code = -1;
    bool signaled = false;  // killed by a signal; signal is valid
    int signal = 0;

    static ExitStatus from_wait_status(int status);

    /// "code 0", "signal 9 (Killed)", ...
    std::string describe() const;
};

/// Scoped handle to one engine process with its stdout captured through a pipe.
/// The destructor terminates the process if it is still alive.
class ChildProcess {
public:
    explicit ChildProcess(EngineCommand command);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec the engine. On failure returns false and fills err;
    /// exec failures (missing binary, permission denied) are reported here
    /// rather than as an exit of the child.
    bool spawn(std::string& err);

    /// Read end of the stdout pipe (-1 if not spawned or closed)
    int stdout_fd() const { return stdout_fd_; }
    void close_stdout();

    pid_t pid() const { return pid_; }

    /// True while the process has not been reaped
    bool is_running() const { return pid_ > 0; }

    /// Reap the process if it has exited; non-blocking
    std::optional<ExitStatus> try_wait();

    /// Poll for exit until the timeout elapses
    std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGTERM, wait up to grace, then SIGKILL. Sets *forced when SIGKILL was needed.
    ExitStatus terminate(std::chrono::milliseconds grace, bool* forced = nullptr);

    const std::optional<ExitStatus>& exit_status() const { return exit_status_; }

private:
    EngineCommand command_;
    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    std::optional<ExitStatus> exit_status_;

    void send_signal(int sig);
};
