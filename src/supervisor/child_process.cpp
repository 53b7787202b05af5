#include "supervisor/child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

static const std::chrono::milliseconds kDestructorGrace{2000};

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.exited = true;
        st.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.signaled = true;
        st.signal = WTERMSIG(status);
    }
    return st;
}

std::string ExitStatus::describe() const {
    if (exited) return "code " + std::to_string(code);
    if (signaled) {
        const char* name = strsignal(signal);
        return "signal " + std::to_string(signal) + (name ? std::string(" (") + name + ")" : "");
    }
    return "unknown status";
}

ChildProcess::ChildProcess(EngineCommand command) : command_(std::move(command)) {}

ChildProcess::~ChildProcess() {
    if (is_running()) {
        terminate(kDestructorGrace);
    }
    close_stdout();
}

void ChildProcess::close_stdout() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

bool ChildProcess::spawn(std::string& err) {
    if (is_running()) {
        err = "process already running (pid " + std::to_string(pid_) + ")";
        return false;
    }
    if (command_.binary.empty()) {
        err = "no engine binary configured";
        return false;
    }

    // Everything the child needs is built before fork(): only
    // async-signal-safe calls are allowed between fork and exec.
    std::vector<const char*> argv;
    argv.push_back(command_.binary.c_str());
    for (const auto& arg : command_.args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (command_.env.count(key) == 0) {
            env_storage.push_back(std::move(entry));
        }
    }
    for (const auto& kv : command_.env) {
        env_storage.push_back(kv.first + "=" + kv.second);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    // Reports the exec errno back to the parent; closes on successful exec
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        auto fail = [&](int code) {
            ssize_t ignored = write(err_pipe[1], &code, sizeof(code));
            (void)ignored;
            _exit(127);
        };

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        if (dup2(out_pipe[1], STDOUT_FILENO) < 0) fail(errno);
        if (command_.merge_stderr && dup2(out_pipe[1], STDERR_FILENO) < 0) fail(errno);

        // Own process group so terminal signals meant for the host do not
        // reach the engine directly; the supervisor decides when it stops.
        setpgid(0, 0);
#ifdef __linux__
        prctl(PR_SET_PDEATHSIG, SIGTERM);
#endif
        sigset_t all;
        sigemptyset(&all);
        sigprocmask(SIG_SETMASK, &all, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (!command_.working_dir.empty() && chdir(command_.working_dir.c_str()) < 0) {
            fail(errno);
        }

        execvpe(command_.binary.c_str(), const_cast<char* const*>(argv.data()), envp.data());
        fail(errno);
    }

    // Parent process
    close(out_pipe[1]);
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(out_pipe[0]);
        err = command_.binary + ": " + std::strerror(child_errno);
        return false;
    }

    pid_ = pid;
    stdout_fd_ = out_pipe[0];
    exit_status_.reset();
    return true;
}

std::optional<ExitStatus> ChildProcess::try_wait() {
    if (pid_ <= 0) return exit_status_;

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_status_ = ExitStatus::from_wait_status(status);
        pid_ = -1;
        return exit_status_;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; the status is lost
        exit_status_ = ExitStatus{};
        pid_ = -1;
        return exit_status_;
    }
    return std::nullopt;
}

std::optional<ExitStatus> ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) return exit_status_;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto st = try_wait();
        if (st) return st;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::send_signal(int sig) {
    if (pid_ <= 0) return;
    // Whole group first so helpers the engine started go down with it
    if (kill(-pid_, sig) < 0) {
        kill(pid_, sig);
    }
}

ExitStatus ChildProcess::terminate(std::chrono::milliseconds grace, bool* forced) {
    if (forced) *forced = false;

    if (pid_ <= 0) {
        return exit_status_.value_or(ExitStatus{});
    }
    if (auto st = try_wait()) {
        return *st;
    }

    send_signal(SIGTERM);
    if (auto st = wait_for_exit(grace)) {
        return *st;
    }

    // Force kill if still running
    if (forced) *forced = true;
    send_signal(SIGKILL);
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    exit_status_ = result == pid_ ? ExitStatus::from_wait_status(status) : ExitStatus{};
    pid_ = -1;
    return *exit_status_;
}
