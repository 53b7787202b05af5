#include "supervisor/supervisor.hpp"
#include "supervisor/line_splitter.hpp"
#include "core/logging.hpp"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

const char* to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::Idle:         return "idle";
        case SupervisorState::Starting:     return "starting";
        case SupervisorState::Running:      return "running";
        case SupervisorState::BackingOff:   return "backing-off";
        case SupervisorState::ShuttingDown: return "shutting-down";
        case SupervisorState::Stopped:      return "stopped";
    }
    return "unknown";
}

Supervisor::Supervisor(EngineCommand command, RestartPolicy policy,
                       std::shared_ptr<spdlog::logger> logger)
    : command_(std::move(command)),
      policy_(policy),
      logger_(logger ? std::move(logger) : Logging::engine_logger()) {}

Supervisor::~Supervisor() {
    shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────

void Supervisor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (started_ || quit_.is_set()) return;

    started_ = true;
    thread_ = std::thread(&Supervisor::run_loop, this);
}

void Supervisor::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    bool first = false;
    {
        // Held with the spawn section of the loop: once the signal is set
        // under this lock, no new engine can be created.
        std::lock_guard<std::mutex> lock(mutex_);
        if (!quit_.is_set()) {
            first = true;
            quit_.fire();
        }
    }

    if (first) {
        logger_->info("Shutdown requested");
        set_state(SupervisorState::ShuttingDown);
    }

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }

    set_state(SupervisorState::Stopped);
}

void Supervisor::clear_listeners() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    on_output = nullptr;
    on_state_change = nullptr;
}

void Supervisor::notify_window_hidden() {
    logger_->info("Window hidden, engine keeps running in the background");
}

// ── State ───────────────────────────────────────────────────

SupervisorState Supervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<ExitStatus> Supervisor::last_exit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_exit_;
}

bool Supervisor::wait_for_state(SupervisorState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [&] { return state_ == target; });
}

void Supervisor::set_state(SupervisorState next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == next || state_ == SupervisorState::Stopped) return;
        // Shutdown is one-way: only Stopped may follow it
        if (state_ == SupervisorState::ShuttingDown && next != SupervisorState::Stopped) return;
        state_ = next;
    }
    state_cv_.notify_all();
    logger_->debug("Supervisor state: {}", to_string(next));

    std::lock_guard<std::mutex> listeners(listener_mutex_);
    if (on_state_change) {
        try {
            on_state_change(next);
        } catch (const std::exception& e) {
            logger_->error("State listener failed: {}", e.what());
        }
    }
}

void Supervisor::record_exit(const ExitStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_exit_ = status;
}

std::string Supervisor::describe_command() const {
    std::string cmd = command_.binary;
    for (const auto& arg : command_.args) {
        cmd += " " + arg;
    }
    return cmd;
}

// ── Main loop ───────────────────────────────────────────────

void Supervisor::run_loop() {
    while (!quit_.is_set()) {
        set_state(SupervisorState::Starting);

        ChildProcess child(command_);
        if (!spawn_child(child)) {
            if (quit_.is_set()) break;
            consecutive_failures_++;
            if (!may_retry() || !back_off(FailureKind::SpawnFailure)) break;
            continue;
        }

        set_state(SupervisorState::Running);
        auto started_at = std::chrono::steady_clock::now();

        if (!pump_output(child)) {
            // Quit arrived while the engine was running
            stop_child(child);
            break;
        }

        ExitStatus status = reap_child(child);

        if (quit_.is_set()) {
            logger_->info("Engine exited during shutdown ({})", status.describe());
            break;
        }

        auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);
        if (policy_.is_stable_run(uptime)) {
            consecutive_failures_.store(0);
        }
        consecutive_failures_++;

        logger_->warn("Engine exited unexpectedly ({}) after {} ms",
                      status.describe(), uptime.count());
        if (!may_retry() || !back_off(FailureKind::UnexpectedExit)) break;
    }

    set_state(SupervisorState::Stopped);
}

bool Supervisor::spawn_child(ChildProcess& child) {
    std::string err;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (quit_.is_set()) return false;

        int attempt = ++attempts_;
        if (attempt == 1) {
            logger_->info("Starting engine: {}", describe_command());
        } else {
            logger_->info("Restarting engine: {} (attempt {})", describe_command(), attempt);
        }

        if (child.spawn(err)) {
            child_pid_.store(child.pid());
            spawn_count_++;
            logger_->info("Engine started with PID {}", child.pid());
            return true;
        }
    }

    logger_->error("Failed to spawn engine: {}", err);
    return false;
}

bool Supervisor::may_retry() {
    int failures = consecutive_failures_.load();
    if (policy_.allows_retry(failures)) return true;
    logger_->error("Engine failed {} times in a row, giving up", failures);
    return false;
}

bool Supervisor::back_off(FailureKind kind) {
    set_state(SupervisorState::BackingOff);

    auto delay = policy_.delay_for(kind);
    logger_->info("Next engine start in {} ms", delay.count());

    // False when the quit signal cut the delay short
    return !quit_.wait_for(delay);
}

// ── Output ──────────────────────────────────────────────────

bool Supervisor::pump_output(ChildProcess& child) {
    LineSplitter splitter;
    char buf[4096];

    struct pollfd fds[2];
    fds[0].fd = child.stdout_fd();
    fds[0].events = POLLIN;
    fds[1].fd = quit_.fd();
    fds[1].events = POLLIN;

    while (true) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            logger_->error("Waiting for engine output failed: {}", std::strerror(errno));
            return !quit_.is_set();
        }

        if (fds[1].revents & POLLIN) {
            return false;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(fds[0].fd, buf, sizeof(buf));
            if (n > 0) {
                for (const auto& line : splitter.feed(buf, static_cast<std::size_t>(n))) {
                    emit_line(line);
                }
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n < 0) {
                logger_->error("Reading engine output failed: {}", std::strerror(errno));
            }

            // End of stream: the engine is gone (or closed its stdout)
            for (const auto& line : splitter.finish()) {
                emit_line(line);
            }
            child.close_stdout();
            return true;
        }
    }
}

void Supervisor::emit_line(const std::string& line) {
    logger_->info("{}", line);

    std::lock_guard<std::mutex> listeners(listener_mutex_);
    if (on_output) {
        try {
            on_output(line);
        } catch (const std::exception& e) {
            logger_->error("Output listener failed: {}", e.what());
        }
    }
}

// ── Termination ─────────────────────────────────────────────

ExitStatus Supervisor::reap_child(ChildProcess& child) {
    pid_t pid = child.pid();
    ExitStatus status;

    if (auto st = child.wait_for_exit(policy_.shutdown_grace)) {
        status = *st;
    } else {
        // Closed stdout but kept running: never let two engines coexist
        logger_->warn("Engine PID {} closed its output but is still running, terminating it", pid);
        bool forced = false;
        status = child.terminate(policy_.shutdown_grace, &forced);
        if (forced) {
            logger_->warn("Engine PID {} ignored SIGTERM for {} ms, killed",
                          pid, policy_.shutdown_grace.count());
        }
    }

    child_pid_.store(-1);
    record_exit(status);
    return status;
}

void Supervisor::stop_child(ChildProcess& child) {
    pid_t pid = child.pid();
    logger_->info("Stopping engine PID {}", pid);

    bool forced = false;
    ExitStatus status = child.terminate(policy_.shutdown_grace, &forced);
    if (forced) {
        logger_->warn("Engine PID {} did not stop within {} ms, killed",
                      pid, policy_.shutdown_grace.count());
    } else {
        logger_->info("Engine stopped ({})", status.describe());
    }

    child.close_stdout();
    child_pid_.store(-1);
    record_exit(status);
}
