#pragma once

#include "supervisor/child_process.hpp"
#include "supervisor/lifecycle_signal.hpp"
#include "supervisor/restart_policy.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class SupervisorState {
    Idle,
    Starting,
    Running,
    BackingOff,
    ShuttingDown,
    Stopped,
};

const char* to_string(SupervisorState state);

/// Keeps exactly one engine process alive until the host shuts down.
///
/// All work happens on one background thread: spawn, read the engine's
/// stdout until it closes, reap, wait the restart delay, repeat. The quit
/// signal interrupts both the read and the delay.
class Supervisor {
public:
    Supervisor(EngineCommand command, RestartPolicy policy,
               std::shared_ptr<spdlog::logger> logger = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Launch the background loop. Returns immediately; only the first call
    /// has an effect, and none after shutdown().
    void start();

    /// Stop restarting, terminate the live engine (SIGTERM, then SIGKILL
    /// after the policy's grace period) and join the loop. Idempotent.
    /// When it returns the state is Stopped and no engine is alive.
    void shutdown();

    /// The host window was closed (hidden). The engine keeps running.
    void notify_window_hidden();

    SupervisorState state() const;

    /// PID of the live engine, -1 if none
    pid_t child_pid() const { return child_pid_.load(); }

    /// Number of successful spawns so far
    int spawn_count() const { return spawn_count_.load(); }

    int consecutive_failures() const { return consecutive_failures_.load(); }

    std::optional<ExitStatus> last_exit() const;

    /// Block until the supervisor is in the given state or the timeout elapses
    bool wait_for_state(SupervisorState target, std::chrono::milliseconds timeout) const;

    const RestartPolicy& policy() const { return policy_; }
    const EngineCommand& command() const { return command_; }

    /// Each line of engine output, in order. Called on the supervisor thread;
    /// assign before start().
    std::function<void(const std::string& line)> on_output;

    /// Every state transition. Assign before start().
    std::function<void(SupervisorState state)> on_state_change;

    /// Drop on_output and on_state_change. Safe while the loop runs; once it
    /// returns neither callback is running or will be called again.
    void clear_listeners();

private:
    const EngineCommand command_;
    const RestartPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    mutable std::condition_variable state_cv_;
    SupervisorState state_ = SupervisorState::Idle;
    std::optional<ExitStatus> last_exit_;

    std::atomic<pid_t> child_pid_{-1};
    std::atomic<int> spawn_count_{0};
    std::atomic<int> consecutive_failures_{0};

    int attempts_ = 0;  // loop thread only

    std::mutex listener_mutex_;

    LifecycleSignal quit_;
    std::mutex lifecycle_mutex_;
    bool started_ = false;
    std::thread thread_;

    void run_loop();
    bool spawn_child(ChildProcess& child);
    bool pump_output(ChildProcess& child);
    void emit_line(const std::string& line);
    ExitStatus reap_child(ChildProcess& child);
    void stop_child(ChildProcess& child);
    bool back_off(FailureKind kind);
    bool may_retry();
    void record_exit(const ExitStatus& status);
    void set_state(SupervisorState next);
    std::string describe_command() const;
};
