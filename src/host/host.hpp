#pragma once

#include "core/config.hpp"
#include "supervisor/lifecycle_signal.hpp"
#include "supervisor/supervisor.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

/// The application host around the engine supervisor.
///
/// Owns the supervisor, a readiness watcher and a local control socket, and
/// turns host lifecycle events into supervisor calls: "application quit"
/// shuts the supervisor down, "window close" only hides the window.
class Host {
public:
    explicit Host(Config& config, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    /// Start the control socket, the supervisor and the readiness watcher.
    /// Does not block.
    void start();

    /// Block until application quit is requested
    void wait();

    /// Shut the supervisor down and release everything. Idempotent.
    void stop();

    /// start(), wait(), stop()
    int run();

    /// Application quit. Async-signal-safe.
    void request_quit();
    bool quit_requested() const { return quit_.is_set(); }

    /// The window became visible (terminal window opened)
    void show_window();

    /// Window close: hide only, the engine keeps running
    void request_window_close();
    bool window_visible() const { return window_visible_.load(); }

    /// The engine answered its health endpoint since it last started
    bool engine_ready() const { return engine_ready_.load(); }

    Supervisor& supervisor() { return *supervisor_; }
    const Supervisor& supervisor() const { return *supervisor_; }

    std::string socket_path() const;

private:
    Config& config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<Supervisor> supervisor_;

    LifecycleSignal quit_;
    std::atomic<bool> window_visible_{false};
    std::atomic<bool> engine_ready_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    // IPC
    int socket_fd_ = -1;
    std::thread ipc_thread_;
    bool start_ipc_server();
    void ipc_loop();
    std::string handle_command(const std::string& json_line);
    void cleanup_socket();

    // Readiness
    std::thread health_thread_;
    void health_loop();
};
