#include "host/host.hpp"
#include "api/engine_client.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

Host::Host(Config& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      logger_(logger ? std::move(logger) : Logging::engine_logger()) {
    supervisor_ = std::make_unique<Supervisor>(
        config_.data().engine_command(),
        config_.data().restart_policy(),
        logger_);
}

Host::~Host() {
    stop();
}

std::string Host::socket_path() const {
    return config_.socket_path();
}

// ── Lifecycle ───────────────────────────────────────────────

void Host::start() {
    if (started_.exchange(true)) return;

    // 1. Control socket (optional: the engine matters more than the socket)
    if (start_ipc_server()) {
        ipc_thread_ = std::thread(&Host::ipc_loop, this);
    } else {
        logger_->warn("Control socket unavailable at {}, continuing without it", socket_path());
    }

    // 2. Engine supervisor, fire and forget
    supervisor_->start();

    // 3. Readiness watcher
    if (config_.data().health.enabled) {
        health_thread_ = std::thread(&Host::health_loop, this);
    }
}

void Host::wait() {
    quit_.wait();
}

void Host::stop() {
    if (stopped_.exchange(true)) return;

    quit_.fire();
    supervisor_->shutdown();

    if (ipc_thread_.joinable()) {
        ipc_thread_.join();
    }
    if (health_thread_.joinable()) {
        health_thread_.join();
    }
    cleanup_socket();
}

int Host::run() {
    start();
    wait();
    logger_->info("Application quit requested");
    stop();
    return 0;
}

void Host::request_quit() {
    quit_.fire();
}

void Host::show_window() {
    window_visible_.store(true);
}

void Host::request_window_close() {
    if (window_visible_.exchange(false)) {
        supervisor_->notify_window_hidden();
    }
}

// ── IPC ─────────────────────────────────────────────────────

void Host::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Host::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    if (path.size() >= sizeof(addr.sun_path)) {
        logger_->warn("Control socket path too long: {}", path);
        return false;
    }

    // Ensure directory exists
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        logger_->warn("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    // Clean up a stale socket from a previous run
    unlink(path.c_str());

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) return false;

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        logger_->warn("bind({}) failed: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    logger_->debug("Control socket listening on {}", path);
    return true;
}

void Host::ipc_loop() {
    struct pollfd fds[2];
    fds[0].fd = socket_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = quit_.fd();
    fds[1].events = POLLIN;

    while (!quit_.is_set()) {
        fds[0].revents = 0;
        fds[1].revents = 0;
        int ret = poll(fds, 2, -1);
        if (ret <= 0) continue;
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLIN) {
            int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            // A silent client must not stall the loop
            struct timeval tv;
            tv.tv_sec = 2;
            tv.tv_usec = 0;
            setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            // Read a single JSON line
            std::string buffer;
            char c;
            while (read(client_fd, &c, 1) == 1) {
                if (c == '\n') break;
                buffer += c;
                if (buffer.size() > 65536) break; // prevent abuse
            }

            if (!buffer.empty()) {
                std::string response = handle_command(buffer);
                response += "\n";
                ssize_t total = 0;
                while (total < (ssize_t)response.size()) {
                    ssize_t n = write(client_fd, response.data() + total,
                                      response.size() - total);
                    if (n <= 0) break;
                    total += n;
                }
            }

            close(client_fd);
        }
    }
}

std::string Host::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            const Supervisor& sup = *supervisor_;
            json data;
            data["state"] = to_string(sup.state());
            data["engine"] = sup.command().binary;
            data["engine_pid"] = sup.child_pid();
            data["spawn_count"] = sup.spawn_count();
            data["consecutive_failures"] = sup.consecutive_failures();
            data["engine_ready"] = engine_ready_.load();
            data["window_visible"] = window_visible_.load();
            auto last = sup.last_exit();
            data["last_exit"] = last ? json(last->describe()) : json(nullptr);
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "quit") {
            logger_->info("Quit requested over control socket");
            request_quit();
            return json({{"ok", true}}).dump();
        }

        if (cmd == "window_close") {
            request_window_close();
            return json({{"ok", true}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const json::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}

// ── Readiness ───────────────────────────────────────────────

void Host::health_loop() {
    const HealthSettings health = config_.data().health;
    EngineClient client(health.host, health.port, health.timeout_ms);

    int generation = 0;
    int checks = 0;
    bool gave_up = false;

    while (!quit_.wait_for(std::chrono::milliseconds(health.interval_ms))) {
        if (supervisor_->state() != SupervisorState::Running) {
            engine_ready_.store(false);
            continue;
        }

        // A new engine process needs to prove itself again
        int current = supervisor_->spawn_count();
        if (current != generation) {
            generation = current;
            checks = 0;
            gave_up = false;
            engine_ready_.store(false);
        }
        if (engine_ready_.load() || gave_up) continue;

        ++checks;
        auto result = client.check_health(health.path);
        if (result.healthy) {
            engine_ready_.store(true);
            logger_->info("Engine is ready (PID {}, after {} check(s))",
                          supervisor_->child_pid(), checks);
        } else if (health.max_checks > 0 && checks >= health.max_checks) {
            gave_up = true;
            logger_->warn("Engine did not answer http://{}:{}{} after {} checks",
                          health.host, health.port, health.path, checks);
        } else {
            logger_->debug("Engine not ready yet: {}",
                           result.error.empty() ? "HTTP " + std::to_string(result.status)
                                                : result.error);
        }
    }
}
