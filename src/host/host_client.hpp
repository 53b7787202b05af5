#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

/// Client side of the host control socket (used by the CLI)
class HostClient {
public:
    explicit HostClient(std::string socket_path);

    /// Check if a host is running (socket exists and responds)
    bool is_host_running();

    struct HostStatus {
        bool reachable = false;
        std::string state;
        std::string engine;
        int engine_pid = -1;
        int spawn_count = 0;
        int consecutive_failures = 0;
        bool engine_ready = false;
        bool window_visible = false;
        std::string last_exit;
    };

    /// Get host status
    HostStatus get_status();

    /// Ask the host to quit (stops the engine for good)
    bool request_quit(std::string& err);

    /// Ask the host to hide its window (the engine keeps running)
    bool request_window_close(std::string& err);

private:
    std::string socket_path_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

    bool simple_command(const char* name, std::string& err);
};
