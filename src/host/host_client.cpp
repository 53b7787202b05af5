#include "host/host_client.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

HostClient::HostClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

json HostClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = write(fd, msg.data() + total, msg.size() - total);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::exception&) {
        return json();
    }
}

bool HostClient::is_host_running() {
    auto resp = send_command({{"cmd", "status"}});
    return !resp.empty() && resp.value("ok", false);
}

HostClient::HostStatus HostClient::get_status() {
    HostStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    try {
        const auto& data = resp.at("data");
        status.reachable = true;
        status.state = data.value("state", "");
        status.engine = data.value("engine", "");
        status.engine_pid = data.value("engine_pid", -1);
        status.spawn_count = data.value("spawn_count", 0);
        status.consecutive_failures = data.value("consecutive_failures", 0);
        status.engine_ready = data.value("engine_ready", false);
        status.window_visible = data.value("window_visible", false);
        if (data.contains("last_exit") && data["last_exit"].is_string()) {
            status.last_exit = data["last_exit"].get<std::string>();
        }
    } catch (const json::exception&) {
        status.reachable = false;
    }

    return status;
}

bool HostClient::simple_command(const char* name, std::string& err) {
    auto resp = send_command({{"cmd", name}});
    if (resp.empty()) {
        err = "Cannot connect to engine-host";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }
    return true;
}

bool HostClient::request_quit(std::string& err) {
    return simple_command("quit", err);
}

bool HostClient::request_window_close(std::string& err) {
    return simple_command("window_close", err);
}
