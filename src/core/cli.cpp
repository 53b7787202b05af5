#include "core/cli.hpp"
#include "core/config.hpp"
#include "host/host_client.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

static Config make_config(const std::string& config_path) {
    Config config = config_path.empty() ? Config() : Config(config_path);
    config.load();
    return config;
}

// ── Argument helpers ────────────────────────────────────────

std::string CLI::config_path_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) {
            if (i + 1 < argc) return argv[i + 1];
            return "";
        }
        if (std::strncmp(argv[i], "--config=", 9) == 0) {
            return argv[i] + 9;
        }
    }
    return "";
}

const char* CLI::subcommand(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) {
            ++i;  // skip the value
            continue;
        }
        if (std::strncmp(argv[i], "--config=", 9) == 0) continue;
        return argv[i];
    }
    return nullptr;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) && i + 1 >= argc) {
            std::cerr << "Missing value for " << argv[i] << "\n";
            return 1;
        }
    }

    const char* cmd = subcommand(argc, argv);
    if (!cmd) return kOpenWindow;  // no subcommand → open the window

    std::string config_path = config_path_arg(argc, argv);

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return kRunDaemon;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status(config_path);
    }
    if (std::strcmp(cmd, "quit") == 0) {
        return cmd_quit(config_path);
    }
    if (std::strcmp(cmd, "hide") == 0) {
        return cmd_hide(config_path);
    }
    if (std::strcmp(cmd, "init-config") == 0) {
        return cmd_init_config(config_path);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'engine-host help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "engine-host — keeps the backend engine running next to the desktop app\n"
        "\n"
        "Usage:\n"
        "  engine-host                 Open the terminal window (default)\n"
        "  engine-host daemon          Run headless\n"
        "  engine-host status          Show engine and supervisor status\n"
        "  engine-host quit            Quit a running host (stops the engine)\n"
        "  engine-host hide            Close the window of a running host\n"
        "  engine-host init-config     Write the default config file\n"
        "  engine-host version         Show version\n"
        "  engine-host help            Show this help\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>         Config file (default: ~/.config/engine-host/config.yaml)\n"
        "\n"
        "Keyboard shortcuts (window):\n"
        "  Q           Quit (stops the engine)\n"
        "  Esc         Close the window, keep the engine running\n"
        "  F           Freeze/unfreeze output\n"
        "  X           Export output to a file\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "engine-host " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(const std::string& config_path) {
    Config config = make_config(config_path);
    HostClient client(config.socket_path());

    auto status = client.get_status();
    if (!status.reachable) {
        std::cout << "engine-host:  not running\n";
        return 1;
    }

    std::cout << "engine-host:  running\n";
    std::cout << "engine:       " << status.engine << "\n";
    std::cout << "state:        " << status.state << "\n";
    if (status.engine_pid > 0) {
        std::cout << "pid:          " << status.engine_pid << "\n";
    }
    std::cout << "starts:       " << status.spawn_count << "\n";
    std::cout << "failures:     " << status.consecutive_failures << " in a row\n";
    std::cout << "ready:        " << (status.engine_ready ? "yes" : "no") << "\n";
    std::cout << "window:       " << (status.window_visible ? "visible" : "hidden") << "\n";
    if (!status.last_exit.empty()) {
        std::cout << "last exit:    " << status.last_exit << "\n";
    }
    return 0;
}

// ── quit / hide ─────────────────────────────────────────────

int CLI::cmd_quit(const std::string& config_path) {
    Config config = make_config(config_path);
    HostClient client(config.socket_path());

    std::string err;
    if (!client.request_quit(err)) {
        std::cerr << "quit failed: " << err << "\n";
        return 1;
    }
    std::cout << "engine-host is shutting down\n";
    return 0;
}

int CLI::cmd_hide(const std::string& config_path) {
    Config config = make_config(config_path);
    HostClient client(config.socket_path());

    std::string err;
    if (!client.request_window_close(err)) {
        std::cerr << "hide failed: " << err << "\n";
        return 1;
    }
    return 0;
}

// ── init-config ─────────────────────────────────────────────

int CLI::cmd_init_config(const std::string& config_path) {
    Config config = config_path.empty() ? Config() : Config(config_path);
    if (config.path().empty()) {
        std::cerr << "Cannot determine config location (HOME not set)\n";
        return 1;
    }
    if (fs::exists(config.path())) {
        std::cerr << config.path() << " already exists\n";
        return 1;
    }
    if (!config.save()) {
        std::cerr << "Failed to write " << config.path() << "\n";
        return 1;
    }
    std::cout << "Wrote " << config.path() << "\n";
    return 0;
}
