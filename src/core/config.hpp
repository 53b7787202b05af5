#pragma once

#include "supervisor/child_process.hpp"
#include "supervisor/restart_policy.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct LogSettings {
    std::string level = "info";
    std::string file;                          // empty = no log file
    std::size_t max_file_bytes = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    std::string pattern;                       // empty = Logging::kDefaultPattern
};

struct HealthSettings {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 8234;
    std::string path = "/api/health";
    int interval_ms = 2000;
    int max_checks = 30;
    int timeout_ms = 3000;
};

struct AppConfig {
    // Engine
    std::string engine_binary = "biodockify-engine";
    std::vector<std::string> engine_args;
    std::string engine_working_dir;
    std::map<std::string, std::string> engine_env;
    bool engine_merge_stderr = false;

    // Restart policy
    int exit_delay_ms = 2000;
    int spawn_failure_delay_ms = 5000;
    int max_attempts = 0;          // 0 = retry forever
    int reset_after_ms = 60000;
    int shutdown_grace_ms = 5000;

    HealthSettings health;
    LogSettings logging;

    // Control socket; empty = Config::default_socket_path()
    std::string socket_path;

    EngineCommand engine_command() const;
    RestartPolicy restart_policy() const;
};

class Config {
public:
    /// Uses Config::default_config_path()
    Config();
    explicit Config(std::string path);
    ~Config();

    /// Returns false (keeping defaults) when the file is missing or malformed
    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    const std::string& path() const { return path_; }

    /// Parse error of the last load(), empty if none
    const std::string& last_error() const { return last_error_; }

    /// Effective control socket path
    std::string socket_path() const;

    static std::string config_dir();
    static std::string default_config_path();
    static std::string default_socket_path();
    static std::string expand_home(const std::string& path);

private:
    std::string path_;
    std::string last_error_;
    AppConfig config_;

    void sanitize();
};
