#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

// ── AppConfig ───────────────────────────────────────────────

EngineCommand AppConfig::engine_command() const {
    EngineCommand cmd;
    cmd.binary = Config::expand_home(engine_binary);
    cmd.args = engine_args;
    cmd.working_dir = Config::expand_home(engine_working_dir);
    cmd.env = engine_env;
    cmd.merge_stderr = engine_merge_stderr;
    return cmd;
}

RestartPolicy AppConfig::restart_policy() const {
    RestartPolicy policy;
    policy.exit_delay = std::chrono::milliseconds(exit_delay_ms);
    policy.spawn_failure_delay = std::chrono::milliseconds(spawn_failure_delay_ms);
    policy.max_attempts = max_attempts;
    policy.reset_after = std::chrono::milliseconds(reset_after_ms);
    policy.shutdown_grace = std::chrono::milliseconds(shutdown_grace_ms);
    return policy;
}

// ── Paths ───────────────────────────────────────────────────

std::string Config::config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/engine-host";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/engine-host";
}

std::string Config::default_config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_socket_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/engine-host.sock";
}

std::string Config::socket_path() const {
    if (!config_.socket_path.empty()) {
        return expand_home(config_.socket_path);
    }
    return default_socket_path();
}

// ── Load / save ─────────────────────────────────────────────

Config::Config() : path_(default_config_path()) {}

Config::Config(std::string path) : path_(expand_home(path)) {}

Config::~Config() = default;

void Config::sanitize() {
    const AppConfig defaults;
    if (config_.exit_delay_ms < 0) config_.exit_delay_ms = defaults.exit_delay_ms;
    if (config_.spawn_failure_delay_ms < 0) config_.spawn_failure_delay_ms = defaults.spawn_failure_delay_ms;
    if (config_.max_attempts < 0) config_.max_attempts = defaults.max_attempts;
    if (config_.reset_after_ms < 0) config_.reset_after_ms = defaults.reset_after_ms;
    if (config_.shutdown_grace_ms < 0) config_.shutdown_grace_ms = defaults.shutdown_grace_ms;
    if (config_.health.interval_ms <= 0) config_.health.interval_ms = defaults.health.interval_ms;
    if (config_.health.max_checks < 0) config_.health.max_checks = defaults.health.max_checks;
    if (config_.health.timeout_ms <= 0) config_.health.timeout_ms = defaults.health.timeout_ms;
    if (config_.health.port <= 0 || config_.health.port > 65535) config_.health.port = defaults.health.port;
    if (config_.logging.max_files == 0) config_.logging.max_files = defaults.logging.max_files;
    if (config_.logging.max_file_bytes == 0) config_.logging.max_file_bytes = defaults.logging.max_file_bytes;
}

bool Config::load() {
    last_error_.clear();
    if (path_.empty() || !fs::exists(path_)) {
        return false;
    }

    AppConfig loaded = config_;
    try {
        YAML::Node root = YAML::LoadFile(path_);

        // Engine section
        if (auto engine = root["engine"]) {
            loaded.engine_binary = engine["binary"].as<std::string>(loaded.engine_binary);
            if (auto args = engine["args"]) {
                loaded.engine_args = args.as<std::vector<std::string>>();
            }
            loaded.engine_working_dir = engine["working_dir"].as<std::string>(loaded.engine_working_dir);
            if (auto env = engine["env"]) {
                loaded.engine_env = env.as<std::map<std::string, std::string>>();
            }
            loaded.engine_merge_stderr = engine["merge_stderr"].as<bool>(loaded.engine_merge_stderr);
        }

        // Restart section
        if (auto restart = root["restart"]) {
            loaded.exit_delay_ms = restart["exit_delay_ms"].as<int>(loaded.exit_delay_ms);
            loaded.spawn_failure_delay_ms =
                restart["spawn_failure_delay_ms"].as<int>(loaded.spawn_failure_delay_ms);
            loaded.max_attempts = restart["max_attempts"].as<int>(loaded.max_attempts);
            loaded.reset_after_ms = restart["reset_after_ms"].as<int>(loaded.reset_after_ms);
            loaded.shutdown_grace_ms = restart["shutdown_grace_ms"].as<int>(loaded.shutdown_grace_ms);
        }

        // Health section
        if (auto health = root["health"]) {
            loaded.health.enabled = health["enabled"].as<bool>(loaded.health.enabled);
            loaded.health.host = health["host"].as<std::string>(loaded.health.host);
            loaded.health.port = health["port"].as<int>(loaded.health.port);
            loaded.health.path = health["path"].as<std::string>(loaded.health.path);
            loaded.health.interval_ms = health["interval_ms"].as<int>(loaded.health.interval_ms);
            loaded.health.max_checks = health["max_checks"].as<int>(loaded.health.max_checks);
            loaded.health.timeout_ms = health["timeout_ms"].as<int>(loaded.health.timeout_ms);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            loaded.logging.level = logging["level"].as<std::string>(loaded.logging.level);
            loaded.logging.file = logging["file"].as<std::string>(loaded.logging.file);
            loaded.logging.max_file_bytes =
                logging["max_file_bytes"].as<std::size_t>(loaded.logging.max_file_bytes);
            loaded.logging.max_files = logging["max_files"].as<std::size_t>(loaded.logging.max_files);
            loaded.logging.pattern = logging["pattern"].as<std::string>(loaded.logging.pattern);
        }

        // Host section
        if (auto host = root["host"]) {
            loaded.socket_path = host["socket_path"].as<std::string>(loaded.socket_path);
        }
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        last_error_ = e.what();
        return false;
    }

    config_ = std::move(loaded);
    sanitize();
    return true;
}

bool Config::save() {
    if (path_.empty()) return false;

    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Engine section
        out << YAML::Key << "engine" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "binary" << YAML::Value << config_.engine_binary;
        out << YAML::Key << "args" << YAML::Value << YAML::Flow << config_.engine_args;
        out << YAML::Key << "working_dir" << YAML::Value << config_.engine_working_dir;
        out << YAML::Key << "env" << YAML::Value << config_.engine_env;
        out << YAML::Key << "merge_stderr" << YAML::Value << config_.engine_merge_stderr;
        out << YAML::EndMap;

        // Restart section
        out << YAML::Key << "restart" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "exit_delay_ms" << YAML::Value << config_.exit_delay_ms;
        out << YAML::Key << "spawn_failure_delay_ms" << YAML::Value << config_.spawn_failure_delay_ms;
        out << YAML::Key << "max_attempts" << YAML::Value << config_.max_attempts;
        out << YAML::Key << "reset_after_ms" << YAML::Value << config_.reset_after_ms;
        out << YAML::Key << "shutdown_grace_ms" << YAML::Value << config_.shutdown_grace_ms;
        out << YAML::EndMap;

        // Health section
        out << YAML::Key << "health" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.health.enabled;
        out << YAML::Key << "host" << YAML::Value << config_.health.host;
        out << YAML::Key << "port" << YAML::Value << config_.health.port;
        out << YAML::Key << "path" << YAML::Value << config_.health.path;
        out << YAML::Key << "interval_ms" << YAML::Value << config_.health.interval_ms;
        out << YAML::Key << "max_checks" << YAML::Value << config_.health.max_checks;
        out << YAML::Key << "timeout_ms" << YAML::Value << config_.health.timeout_ms;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.logging.level;
        out << YAML::Key << "file" << YAML::Value << config_.logging.file;
        out << YAML::Key << "max_file_bytes" << YAML::Value << config_.logging.max_file_bytes;
        out << YAML::Key << "max_files" << YAML::Value << config_.logging.max_files;
        out << YAML::Key << "pattern" << YAML::Value << config_.logging.pattern;
        out << YAML::EndMap;

        // Host section
        out << YAML::Key << "host" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "socket_path" << YAML::Value << config_.socket_path;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path_);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
