#pragma once

#include <string>

class CLI {
public:
    static constexpr int kOpenWindow = -1;
    static constexpr int kRunDaemon = -2;

    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, kOpenWindow if no subcommand (caller opens the
    /// terminal window) or kRunDaemon for `daemon`.
    static int run(int argc, char* argv[]);

    /// Value of --config / -c, or empty for the default location
    static std::string config_path_arg(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(const std::string& config_path);
    static int cmd_quit(const std::string& config_path);
    static int cmd_hide(const std::string& config_path);
    static int cmd_init_config(const std::string& config_path);

    /// First argument that is neither an option nor an option's value
    static const char* subcommand(int argc, char* argv[]);
};
