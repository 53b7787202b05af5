#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "host/host.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>
#include <signal.h>

static Host* g_host = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_host) {
        g_host->request_quit();
    }
}

static void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

static Config load_config(int argc, char* argv[]) {
    std::string path = CLI::config_path_arg(argc, argv);
    Config config = path.empty() ? Config() : Config(path);
    config.load();
    return config;
}

static int run_daemon(Config& config) {
    auto logger = Logging::init(config.data().logging, true);
    if (!config.last_error().empty()) {
        logger->error("Ignoring malformed config {}: {}", config.path(), config.last_error());
    }

    Host host(config, logger);
    g_host = &host;
    install_signal_handlers();

    int ret = host.run();
    g_host = nullptr;
    spdlog::shutdown();
    return ret;
}

static int run_window(Config& config) {
    // The window shows the log; stderr would corrupt the screen
    auto logger = Logging::init(config.data().logging, false);
    App::prepare_config(config.data());

    Host host(config, logger);
    App app(host);
    if (!config.last_error().empty()) {
        logger->error("Ignoring malformed config {}: {}", config.path(), config.last_error());
    }

    g_host = &host;
    install_signal_handlers();

    host.start();
    app.run();

    // Window closed or quit: keep supervising until application quit
    host.wait();
    host.stop();
    g_host = nullptr;
    spdlog::shutdown();
    return 0;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);
    if (cli_result != CLI::kOpenWindow && cli_result != CLI::kRunDaemon) {
        // handled by CLI (help, version, status, quit, hide, or error)
        return cli_result;
    }

    Config config = load_config(argc, argv);

    if (cli_result == CLI::kRunDaemon) {
        return run_daemon(config);
    }
    return run_window(config);
}
