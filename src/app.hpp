#pragma once

#include <memory>

class Host;
struct AppConfig;

/// Terminal window of the host: engine output and supervisor status.
/// Construct before host.start(). Destroying the App detaches it from the
/// host's supervisor and logger.
class App {
public:
    explicit App(Host& host);
    ~App();

    /// Show the window until the user quits (q) or closes it (Esc).
    /// Closing only hides the window; the engine keeps running.
    void run();

    /// Window mode settings: the engine's stderr joins its captured output
    /// so nothing is written over the screen.
    static void prepare_config(AppConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
