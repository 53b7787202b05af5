#include "app.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "host/host.hpp"
#include "ui/output_panel.hpp"
#include "ui/status_bar.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace ftxui;

struct App::Impl {
    Host& host;
    OutputPanel output_panel;
    StatusBar status_bar;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    // Records go to the panel while the window is open, to stderr after
    std::atomic<bool> window_open{false};
    std::shared_ptr<CallbackSinkMt> sink;

    // Background refresh
    std::atomic<bool> stop_flag{false};
    std::thread status_thread;

    explicit Impl(Host& h) : host(h) {}

    void setup_sink() {
        sink = std::make_shared<CallbackSinkMt>(
            [this](spdlog::level::level_enum level, const std::string& text) {
                if (window_open.load()) {
                    output_panel.push({level, text});
                    screen.Post(Event::Custom);
                } else {
                    std::cerr << text << "\n";
                }
            });
        sink->set_pattern("%H:%M:%S [%n] %v");
        Logging::add_sink(sink);
    }

    void setup_callbacks() {
        Supervisor& sup = host.supervisor();
        status_bar.set_engine(sup.command().binary);

        sup.on_output = [this](const std::string& /*line*/) {
            status_bar.add_output_line();
        };
        sup.on_state_change = [this](SupervisorState state) {
            status_bar.set_state(to_string(state));
            if (window_open.load()) {
                screen.Post(Event::Custom);
            }
        };
    }

    void start_status_thread() {
        status_thread = std::thread([this]() {
            while (!stop_flag.load()) {
                const Supervisor& sup = host.supervisor();
                status_bar.set_pid(sup.child_pid());
                status_bar.set_spawn_count(sup.spawn_count());
                status_bar.set_ready(host.engine_ready());

                // Quit from a signal or the control socket, or hide from the socket
                if (host.quit_requested() || !host.window_visible()) {
                    screen.Exit();
                    break;
                }

                screen.Post(Event::Custom);

                // Sleep 250ms, checking stop_flag every 50ms
                for (int i = 0; i < 5 && !stop_flag.load(); ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
            }
        });
    }

    void stop_status_thread() {
        stop_flag.store(true);
        if (status_thread.joinable()) {
            status_thread.join();
        }
    }

    Component build() {
        auto panel = output_panel.component();
        auto bar = status_bar.component();

        auto layout = Renderer(panel, [this, panel, bar] {
            auto header = hbox({
                text(" engine-host ") | bold | color(Color::Cyan),
                separator(),
                text(" " + host.supervisor().command().binary + " ") | dim,
                filler(),
                text(" [Q] quit ") | dim,
                text(" [Esc] close window ") | dim,
            });
            return vbox({
                header,
                panel->Render() | flex,
                bar->Render(),
            });
        });

        return CatchEvent(layout, [this](Event event) -> bool {
            if (event == Event::Character('q') || event == Event::Character('Q')) {
                host.request_quit();
                screen.Exit();
                return true;
            }
            if (event == Event::Escape) {
                host.request_window_close();
                screen.Exit();
                return true;
            }
            return false;
        });
    }
};

App::App(Host& host) : impl_(std::make_unique<Impl>(host)) {
    impl_->setup_sink();
    impl_->setup_callbacks();
}

App::~App() {
    impl_->stop_status_thread();
    impl_->window_open.store(false);
    // The logger and the supervisor outlive the window
    impl_->sink->set_callback(nullptr);
    impl_->host.supervisor().clear_listeners();
}

void App::prepare_config(AppConfig& config) {
    config.engine_merge_stderr = true;
}

void App::run() {
    impl_->host.show_window();
    impl_->window_open.store(true);
    impl_->stop_flag.store(false);
    impl_->start_status_thread();

    impl_->screen.Loop(impl_->build());

    impl_->stop_status_thread();
    impl_->window_open.store(false);

    // Loop ended without q or Esc (Ctrl+C): treat it as quitting the app
    if (impl_->host.window_visible() && !impl_->host.quit_requested()) {
        impl_->host.request_quit();
    }
}
