#include "ui/status_bar.hpp"

#include <ftxui/dom/elements.hpp>
#include <sstream>
#include <iomanip>

using namespace ftxui;

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_engine(const std::string& engine) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = engine;
}

void StatusBar::set_state(const std::string& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void StatusBar::set_pid(int pid) {
    pid_.store(pid);
}

void StatusBar::set_spawn_count(int count) {
    spawn_count_.store(count);
}

void StatusBar::set_ready(bool ready) {
    ready_.store(ready);
}

void StatusBar::add_output_line() {
    line_count_++;
}

std::string StatusBar::format_count(long count) {
    std::ostringstream oss;
    if (count < 1000) {
        oss << count << (count == 1 ? " line" : " lines");
    } else if (count < 1000 * 1000) {
        oss << std::fixed << std::setprecision(1) << (double)count / 1000.0 << "k lines";
    } else {
        oss << std::fixed << std::setprecision(1) << (double)count / 1000000.0 << "M lines";
    }
    return oss.str();
}

Component StatusBar::component() {
    return Renderer([this] {
        std::string engine, state;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            engine = engine_;
            state = state_;
        }
        int pid = pid_.load();
        int starts = spawn_count_.load();
        bool ready = ready_.load();

        // Left: supervisor state
        Color state_color = Color::White;
        if (state == "running") state_color = Color::Green;
        else if (state == "backing-off") state_color = Color::Yellow;
        else if (state == "stopped" || state == "shutting-down") state_color = Color::Red;
        auto state_text = text(" " + state + " ") | bold | color(state_color);

        // Center: engine, pid, restarts, output volume
        std::string stats = engine;
        if (pid > 0) stats += "  pid " + std::to_string(pid);
        if (starts > 1) stats += "  restarts " + std::to_string(starts - 1);
        stats += "  " + format_count(line_count_.load());
        auto center_text = text(stats);

        // Right: readiness
        auto ready_text = ready
            ? text(" ● ready ") | color(Color::Green)
            : text(" ○ not ready ") | color(Color::GrayLight);

        return hbox({
            state_text,
            filler(),
            center_text,
            filler(),
            ready_text,
        }) | inverted;
    });
}
