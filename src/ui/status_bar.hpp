#pragma once

#include <ftxui/component/component.hpp>
#include <string>
#include <mutex>
#include <atomic>

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_engine(const std::string& engine);
    void set_state(const std::string& state);
    void set_pid(int pid);
    void set_spawn_count(int count);
    void set_ready(bool ready);
    void add_output_line();

    /// "12 lines", "1.2k lines", ...
    static std::string format_count(long count);

private:
    std::mutex mutex_;
    std::string engine_;
    std::string state_ = "idle";
    std::atomic<int> pid_{-1};
    std::atomic<int> spawn_count_{0};
    std::atomic<bool> ready_{false};
    std::atomic<long> line_count_{0};
};
