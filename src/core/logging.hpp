#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct LogSettings;

/// Sink that hands every formatted record to a callback (used by the
/// terminal window to show engine output).
template <typename Mutex>
class CallbackSink : public spdlog::sinks::base_sink<Mutex> {
public:
    using Callback = std::function<void(spdlog::level::level_enum level, const std::string& text)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    /// Replace the callback; an empty one drops records
    void set_callback(Callback cb) {
        std::lock_guard<Mutex> lock(spdlog::sinks::base_sink<Mutex>::mutex_);
        callback_ = std::move(cb);
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        spdlog::sinks::base_sink<Mutex>::formatter_->format(msg, formatted);
        std::string text(formatted.data(), formatted.size());
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        if (callback_) callback_(msg.level, text);
    }

    void flush_() override {}

private:
    Callback callback_;
};

using CallbackSinkMt = CallbackSink<std::mutex>;

class Logging {
public:
    /// Name of the engine logger; shows up as "[ENGINE]" in every record
    static constexpr const char* kEngineLogger = "ENGINE";
    static constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    /// Build the engine logger from settings and register it.
    /// console=false leaves stderr alone (terminal window mode).
    static std::shared_ptr<spdlog::logger> init(const LogSettings& settings, bool console = true);

    /// The registered engine logger, created with a stderr sink on first use
    static std::shared_ptr<spdlog::logger> engine_logger();

    /// Attach an extra sink to the engine logger. spdlog does not guard the
    /// sink list, so call this before any thread starts logging.
    static void add_sink(spdlog::sink_ptr sink);

    /// "debug" → level::debug; unknown names fall back to info
    static spdlog::level::level_enum parse_level(const std::string& name);
};
