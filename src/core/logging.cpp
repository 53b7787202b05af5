#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static std::mutex g_logging_mutex;

spdlog::level::level_enum Logging::parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

std::shared_ptr<spdlog::logger> Logging::init(const LogSettings& settings, bool console) {
    std::lock_guard<std::mutex> lock(g_logging_mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    std::string file = Config::expand_home(settings.file);
    if (!file.empty()) {
        try {
            fs::path parent = fs::path(file).parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, settings.max_file_bytes, settings.max_files));
        } catch (const std::exception& e) {
            // Logging must never keep the host from starting
            std::cerr << "engine-host: cannot open log file " << file << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kEngineLogger, sinks.begin(), sinks.end());
    logger->set_pattern(settings.pattern.empty() ? kDefaultPattern : settings.pattern);
    logger->set_level(parse_level(settings.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kEngineLogger);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> Logging::engine_logger() {
    std::lock_guard<std::mutex> lock(g_logging_mutex);

    auto logger = spdlog::get(kEngineLogger);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kEngineLogger);
        logger->set_pattern(kDefaultPattern);
    }
    return logger;
}

void Logging::add_sink(spdlog::sink_ptr sink) {
    auto logger = engine_logger();
    std::lock_guard<std::mutex> lock(g_logging_mutex);
    logger->sinks().push_back(std::move(sink));
}
