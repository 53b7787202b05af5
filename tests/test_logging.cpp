#include <gtest/gtest.h>
#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class LoggingTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("engine-host-test-log-" + std::to_string(getpid()));
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        spdlog::drop(Logging::kEngineLogger);
        fs::remove_all(test_dir);
    }
};

TEST_F(LoggingTest, ParseLevel) {
    EXPECT_EQ(Logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(Logging::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(Logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(Logging::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(Logging::parse_level("chatty"), spdlog::level::info);
    EXPECT_EQ(Logging::parse_level(""), spdlog::level::info);
}

TEST_F(LoggingTest, EngineLoggerCreatedOnDemand) {
    auto logger = Logging::engine_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "ENGINE");
    EXPECT_EQ(Logging::engine_logger(), logger);
}

TEST_F(LoggingTest, FileSinkWritesTaggedRecords) {
    LogSettings settings;
    settings.file = test_dir + "/logs/engine-host.log";

    auto logger = Logging::init(settings, false);
    EXPECT_EQ(Logging::engine_logger(), logger);

    logger->info("Uvicorn running on http://127.0.0.1:8234");
    logger->flush();

    std::string content = slurp(settings.file);
    EXPECT_NE(content.find("[ENGINE]"), std::string::npos);
    EXPECT_NE(content.find("Uvicorn running on http://127.0.0.1:8234"), std::string::npos);
}

TEST_F(LoggingTest, LevelFiltersRecords) {
    LogSettings settings;
    settings.file = test_dir + "/level.log";
    settings.level = "warn";

    auto logger = Logging::init(settings, false);
    logger->info("quiet line");
    logger->warn("loud line");
    logger->flush();

    std::string content = slurp(settings.file);
    EXPECT_EQ(content.find("quiet line"), std::string::npos);
    EXPECT_NE(content.find("loud line"), std::string::npos);
}

TEST_F(LoggingTest, CustomPattern) {
    LogSettings settings;
    settings.file = test_dir + "/pattern.log";
    settings.pattern = "<%n> %v";

    auto logger = Logging::init(settings, false);
    logger->info("hello");
    logger->flush();

    EXPECT_EQ(slurp(settings.file), "<ENGINE> hello\n");
}

TEST_F(LoggingTest, ReinitReplacesLogger) {
    LogSettings settings;
    auto first = Logging::init(settings, false);
    auto second = Logging::init(settings, false);
    EXPECT_NE(first, second);
    EXPECT_EQ(Logging::engine_logger(), second);
}

TEST_F(LoggingTest, CallbackSinkDeliversText) {
    std::vector<std::pair<spdlog::level::level_enum, std::string>> got;
    auto sink = std::make_shared<CallbackSinkMt>(
        [&](spdlog::level::level_enum level, const std::string& text) {
            got.emplace_back(level, text);
        });
    sink->set_pattern("[%n] %v");

    spdlog::logger logger("ENGINE", sink);
    logger.warn("port busy");

    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].first, spdlog::level::warn);
    EXPECT_EQ(got[0].second, "[ENGINE] port busy");

    sink->set_callback(nullptr);
    logger.warn("dropped");
    EXPECT_EQ(got.size(), 1u);
}

TEST_F(LoggingTest, AddSinkReceivesEngineRecords) {
    LogSettings settings;
    auto logger = Logging::init(settings, false);

    std::vector<std::string> got;
    auto sink = std::make_shared<CallbackSinkMt>(
        [&](spdlog::level::level_enum, const std::string& text) { got.push_back(text); });
    sink->set_pattern("%v");
    Logging::add_sink(sink);

    logger->info("from engine");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "from engine");
}
