// Creative2D Engine Core Tests
// logger_test.cpp - Log level parsing and per-category filtering

#include <gtest/gtest.h>

#include <creative2d/core/logger.hpp>
#include <creative2d/platform/file_io.hpp>

namespace creative2d::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::shutdown();

        LoggerConfig config;
        config.console_level = LogLevel::Warn;
        config.file_output = false;
        Logger::initialize(config);
    }

    void TearDown() override { Logger::shutdown(); }
};

// ============================================================================
// Level Names
// ============================================================================

TEST(LogLevelTest, ParseKnownNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseUnknownName) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error,
                           LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(to_string(level)), level);
    }
}

// ============================================================================
// Logger State
// ============================================================================

TEST_F(LoggerTest, InitializeSetsGlobalLevel) {
    EXPECT_TRUE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);
}

TEST_F(LoggerTest, CategoryLevelFallsBackToGlobal) {
    EXPECT_EQ(Logger::get_category_level(log_category::FLUID), LogLevel::Warn);

    Logger::set_category_level(log_category::FLUID, LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::FLUID), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::COLLISION), LogLevel::Warn);

    Logger::set_global_level(LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::COLLISION), LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::FLUID), LogLevel::Trace);
}

TEST_F(LoggerTest, ShutdownClearsCategories) {
    Logger::set_category_level(log_category::PHYSICS, LogLevel::Debug);
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());

    LoggerConfig config;
    config.file_output = false;
    Logger::initialize(config);
    EXPECT_EQ(Logger::get_category_level(log_category::PHYSICS), LogLevel::Info);
}

TEST_F(LoggerTest, LoggingMacrosDoNotThrow) {
    EXPECT_NO_THROW(CREATIVE2D_LOG_TRACE(log_category::PHYSICS, "filtered {}", 1));
    EXPECT_NO_THROW(CREATIVE2D_LOG_WARN(log_category::PHYSICS, "visible {} {}", "warning", 2.5));
    EXPECT_NO_THROW(Logger::flush());
}

TEST_F(LoggerTest, FileSinkWritesToDirectory) {
    Logger::shutdown();

    auto log_dir = platform::FileSystem::get_temp_directory() / "logger_test";
    LoggerConfig config;
    config.file_output = true;
    config.log_directory = log_dir;
    config.log_filename = "test.log";
    Logger::initialize(config);

    CREATIVE2D_LOG_ERROR(log_category::ENGINE, "written to file");
    Logger::flush();
    Logger::shutdown();

    EXPECT_TRUE(platform::FileSystem::is_file(log_dir / "test.log"));
    platform::FileSystem::remove_all(log_dir);
}

}  // namespace
}  // namespace creative2d::core
