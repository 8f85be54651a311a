// tests/logging_test.cpp
// Logger level resolution from STITCH_LOG_LEVEL.

#include <gtest/gtest.h>
#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

using namespace stitch;

TEST(LoggingTest, KnownLevelNames) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("info"), spdlog::level::info);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
}

TEST(LoggingTest, UnknownLevelFallsBackToWarn) {
    EXPECT_EQ(logging::parse_level("verbose"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("Debug"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level(""), spdlog::level::warn);
}

TEST(LoggingTest, MisspelledEnvironmentLevelKeepsLogging) {
    setenv("STITCH_LOG_LEVEL", "eror", 1);
    spdlog::drop(logging::LOGGER_NAME);

    auto logger = logging::get();
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_TRUE(logger->should_log(spdlog::level::err));

    spdlog::drop(logging::LOGGER_NAME);
    unsetenv("STITCH_LOG_LEVEL");
}

TEST(LoggingTest, ReusesRegisteredLogger) {
    spdlog::drop(logging::LOGGER_NAME);
    auto mine = spdlog::stdout_color_mt(logging::LOGGER_NAME);
    EXPECT_EQ(logging::get(), mine);
    spdlog::drop(logging::LOGGER_NAME);
}
