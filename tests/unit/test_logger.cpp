#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Bulwark::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    Logger::info("This should not be printed");
    Logger::error("This should be printed");
    Logger::set_level(LOG_ALL);
    EXPECT_TRUE(Logger::level() & LOG_DEBUG);
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("none"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("debug"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("error"), LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("warn"), LOG_WARN | LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("info"), LOG_DEFAULT);
    EXPECT_EQ(Logger::parse_level("bogus"), LOG_DEFAULT);
    EXPECT_FALSE(Logger::parse_level("warn") & LOG_INFO);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::warn("Logging from thread " + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads) t.join();
    Logger::set_level(LOG_DEFAULT);
}
