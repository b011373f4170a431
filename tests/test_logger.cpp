#include <gtest/gtest.h>
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("waypoint-test-logger-" + std::to_string(getpid()));
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        logging::shutdown();
        fs::remove_all(test_dir);
    }

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(logging::level_to_string(logging::LogLevel::Debug), "debug");
    EXPECT_EQ(logging::level_to_string(logging::LogLevel::Warn), "warn");
    EXPECT_EQ(logging::string_to_level("DEBUG"), logging::LogLevel::Debug);
    EXPECT_EQ(logging::string_to_level("warning"), logging::LogLevel::Warn);
    EXPECT_EQ(logging::string_to_level("err"), logging::LogLevel::Error);
    EXPECT_EQ(logging::string_to_level("bogus"), logging::LogLevel::Info);
}

TEST_F(LoggerTest, MacrosAreSafeBeforeInit) {
    logging::shutdown();
    EXPECT_EQ(logging::get_logger(), nullptr);
    LOG_INFO("dropped {}", 1);
    LOG_ERROR("dropped {}", 2);
    EXPECT_EQ(logging::level(), logging::LogLevel::Off);
}

TEST_F(LoggerTest, EarlyInitUsesInfo) {
    ASSERT_TRUE(logging::initialize_early());
    EXPECT_NE(logging::get_logger(), nullptr);
    EXPECT_EQ(logging::level(), logging::LogLevel::Info);
}

TEST_F(LoggerTest, WritesToFileAndCreatesDirectory) {
    logging::LogConfig cfg;
    cfg.level = logging::LogLevel::Debug;
    cfg.console_output = false;
    cfg.file_path = test_dir + "/logs/waypoint.log";
    ASSERT_TRUE(logging::initialize(cfg));

    LOG_DEBUG("debug line {}", 7);
    LOG_WARN("warn line");
    logging::flush();

    std::string content = read_file(cfg.file_path);
    EXPECT_NE(content.find("debug line 7"), std::string::npos);
    EXPECT_NE(content.find("warn line"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    logging::LogConfig cfg;
    cfg.level = logging::LogLevel::Warn;
    cfg.console_output = false;
    cfg.file_path = test_dir + "/filtered.log";
    ASSERT_TRUE(logging::initialize(cfg));

    LOG_INFO("should not appear");
    LOG_ERROR("should appear");
    logging::flush();

    std::string content = read_file(cfg.file_path);
    EXPECT_EQ(content.find("should not appear"), std::string::npos);
    EXPECT_NE(content.find("should appear"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelChangesThreshold) {
    logging::LogConfig cfg;
    cfg.console_output = false;
    cfg.file_path = test_dir + "/level.log";
    ASSERT_TRUE(logging::initialize(cfg));

    logging::set_level(logging::LogLevel::Error);
    EXPECT_EQ(logging::level(), logging::LogLevel::Error);
}

TEST_F(LoggerTest, ReinitializeReplacesSinks) {
    logging::LogConfig cfg;
    cfg.console_output = false;
    cfg.file_path = test_dir + "/first.log";
    ASSERT_TRUE(logging::initialize(cfg));

    cfg.file_path = test_dir + "/second.log";
    ASSERT_TRUE(logging::initialize(cfg));
    LOG_INFO("after reinit");
    logging::flush();

    EXPECT_EQ(read_file(test_dir + "/first.log").find("after reinit"), std::string::npos);
    EXPECT_NE(read_file(test_dir + "/second.log").find("after reinit"), std::string::npos);
}
