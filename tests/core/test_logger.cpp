#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "trend_engine/core/logger.hpp"

using namespace trend_engine;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        test_dir_ = std::filesystem::temp_directory_path() / "trend_engine_logger_test";
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void TearDown() override {
        Logger::reset_for_tests();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    LoggerConfig file_config(LogLevel level) const {
        LoggerConfig config;
        config.min_level = level;
        config.destination = LogDestination::FILE;
        config.log_directory = test_dir_.string();
        config.filename_prefix = "test_log";
        return config;
    }

    static std::string read_file(const std::string& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path test_dir_;
};

TEST_F(LoggerTest, NotInitializedByDefault) {
    EXPECT_FALSE(Logger::instance().is_initialized());
    // Logging before initialize must not throw
    EXPECT_NO_THROW(INFO("message before initialize"));
}

TEST_F(LoggerTest, WritesToFile) {
    Logger::instance().initialize(file_config(LogLevel::DEBUG));
    ASSERT_TRUE(Logger::instance().is_initialized());

    Logger::register_component("LoggerTest");
    INFO("entry accepted for " << "AAA");
    DEBUG("signal detail");

    const std::string path = Logger::instance().current_file();
    ASSERT_FALSE(path.empty());
    const std::string contents = read_file(path);
    EXPECT_NE(contents.find("[INFO] [LoggerTest] entry accepted for AAA"), std::string::npos);
    EXPECT_NE(contents.find("[DEBUG]"), std::string::npos);
    Logger::register_component("");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::instance().initialize(file_config(LogLevel::WARNING));

    INFO("should not appear");
    WARN("rejected: insufficient buying power");

    const std::string contents = read_file(Logger::instance().current_file());
    EXPECT_EQ(contents.find("should not appear"), std::string::npos);
    EXPECT_NE(contents.find("rejected: insufficient buying power"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelAtRuntime) {
    Logger::instance().initialize(file_config(LogLevel::ERR));
    Logger::instance().set_level(LogLevel::TRACE);
    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::TRACE);

    TRACE("per-bar detail");
    EXPECT_NE(read_file(Logger::instance().current_file()).find("per-bar detail"),
              std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileIsFull) {
    auto config = file_config(LogLevel::INFO);
    config.max_file_size = 256;
    config.max_files = 3;
    Logger::instance().initialize(config);

    const std::string first = Logger::instance().current_file();
    for (int i = 0; i < 50; ++i) {
        INFO("progress line " << i << " with some padding to fill the file quickly");
    }
    EXPECT_NE(Logger::instance().current_file(), first);

    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir_)) {
        if (entry.path().extension() == ".log") {
            ++files;
        }
    }
    EXPECT_LE(files, config.max_files);
}

TEST_F(LoggerTest, LevelStrings) {
    EXPECT_EQ(level_from_string("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(level_from_string("ERROR"), LogLevel::ERR);
    EXPECT_EQ(level_from_string("bogus", LogLevel::WARNING), LogLevel::WARNING);
    EXPECT_EQ(level_to_string(LogLevel::WARNING), "WARNING");
}

TEST_F(LoggerTest, ConfigRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "bt";

    LoggerConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "bt");
}
