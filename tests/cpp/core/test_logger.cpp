#include "logging/logger.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace segue::logging;

class LoggerTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "logger";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("segue_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        // Back to a console-only logger so later suites do not write here.
        initialize(LogConfig{});
        fs::remove_all(tempDir);
    }
};

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(stringToLevel(levelToString(level)), level);
    }
}

TEST_F(LoggerTest, LevelAliasesAndUnknownNames) {
    EXPECT_EQ(stringToLevel("WARNING"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("err"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(stringToLevel("verbose"), LogLevel::Info);
}

TEST_F(LoggerTest, ParseLogConfigSkipsWronglyTypedFields) {
    LogConfig config;
    ASSERT_TRUE(parseLogConfig(R"({"level": "debug", "maxBackups": "many",
                                   "consoleOutput": false})",
                               config));
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.maxBackups, LogConfig{}.maxBackups);
    EXPECT_FALSE(config.consoleOutput);
}

TEST_F(LoggerTest, ParseLogConfigRejectsNonObjects) {
    LogConfig config;
    EXPECT_FALSE(parseLogConfig("[1, 2]", config));
    EXPECT_FALSE(parseLogConfig("{not json", config));
}

TEST_F(LoggerTest, FileSinkReceivesMessages) {
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = (tempDir / "segue.log").string();
    ASSERT_TRUE(initialize(config));

    LOG_WARN("file sink check {}", 42);
    flush();

    std::ifstream file(config.filePath);
    ASSERT_TRUE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("file sink check 42"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelIsReflectedByGetLevel) {
    ASSERT_TRUE(initialize(LogConfig{}));
    setLevel(LogLevel::Error);
    EXPECT_EQ(getLevel(), LogLevel::Error);
    setLevel(LogLevel::Info);
    EXPECT_EQ(getLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, InitializeFromConfigFallsBackOnMissingFile) {
    EXPECT_TRUE(initializeFromConfig((tempDir / "missing.json").string()));
    EXPECT_EQ(getLevel(), LogLevel::Info);
}
