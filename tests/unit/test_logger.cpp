#include <gtest/gtest.h>

#include "Logger.h"
#include "LoggerMacros.h"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>

using namespace ChatCast;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "chatcast_logger_test.log").string();
        std::filesystem::remove(path_);
        auto& logger = Logger::instance();
        logger.setConsoleOutput(false);
        logger.setLogFile(path_);
        logger.setLevel(LogLevel::INFO);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setLevel(LogLevel::INFO);
        logger.setConsoleOutput(true);
        std::filesystem::remove(path_);
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesLevelAndComponent) {
    Logger::instance().warn("chunk rejected", "ReliabilityEngine");

    std::string text = contents();
    EXPECT_NE(text.find("[WARN] [ReliabilityEngine] chunk rejected"), std::string::npos);
}

TEST_F(LoggerTest, EntriesStartWithMillisecondTimestamp) {
    Logger::instance().info("timestamped", "Clock");

    std::string text = contents();
    std::regex entry(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO\] \[Clock\] timestamped\n)");
    EXPECT_TRUE(std::regex_search(text, entry)) << text;
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    logger.debug("hidden detail", "Test");
    logger.info("visible info", "Test");

    std::string text = contents();
    EXPECT_EQ(text.find("hidden detail"), std::string::npos);
    EXPECT_NE(text.find("visible info"), std::string::npos);
}

TEST_F(LoggerTest, ConditionalMacrosRespectLevel) {
    int built = 0;
    auto message = [&built]() {
        ++built;
        return std::string("expensive");
    };

    LOG_DEBUG_COMP_IF(message(), "Test");
    EXPECT_EQ(built, 0);

    Logger::instance().setLevel(LogLevel::DEBUG);
    LOG_DEBUG_COMP_IF(message(), "Test");
    EXPECT_EQ(built, 1);
    EXPECT_NE(contents().find("[DEBUG] [Test] expensive"), std::string::npos);
}

TEST_F(LoggerTest, RotatesIntoNumberedFiles) {
    auto& logger = Logger::instance();
    logger.setMaxFileSize(1);
    logger.setMaxRotatedFiles(2);

    std::string line(1024, 'x');
    for (int i = 0; i < 3 * 1024 + 64; ++i) {
        logger.info(line, "Rotation");
    }

    EXPECT_TRUE(std::filesystem::exists(path_ + ".1"));
    EXPECT_TRUE(std::filesystem::exists(path_ + ".2"));
    EXPECT_FALSE(std::filesystem::exists(path_ + ".3"));
    EXPECT_NE(contents().find("Log file rotated"), std::string::npos);

    logger.setMaxFileSize(100);
    logger.setMaxRotatedFiles(5);
    std::filesystem::remove(path_ + ".1");
    std::filesystem::remove(path_ + ".2");
}

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parseLogLevel("chatty"), LogLevel::INFO);
    EXPECT_STREQ(logLevelName(LogLevel::WARN), "WARN");
}
