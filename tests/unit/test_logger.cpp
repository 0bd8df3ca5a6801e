#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "Logger.h"
#include "LoggerMacros.h"

using namespace SettleFS;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logFile_ = (fs::temp_directory_path() / "settlefs_logger_test.log").string();
        std::error_code ec;
        fs::remove(logFile_, ec);

        auto& logger = Logger::instance();
        logger.setConsoleOutput(false);
        logger.setLogFile(logFile_);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setLevel(LogLevel::INFO);
        std::error_code ec;
        fs::remove(logFile_, ec);
    }

    std::string readLog() {
        std::ifstream file(logFile_);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::string logFile_;
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesComponentAndLevel) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Debouncer started", "Debouncer");
    logger.error("watch lost", "InotifyWatcher");

    auto content = readLog();
    EXPECT_NE(content.find("[INFO] [Debouncer] Debouncer started"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [InotifyWatcher] watch lost"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);

    logger.info("hidden info", "Test");
    LOG_DEBUG_COMP_IF("hidden debug", "Test");
    LOG_WARN_COMP("visible warning", "Test");

    auto content = readLog();
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible warning"), std::string::npos);
    EXPECT_FALSE(logger.isDebugEnabled());
}

TEST_F(LoggerTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::levelFromString("loud", LogLevel::ERROR), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
}
