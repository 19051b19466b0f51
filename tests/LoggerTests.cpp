#include <gtest/gtest.h>
#include "utils/Logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelToString(DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelToString(INFO), "INFO");
    EXPECT_EQ(Logger::levelToString(WARNING), "WARNING");
    EXPECT_EQ(Logger::levelToString(ERROR), "ERROR");
}

TEST(LoggerTest, FileSinkFiltersByLevel) {
    std::string path = ::testing::TempDir() + "restaurant_logger_test.log";
    std::remove(path.c_str());

    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();
    logger.enableFileOutput(path);
    ASSERT_TRUE(logger.isFileOutputEnabled());
    logger.setLogLevel(WARNING);

    LOG_INFO("hidden message");
    LOG_WARNING("shown message");
    logger.logPayment("cash", 19.98);

    logger.disableFileOutput();
    logger.setLogLevel(previous);
    EXPECT_FALSE(logger.isFileOutputEnabled());

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();

    EXPECT_NE(contents.str().find("[WARNING] shown message"), std::string::npos);
    EXPECT_EQ(contents.str().find("hidden message"), std::string::npos);
    EXPECT_EQ(contents.str().find("Payment of"), std::string::npos);

    std::remove(path.c_str());
}

TEST(LoggerTest, DomainHelpersWriteAtInfo) {
    std::string path = ::testing::TempDir() + "restaurant_logger_info.log";
    std::remove(path.c_str());

    Logger& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();
    logger.enableFileOutput(path);
    logger.setLogLevel(INFO);

    logger.logItemAdded("Pizza", 10.99);
    logger.logPayment("credit card", 10.99);
    logger.logMenuDisplayed(true);

    logger.disableFileOutput();
    logger.setLogLevel(previous);

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();

    EXPECT_NE(contents.str().find("[INFO] Item added: Pizza, order total now 10.99"), std::string::npos);
    EXPECT_NE(contents.str().find("[INFO] Payment of 10.99 settled by credit card"), std::string::npos);
    EXPECT_NE(contents.str().find("[INFO] Menu displayed (pizza with extra cheese)"), std::string::npos);

    std::remove(path.c_str());
}
