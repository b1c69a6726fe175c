#include <gtest/gtest.h>
#include <utility>
#include <vector>
#include "TestRepo.h"
#include "utils/Logger.h"

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::getInstance();
        savedDebug = logger.isDebugEnabled();
        logger.setConsoleEnabled(false);
        logger.setCallback([this](LogLevel level, const std::string& message) {
            records.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.setCallback(nullptr);
        logger.setLogFile("");
        logger.setDebugEnabled(savedDebug);
        logger.setConsoleEnabled(true);
    }

    bool savedDebug = false;
    std::vector<std::pair<LogLevel, std::string>> records;
};

TEST_F(LoggerTest, CallbackReceivesEveryLevel) {
    Logger& logger = Logger::getInstance();
    logger.setDebugEnabled(true);
    logger.info("i");
    logger.success("s");
    logger.warn("w");
    logger.error("e");
    logger.debug("d");
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(records[0].first, LogLevel::INFO);
    EXPECT_EQ(records[2].first, LogLevel::WARNING);
    EXPECT_EQ(records[4].first, LogLevel::DEBUG);
    EXPECT_EQ(records[4].second, "d");
}

TEST_F(LoggerTest, DebugIsSuppressedUnlessEnabled) {
    Logger& logger = Logger::getInstance();
    logger.setDebugEnabled(false);
    logger.debug("hidden");
    logger.info("shown");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].second, "shown");
}

TEST_F(LoggerTest, FileSinkAppendsPrefixedLines) {
    TestRepo repo;
    fs::path logPath = repo.path() / "codemap.log";
    Logger& logger = Logger::getInstance();
    logger.setLogFile(logPath.u8string());
    logger.warn("graph not persisted");
    logger.info("done");
    logger.setLogFile("");

    std::string text = repo.read("codemap.log");
    EXPECT_NE(text.find("[WARN] graph not persisted\n"), std::string::npos);
    EXPECT_NE(text.find("[INFO] done\n"), std::string::npos);
    EXPECT_EQ(text[0], '[');
}
