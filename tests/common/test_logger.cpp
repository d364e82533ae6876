#include <gtest/gtest.h>
#include <regex>
#include <sstream>
#include <vector>
#include "common/Logger.hpp"
#include "../TempDir.hpp"

class LoggerTest : public TempDirTest {
protected:
    LogLevel savedLevel = LogLevel::Info;

    void SetUp() override {
        TempDirTest::SetUp();
        savedLevel = Logger::getLevel();
    }

    void TearDown() override {
        Logger::resetOutput();
        Logger::setLevel(savedLevel);
        TempDirTest::TearDown();
    }

    static std::vector<std::string> lines(const std::string& text) {
        std::vector<std::string> out;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            out.push_back(line);
        }
        return out;
    }
};

TEST_F(LoggerTest, FileSinkLineFormat) {
    const std::string path = pathFor("kvstore.log");
    ASSERT_TRUE(Logger::setOutputFile(path));
    Logger::setLevel(LogLevel::Debug);

    Logger::info("store opened");
    Logger::error("disk full");

    std::vector<std::string> written = lines(readRaw(path));
    ASSERT_EQ(written.size(), 2u);
    const std::regex info(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[INFO\] store opened)");
    const std::regex error(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[ERROR\] disk full)");
    EXPECT_TRUE(std::regex_match(written[0], info)) << written[0];
    EXPECT_TRUE(std::regex_match(written[1], error)) << written[1];
}

TEST_F(LoggerTest, LinesBelowLevelAreDropped) {
    const std::string path = pathFor("kvstore.log");
    ASSERT_TRUE(Logger::setOutputFile(path));
    Logger::setLevel(LogLevel::Warning);

    Logger::debug("dropped debug");
    Logger::info("dropped info");
    Logger::warning("kept warning");
    Logger::error("kept error");

    std::vector<std::string> written = lines(readRaw(path));
    ASSERT_EQ(written.size(), 2u);
    EXPECT_NE(written[0].find("[WARNING] kept warning"), std::string::npos);
    EXPECT_NE(written[1].find("[ERROR] kept error"), std::string::npos);
}

TEST_F(LoggerTest, FileSinkAppends) {
    const std::string path = pathFor("kvstore.log");
    writeRaw(path, "earlier line\n");
    Logger::setLevel(LogLevel::Info);

    ASSERT_TRUE(Logger::setOutputFile(path));
    Logger::info("later line");

    std::vector<std::string> written = lines(readRaw(path));
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[0], "earlier line");
    EXPECT_NE(written[1].find("[INFO] later line"), std::string::npos);
}

TEST_F(LoggerTest, UnopenableSinkKeepsCurrentOne) {
    const std::string path = pathFor("kvstore.log");
    Logger::setLevel(LogLevel::Info);
    ASSERT_TRUE(Logger::setOutputFile(path));

    EXPECT_FALSE(Logger::setOutputFile(dir.string()));
    Logger::info("still here");

    std::vector<std::string> written = lines(readRaw(path));
    ASSERT_EQ(written.size(), 1u);
    EXPECT_NE(written[0].find("still here"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(Logger::levelName(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(Logger::levelName(LogLevel::Info), "INFO");
    EXPECT_STREQ(Logger::levelName(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(Logger::levelName(LogLevel::Error), "ERROR");
}
