#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "util/Logger.hpp"

using namespace havc;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel = Logger::instance().level();
        oldCout = std::cout.rdbuf(outStream.rdbuf());
        oldCerr = std::cerr.rdbuf(errStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        std::cerr.rdbuf(oldCerr);
        Logger::instance().setLevel(savedLevel);
    }

    LogLevel savedLevel{LogLevel::Info};
    std::stringstream outStream;
    std::stringstream errStream;
    std::streambuf* oldCout{nullptr};
    std::streambuf* oldCerr{nullptr};
};

// Test: Debug and info lines never reach stdout, which carries command output
TEST_F(LoggerTest, AllLevelsWriteToStderr) {
    Logger::instance().setLevel(LogLevel::Debug);
    Logger::instance().debug("git show abc:scenes.yaml");
    Logger::instance().info("restored");

    EXPECT_EQ(outStream.str(), "");
    EXPECT_NE(errStream.str().find("[debug] git show abc:scenes.yaml"), std::string::npos);
    EXPECT_NE(errStream.str().find("[info ] restored"), std::string::npos);
}

// Test: Messages below the level are dropped, critical always prints
TEST_F(LoggerTest, LevelFilters) {
    Logger::instance().setLevel(LogLevel::Error);
    Logger::instance().warn("hidden");
    Logger::instance().debug("hidden too");
    EXPECT_EQ(errStream.str(), "");

    Logger::instance().setLevel(LogLevel::Critical);
    Logger::instance().critical("file may be partially written or missing");
    EXPECT_NE(errStream.str().find("[CRITICAL]"), std::string::npos);
}

TEST(LoggerParseTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("2", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("loud", LogLevel::Info), LogLevel::Info);
}
