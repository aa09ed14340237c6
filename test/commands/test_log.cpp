#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>

#include "fakes.hpp"
#include "test_utils.hpp"
#include "cli/commands/GraphCommand.hpp"
#include "cli/commands/LogCommand.hpp"

using namespace havc;
using namespace havc::test;
using namespace havc::test::utils;

class LogCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<FakeProcessRunner>();
        ctx.config.root = "/config";
        ctx.runner = runner;
        ctx.files = std::make_shared<FakeFileStore>();

        // Capture output
        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
    }

    std::string getOutput() {
        return outputStream.str();
    }

    AppContext ctx;
    std::shared_ptr<FakeProcessRunner> runner;
    std::stringstream outputStream;
    std::streambuf* oldCout{nullptr};
};

// Test: Log on a repository with no commits
TEST_F(LogCommandTest, LogEmptyRepository) {
    runner->respond({"log"}, "");
    LogCommand cmd;

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(getOutput().find("`your current branch does not have any commits yet`"), std::string::npos);
}

// Test: Full format shows hash, author, date and message, newest first
TEST_F(LogCommandTest, LogFullFormat) {
    runner->respond({"log"},
        fullLogRecord("aaaa", "aa", "Ann", "ann@example.com", 1700000000, "Second commit", "Details here") + "\n" +
        fullLogRecord("bbbb", "bb", "Bob", "bob@example.com", 1600000000, "First commit", ""));
    LogCommand cmd;

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string output = getOutput();
    EXPECT_NE(output.find("commit aaaa"), std::string::npos);
    EXPECT_NE(output.find("Author: Ann <ann@example.com>"), std::string::npos);
    EXPECT_NE(output.find("Date:   2023-11-14T22:13:20.000Z"), std::string::npos);
    EXPECT_NE(output.find("    Details here"), std::string::npos);
    EXPECT_LT(output.find("Second commit"), output.find("First commit"));
    EXPECT_EQ(output.find("Change:"), std::string::npos);
}

// Test: --file passes the path and shows the change kind
TEST_F(LogCommandTest, LogFileShowsChange) {
    runner->respond({"log"},
        fullLogRecord("aaaa", "aa", "Ann", "ann@example.com", 1700000000, "Tweak", "") + "\n\nM\tscripts.yaml\n" +
        fullLogRecord("bbbb", "bb", "Ann", "ann@example.com", 1600000000, "Add", "") + "\n\nA\tscripts.yaml\n");
    LogCommand cmd;

    auto result = cmd.execute(ctx, {"--file", "scripts.yaml"});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string output = getOutput();
    EXPECT_NE(output.find("Change: M (modified)"), std::string::npos);
    EXPECT_NE(output.find("Change: A (added)"), std::string::npos);
    EXPECT_EQ(runner->lastArgs().back(), "scripts.yaml");
}

// Test: --oneline and --max-count
TEST_F(LogCommandTest, LogOnelineWithLimit) {
    runner->respond({"log"}, fullLogRecord("aaaa", "aa1", "Ann", "ann@example.com", 1700000000, "Only", ""));
    LogCommand cmd;

    auto result = cmd.execute(ctx, {"--oneline", "-n", "1"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(getOutput().find("aa1\033[0m Only"), std::string::npos);
    EXPECT_EQ(runner->lastArgs()[1], "--max-count=1");
}

// Test: Bad options are rejected before git runs
TEST_F(LogCommandTest, LogRejectsBadOptions) {
    LogCommand cmd;
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"-n", "0"}, {"-n", "x"}, {"--max-count"}, {"--file"}, {"--graph"}}) {
        auto result = cmd.execute(ctx, args);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
    }
    EXPECT_TRUE(runner->calls.empty());
}

// Test: git failure is returned to the caller
TEST_F(LogCommandTest, LogOutsideRepository) {
    runner->fail({"log"}, 128, "fatal: not a git repository");
    LogCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ExternalToolFailed);
    EXPECT_EQ(result.error().exitCode, 128);
    EXPECT_EQ(result.error().toolStderr, "fatal: not a git repository");
}

// Test: Graph marks merges and roots and counts commits
TEST_F(LogCommandTest, GraphMarksMergesAndRoots) {
    runner->respond({"log"},
        lightweightRecord("cccccccccc", "aaaaaaaaaa bbbbbbbbbb", "2023-11-14T22:13:20+00:00", "Merge feature") + "\n" +
        lightweightRecord("bbbbbbbbbb", "aaaaaaaaaa", "2023-11-14T10:00:00+00:00", "Feature") + "\n" +
        lightweightRecord("aaaaaaaaaa", "", "2023-11-13T10:00:00+00:00", "Root"));
    GraphCommand cmd;

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string output = getOutput();
    EXPECT_NE(output.find("M \033[33mccccccc"), std::string::npos);
    EXPECT_NE(output.find("<- aaaaaaa bbbbbbb"), std::string::npos);
    EXPECT_NE(output.find("(root)"), std::string::npos);
    EXPECT_NE(output.find("3 commit(s)"), std::string::npos);
}

TEST_F(LogCommandTest, GraphTakesNoArguments) {
    GraphCommand cmd;
    auto result = cmd.execute(ctx, {"--all"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}
