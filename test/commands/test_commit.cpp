#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>

#include "fakes.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "cli/commands/AddCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"

using namespace havc;
using namespace havc::test;

class CommitCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<FakeProcessRunner>();
        ctx.config.root = "/config";
        ctx.runner = runner;
        ctx.files = std::make_shared<FakeFileStore>();

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

// Test: Multiple -m flags become paragraphs
TEST_F(CommitCommandTest, CommitJoinsParagraphs) {
    runner->respond({"commit"}, "");
    runner->respond({"rev-parse"}, "abc1234\n");
    CommitCommand cmd;

    auto result = cmd.execute(ctx, {"-m", "Update lights", "-m", "Dim hallway at night"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_GE(runner->calls.size(), 1u);
    auto commitArgs = std::vector<std::string>(runner->calls[0].argv.begin() + 1, runner->calls[0].argv.end());
    EXPECT_EQ(commitArgs, (std::vector<std::string>{"commit", "-m", "Update lights\n\nDim hallway at night"}));
    EXPECT_NE(getOutput().find("[abc1234] Update lights"), std::string::npos);
}

// Test: Missing message is refused before git runs
TEST_F(CommitCommandTest, CommitRequiresMessage) {
    CommitCommand cmd;
    for (const auto& args : std::vector<std::vector<std::string>>{{}, {"-m"}, {"--amend"}}) {
        auto result = cmd.execute(ctx, args);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
    }
    EXPECT_TRUE(runner->calls.empty());
}

// Test: git's refusal (nothing to commit) comes back as a tool failure
TEST_F(CommitCommandTest, CommitNothingStaged) {
    runner->fail({"commit"}, 1, "nothing to commit, working tree clean");
    CommitCommand cmd;
    auto result = cmd.execute(ctx, {"-m", "Empty"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ExternalToolFailed);
    EXPECT_EQ(result.error().exitCode, 1);
}

TEST_F(CommitCommandTest, AddStagesFiles) {
    runner->respond({"add"}, "");
    AddCommand cmd;

    auto result = cmd.execute(ctx, {"a.yaml", "b.yaml"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(runner->lastArgs(), (std::vector<std::string>{"add", "--", "a.yaml", "b.yaml"}));
    EXPECT_NE(getOutput().find("Staged: b.yaml"), std::string::npos);

    auto empty = cmd.execute(ctx, {});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgs);
}

// Test: Init only runs git init when there is no repository yet
TEST_F(CommitCommandTest, InitIsIdempotent) {
    runner->respond({"init"}, "");
    InitCommand cmd;

    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    EXPECT_EQ(runner->lastArgs(), (std::vector<std::string>{"init"}));
    EXPECT_NE(getOutput().find("Initialized empty Git repository"), std::string::npos);

    runner->respond({"rev-parse", "--is-inside-work-tree"}, "true\n");
    size_t before = runner->calls.size();
    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    EXPECT_EQ(runner->calls.size(), before + 1);
    EXPECT_NE(getOutput().find("already initialised"), std::string::npos);
}

// Test: Help lists every registered command
TEST_F(CommitCommandTest, HelpListsCommands) {
    CommandFactory::registerBuiltins();
    HelpCommand cmd;

    ASSERT_TRUE(cmd.execute(ctx, {}).has_value());
    std::string output = getOutput();
    for (const char* name : {"add", "branch", "commit", "diff", "graph", "help", "init", "log", "restore", "show", "status"}) {
        EXPECT_TRUE(CommandFactory::instance().contains(name)) << name;
        EXPECT_NE(output.find(std::string("  ") + name + "\t"), std::string::npos) << name;
    }
    EXPECT_NE(output.find("--timeout-ms"), std::string::npos);
}

// Test: Invoker adds an init hint for git's "not a git repository" but returns the error untouched
TEST_F(CommitCommandTest, InvokerHintsOutsideRepository) {
    runner->fail({"status"}, 128, "fatal: not a git repository (or any of the parent directories): .git");
    std::stringstream errors;
    std::streambuf* oldCerr = std::cerr.rdbuf(errors.rdbuf());

    StatusCommand cmd;
    CommandInvoker invoker;
    auto result = invoker.invoke(cmd, ctx, {});
    std::cerr.rdbuf(oldCerr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ExternalToolFailed);
    EXPECT_EQ(result.error().exitCode, 128);
    EXPECT_EQ(CommandInvoker::exitStatus(result), 1);
    EXPECT_NE(errors.str().find("run 'havc init' first"), std::string::npos);
}

TEST_F(CommitCommandTest, NoHintForOtherFailures) {
    Error err{ErrorCode::ExternalToolFailed, "git exited with code 1"};
    err.exitCode = 1;
    err.toolStderr = "nothing to commit, working tree clean";
    EXPECT_EQ(CommandInvoker::hintFor(err, ctx), "");

    Error timeout{ErrorCode::Timeout, "fatal: not a git repository"};
    EXPECT_EQ(CommandInvoker::hintFor(timeout, ctx), "");
}
