#include <gtest/gtest.h>

#include "core/Config.hpp"

using namespace havc;

// Test: Defaults before any flag is applied
TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.gitBinary, "git");
    EXPECT_EQ(cfg.timeoutMs, Constants::DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(cfg.maxOutputBytes, Constants::DEFAULT_MAX_OUTPUT_BYTES);
    EXPECT_FALSE(cfg.verbose);
}

// Test: Leading global flags are consumed, the command and its args are left
TEST(ConfigTest, ApplyArgsConsumesGlobalFlags) {
    Config cfg;
    auto rest = cfg.applyArgs({"-v", "--root", "/config", "--git", "/usr/bin/git",
                               "--timeout-ms", "1500", "--max-output", "2048", "log", "-n", "5"});
    ASSERT_TRUE(rest.has_value()) << rest.error().message;
    EXPECT_EQ(rest.value(), (std::vector<std::string>{"log", "-n", "5"}));
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.root, std::filesystem::path("/config"));
    EXPECT_EQ(cfg.gitBinary, "/usr/bin/git");
    EXPECT_EQ(cfg.timeoutMs, 1500);
    EXPECT_EQ(cfg.maxOutputBytes, 2048u);
}

// Test: Flags after the command name belong to the command
TEST(ConfigTest, StopsAtCommandName) {
    Config cfg;
    auto rest = cfg.applyArgs({"status", "-v"});
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest.value(), (std::vector<std::string>{"status", "-v"}));
    EXPECT_FALSE(cfg.verbose);
}

// Test: Root is normalized
TEST(ConfigTest, RootIsNormalized) {
    Config cfg;
    auto rest = cfg.applyArgs({"--root", "/config/./packages/.."});
    ASSERT_TRUE(rest.has_value());
    EXPECT_TRUE(rest.value().empty());
    EXPECT_EQ(cfg.root.generic_string(), "/config/");
}

// Test: Bad numbers and missing values are InvalidArgs
TEST(ConfigTest, RejectsInvalidValues) {
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"--timeout-ms", "abc"},
             {"--timeout-ms", "0"},
             {"--timeout-ms", "-5"},
             {"--timeout-ms", "10s"},
             {"--max-output", ""},
             {"--root"}}) {
        Config cfg;
        auto res = cfg.applyArgs(args);
        ASSERT_FALSE(res.has_value()) << args.front();
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    }
}
