#include <gtest/gtest.h>

#include "core/StatusParser.hpp"

using namespace havc;

// Test: Clean tree on a tracking branch
TEST(StatusParserTest, CleanTrackingBranch) {
    auto st = StatusParser::parsePorcelainStatus("## main...origin/main [ahead 2]\n");
    EXPECT_EQ(st.branch, "main");
    EXPECT_TRUE(st.isClean());
    EXPECT_TRUE(st.conflicted().empty());
}

// Test: Index and working-tree columns, including a leading space
TEST(StatusParserTest, ParsesColumns) {
    auto st = StatusParser::parsePorcelainStatus(
        "## master\n"
        " M automations.yaml\n"
        "M  scripts.yaml\n"
        "A  packages/new.yaml\n"
        "?? secrets.yaml\n");

    EXPECT_EQ(st.branch, "master");
    ASSERT_EQ(st.files.size(), 4u);
    EXPECT_EQ(st.files[0].path, "automations.yaml");
    EXPECT_EQ(st.files[0].index, ' ');
    EXPECT_EQ(st.files[0].workingDir, 'M');
    EXPECT_EQ(st.files[1].path, "scripts.yaml");
    EXPECT_EQ(st.files[1].index, 'M');
    EXPECT_EQ(st.files[1].workingDir, ' ');
    EXPECT_EQ(st.files[2].path, "packages/new.yaml");
    EXPECT_TRUE(st.files[3].isUntracked());
    EXPECT_FALSE(st.isClean());
}

// Test: Renames record the original path
TEST(StatusParserTest, ParsesRename) {
    auto st = StatusParser::parsePorcelainStatus("## main\nR  old.yaml -> new.yaml\n");
    ASSERT_EQ(st.files.size(), 1u);
    EXPECT_EQ(st.files[0].originalPath, "old.yaml");
    EXPECT_EQ(st.files[0].path, "new.yaml");
    EXPECT_EQ(st.files[0].index, 'R');
}

// Test: Unmerged pairs are reported as conflicted
TEST(StatusParserTest, ReportsConflicts) {
    auto st = StatusParser::parsePorcelainStatus(
        "## main\n"
        "UU a.yaml\n"
        "AA b.yaml\n"
        "DD c.yaml\n"
        "M  d.yaml\n");
    auto conflicted = st.conflicted();
    ASSERT_EQ(conflicted.size(), 3u);
    EXPECT_EQ(conflicted[0], "a.yaml");
    EXPECT_EQ(conflicted[1], "b.yaml");
    EXPECT_EQ(conflicted[2], "c.yaml");
}

// Test: Branch header variants
TEST(StatusParserTest, BranchHeaderVariants) {
    EXPECT_EQ(StatusParser::parsePorcelainStatus("## No commits yet on main\n").branch, "main");
    EXPECT_EQ(StatusParser::parsePorcelainStatus("## Initial commit on dev\n").branch, "dev");
    EXPECT_EQ(StatusParser::parsePorcelainStatus("## HEAD (no branch)\n").branch, "HEAD");
    EXPECT_EQ(StatusParser::parsePorcelainStatus("## feature/x\n").branch, "feature/x");
    EXPECT_EQ(StatusParser::parsePorcelainStatus("").branch, "master");
}

// Test: Branch list strips the current marker and blank lines
TEST(StatusParserTest, ParsesBranchList) {
    auto branches = StatusParser::parseBranchList("  develop\n* main\n\n  release/1.0\n");
    ASSERT_EQ(branches.size(), 3u);
    EXPECT_EQ(branches[0], "develop");
    EXPECT_EQ(branches[1], "main");
    EXPECT_EQ(branches[2], "release/1.0");
}
