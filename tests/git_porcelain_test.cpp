#include "linux/linux_git_client.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace pnav {
namespace {

using namespace std::chrono_literals;

TEST(GitPorcelainTest, BranchWithUpstream) {
    auto status = parse_porcelain_status("## main...origin/main [ahead 2]\n");
    EXPECT_EQ(status.branch, std::optional<std::string>("main"));
    EXPECT_FALSE(status.dirty);
}

TEST(GitPorcelainTest, BranchWithoutUpstream) {
    auto status = parse_porcelain_status("## feature/search-box\n");
    EXPECT_EQ(status.branch, std::optional<std::string>("feature/search-box"));
    EXPECT_FALSE(status.dirty);
}

TEST(GitPorcelainTest, ChangedAndUntrackedFilesAreDirty) {
    auto status = parse_porcelain_status("## main\n M src/main.cpp\n?? notes.txt\n");
    EXPECT_EQ(status.branch, std::optional<std::string>("main"));
    EXPECT_TRUE(status.dirty);
}

TEST(GitPorcelainTest, DetachedHeadHasNoBranch) {
    auto status = parse_porcelain_status("## HEAD (no branch)\n");
    EXPECT_FALSE(status.branch.has_value());
    EXPECT_FALSE(status.dirty);
}

TEST(GitPorcelainTest, UnbornBranch) {
    EXPECT_EQ(parse_porcelain_status("## No commits yet on trunk\n").branch,
              std::optional<std::string>("trunk"));
    EXPECT_EQ(parse_porcelain_status("## Initial commit on master\n").branch,
              std::optional<std::string>("master"));
}

TEST(GitPorcelainTest, EmptyOutput) {
    auto status = parse_porcelain_status("");
    EXPECT_FALSE(status.branch.has_value());
    EXPECT_FALSE(status.dirty);
}

TEST(LinuxGitClientTest, PlainDirectoryIsNotARepository) {
    test::TempDir tmp;
    LinuxGitClient git;

    auto result = git.query_status(tmp.make_dir("plain").string(), 1000ms);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(LinuxGitClientTest, CloneRefusesExistingTarget) {
    test::TempDir tmp;
    tmp.make_dir("java/tool");
    LinuxGitClient git;

    auto result = git.clone("https://example.invalid/acme/tool.git", (tmp.path() / "java").string());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("already exists"), std::string::npos);
}

} // namespace
} // namespace pnav
