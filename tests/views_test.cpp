#include "viewmodels/views.hpp"
#include <gtest/gtest.h>

namespace pnav {
namespace {

TEST(GitGlyphTest, NothingBeforeFirstResult) {
    EXPECT_FALSE(git_glyph(nullptr).has_value());
}

TEST(GitGlyphTest, UnavailableStatusShowsNothing) {
    const GitStatus status = GitStatus::unavailable();
    EXPECT_FALSE(git_glyph(&status).has_value());
}

TEST(GitGlyphTest, BranchAndDirtyState) {
    GitStatus status;
    status.available = true;
    status.branch = "main";
    status.dirty = true;

    auto glyph = git_glyph(&status);
    ASSERT_TRUE(glyph.has_value());
    EXPECT_TRUE(glyph->dirty);
    EXPECT_EQ(glyph->branch, "main");
}

TEST(GitGlyphTest, DetachedHead) {
    GitStatus status;
    status.available = true;

    auto glyph = git_glyph(&status);
    ASSERT_TRUE(glyph.has_value());
    EXPECT_FALSE(glyph->dirty);
    EXPECT_EQ(glyph->branch, "(detached)");
}

TEST(ViewTitleTest, NamesTheCurrentList) {
    EXPECT_EQ(view_title(ProjectListView{"rust"}), "Projects in rust");
    EXPECT_EQ(view_title(CategoryListView{}), "Select Category");
}

} // namespace
} // namespace pnav
