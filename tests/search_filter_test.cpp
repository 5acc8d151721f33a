#include "search_filter.hpp"
#include "project_info.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace pnav {
namespace {

auto identity = [](const std::string& s) { return s; };

TEST(SearchFilterTest, EmptyQueryReturnsAllItems) {
    const std::vector<std::string> items{"gamma", "Alpha", "beta"};
    EXPECT_EQ(filter(items, "", identity), items);
}

TEST(SearchFilterTest, KeepsMatchesInOriginalOrder) {
    const std::vector<std::string> items{"banana", "cherry", "apple", "grape", "avocado"};
    const auto result = filter(items, "a", identity);

    EXPECT_EQ(result, (std::vector<std::string>{"banana", "apple", "grape", "avocado"}));

    // Every result is one of the inputs, and relative order is unchanged
    auto it = items.begin();
    for (const auto& match : result) {
        it = std::find(it, items.end(), match);
        ASSERT_NE(it, items.end()) << match;
        ++it;
    }
}

TEST(SearchFilterTest, MatchIsCaseInsensitive) {
    const std::vector<std::string> items{"MyProject", "other", "PROJECTOR"};
    EXPECT_EQ(filter(items, "proj", identity), (std::vector<std::string>{"MyProject", "PROJECTOR"}));
    EXPECT_EQ(filter(items, "OTH", identity), (std::vector<std::string>{"other"}));
}

TEST(SearchFilterTest, NoMatchGivesEmptyResult) {
    const std::vector<std::string> items{"alpha", "beta"};
    EXPECT_TRUE(filter(items, "zzz", identity).empty());
}

TEST(SearchFilterTest, FiltersProjectsByName) {
    const std::vector<ProjectEntry> projects{
        {"web-app", "/dev/js/web-app", "js", std::nullopt},
        {"cli", "/dev/rust/cli", "rust", "Rust"},
        {"webhooks", "/dev/go/webhooks", "go", "Go"},
    };

    const auto result = filter(projects, "WEB", [](const ProjectEntry& p) { return p.name; });

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].path, "/dev/js/web-app");
    EXPECT_EQ(result[1].path, "/dev/go/webhooks");
}

TEST(SearchFilterTest, MatchesQueryHelper) {
    EXPECT_TRUE(matches_query("Anything", ""));
    EXPECT_TRUE(matches_query("Navigator", "GAT"));
    EXPECT_FALSE(matches_query("Navigator", "gator!"));
}

} // namespace
} // namespace pnav
