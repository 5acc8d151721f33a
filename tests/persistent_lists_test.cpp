#include "persistent_lists.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace pnav {
namespace {

class PersistentListsTest : public ::testing::Test {
protected:
    std::string project(const std::string& name) {
        return tmp_.make_dir("dev/misc/" + name).string();
    }

    fs::path storage() const { return tmp_.path() / "config"; }

    test::TempDir tmp_;
};

TEST_F(PersistentListsTest, RecentListIsBoundedAndMostRecentFirst) {
    PersistentLists lists(storage());
    for (int i = 0; i < 12; ++i) {
        lists.record_opened(project("p" + std::to_string(i)));
    }

    ASSERT_EQ(lists.recents().size(), PersistentLists::kMaxRecents);
    EXPECT_EQ(lists.recents().front(), project("p11"));
    EXPECT_EQ(lists.recents().back(), project("p2"));
}

TEST_F(PersistentListsTest, ReopeningMovesToFrontWithoutDuplicates) {
    PersistentLists lists(storage());
    const auto a = project("a");
    const auto b = project("b");
    const auto c = project("c");

    lists.record_opened(a);
    lists.record_opened(b);
    lists.record_opened(c);
    lists.record_opened(a);

    EXPECT_EQ(lists.recents(), (std::vector<std::string>{a, c, b}));

    const std::set<std::string> unique(lists.recents().begin(), lists.recents().end());
    EXPECT_EQ(unique.size(), lists.recents().size());
}

TEST_F(PersistentListsTest, ToggleFavoriteTwiceRestoresMembership) {
    PersistentLists lists(storage());
    const auto a = project("a");

    EXPECT_FALSE(lists.is_favorite(a));
    EXPECT_TRUE(lists.toggle_favorite(a));
    EXPECT_TRUE(lists.is_favorite(a));
    EXPECT_FALSE(lists.toggle_favorite(a));
    EXPECT_FALSE(lists.is_favorite(a));
    EXPECT_TRUE(lists.favorites().empty());
}

TEST_F(PersistentListsTest, ChangesAreWrittenThroughAndSurviveReload) {
    const auto a = project("a");
    const auto b = project("b");
    {
        PersistentLists lists(storage());
        lists.toggle_favorite(a);
        lists.record_opened(a);
        lists.record_opened(b);
        EXPECT_TRUE(fs::exists(lists.favorites_file()));
        EXPECT_TRUE(fs::exists(lists.recents_file()));
    }

    PersistentLists reloaded(storage());
    reloaded.load();
    EXPECT_TRUE(reloaded.is_favorite(a));
    EXPECT_FALSE(reloaded.is_favorite(b));
    EXPECT_EQ(reloaded.recents(), (std::vector<std::string>{b, a}));
}

TEST_F(PersistentListsTest, UnmountedPathsSurviveASession) {
    const auto proj = tmp_.make_dir("mnt/ext/proj").string();
    const auto local = project("local");
    {
        PersistentLists lists(storage());
        lists.toggle_favorite(proj);
        lists.record_opened(proj);
        lists.record_opened(local);
    }

    // A whole session with the drive gone, ending in a flush on quit
    fs::remove_all(tmp_.path() / "mnt");
    {
        PersistentLists lists(storage());
        lists.load();
        EXPECT_TRUE(lists.is_favorite(proj));
        EXPECT_EQ(lists.recents(), (std::vector<std::string>{local, proj}));
        EXPECT_TRUE(lists.flush());
    }

    tmp_.make_dir("mnt/ext/proj");
    PersistentLists lists(storage());
    lists.load();
    EXPECT_TRUE(lists.is_favorite(proj));
    EXPECT_EQ(lists.recents(), (std::vector<std::string>{local, proj}));
}

TEST_F(PersistentListsTest, MissingPathsStayOnlyUntilRemovedByUser) {
    const auto gone = project("gone");
    {
        PersistentLists lists(storage());
        lists.toggle_favorite(gone);
    }
    fs::remove_all(gone);

    PersistentLists lists(storage());
    lists.load();
    EXPECT_FALSE(lists.toggle_favorite(gone));

    PersistentLists reloaded(storage());
    reloaded.load();
    EXPECT_TRUE(reloaded.favorites().empty());
}

TEST_F(PersistentListsTest, LoadDeduplicatesAndBoundsHandEditedRecents) {
    std::string yaml = "recent:\n";
    const auto a = project("a");
    yaml += "  - " + a + "\n";
    yaml += "  - " + a + "\n";
    for (int i = 0; i < 12; ++i) {
        yaml += "  - " + project("p" + std::to_string(i)) + "\n";
    }
    tmp_.write_file("config/recents.yaml", yaml);

    PersistentLists lists(storage());
    lists.load();

    ASSERT_EQ(lists.recents().size(), PersistentLists::kMaxRecents);
    EXPECT_EQ(lists.recents()[0], a);
    EXPECT_EQ(lists.recents()[1], project("p0"));
    EXPECT_EQ(std::ranges::count(lists.recents(), a), 1);
}

TEST_F(PersistentListsTest, CorruptFilesLoadAsEmpty) {
    tmp_.write_file("config/favorites.yaml", "favorites: [unterminated\n");
    tmp_.write_file("config/recents.yaml", "recent: 42\n");

    PersistentLists lists(storage());
    lists.load();
    EXPECT_TRUE(lists.favorites().empty());
    EXPECT_TRUE(lists.recents().empty());

    // The next save replaces the corrupt file
    const auto a = project("a");
    lists.toggle_favorite(a);
    PersistentLists reloaded(storage());
    reloaded.load();
    EXPECT_TRUE(reloaded.is_favorite(a));
}

TEST_F(PersistentListsTest, LoadWithoutFilesIsEmpty) {
    PersistentLists lists(storage());
    lists.load();
    EXPECT_TRUE(lists.favorites().empty());
    EXPECT_TRUE(lists.recents().empty());
    EXPECT_TRUE(lists.flush());
}

} // namespace
} // namespace pnav
