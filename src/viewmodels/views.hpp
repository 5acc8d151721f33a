#pragma once

#include "../project_info.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pnav {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

enum class MainMenuItem {
    Favorites,
    Recent,
    OpenProject,
    CloneRepository,
    OpenIde,
    ChooseTheme
};

inline constexpr std::array kMainMenuItems = {
    MainMenuItem::Favorites,
    MainMenuItem::Recent,
    MainMenuItem::OpenProject,
    MainMenuItem::CloneRepository,
    MainMenuItem::OpenIde,
    MainMenuItem::ChooseTheme,
};

constexpr std::string_view menu_label(MainMenuItem item) {
    switch (item) {
        case MainMenuItem::Favorites:       return "Favorites";
        case MainMenuItem::Recent:          return "Recent Projects";
        case MainMenuItem::OpenProject:     return "Open Existing Project";
        case MainMenuItem::CloneRepository: return "Clone Repository";
        case MainMenuItem::OpenIde:         return "Open IDE";
        case MainMenuItem::ChooseTheme:     return "Choose Theme";
    }
    return "";
}

struct MainMenuView {};

struct CategoryListView {};

struct ProjectListView {
    std::string category;
};

// Favorites and recents are read from PersistentLists when the view is
// entered (and on refresh); missing paths are already left out.
struct FavoritesView {
    std::vector<ProjectEntry> projects;
};

struct RecentView {
    std::vector<ProjectEntry> projects;
};

enum class SearchSource {
    Categories,       // From CategoryList: Enter opens the category
    CloneCategories,  // From CloneCategory: Enter clones into the category
    Projects          // From a project list: Enter confirms a launch
};

// Frozen result of a committed search
struct SearchResultsView {
    SearchSource source = SearchSource::Projects;
    std::string source_title;
    std::string query;
    std::string clone_url;
    std::vector<std::string> categories;
    std::vector<ProjectEntry> projects;
};

// target == nullopt starts the IDE without a project
struct ConfirmLaunchView {
    std::optional<ProjectEntry> target;
};

struct HelpView {};

struct InputUrlView {
    std::string url;
};

struct CloneCategoryView {
    std::string url;
};

struct ThemeSelectionView {};

using View = std::variant<
    MainMenuView,
    CategoryListView,
    ProjectListView,
    FavoritesView,
    RecentView,
    SearchResultsView,
    ConfirmLaunchView,
    HelpView,
    InputUrlView,
    CloneCategoryView,
    ThemeSelectionView>;

struct SearchState {
    bool active = false;
    std::string query;

    void clear() {
        active = false;
        query.clear();
    }
};

// One entry of the view stack
struct ViewFrame {
    View view;
    int cursor = 0;
    SearchState search;
};

// Git column of a project row
struct GitGlyph {
    bool dirty = false;
    std::string branch;  // "(detached)" without a branch
};

// Nothing is shown until a result arrives, and nothing for a directory
// whose status is unavailable
inline std::optional<GitGlyph> git_glyph(const GitStatus* status) {
    if (!status || !status->available) {
        return std::nullopt;
    }
    return GitGlyph{status->dirty, status->branch ? *status->branch : "(detached)"};
}

inline std::string view_title(const View& view) {
    return std::visit(overloaded{
        [](const MainMenuView&) { return std::string("pnav"); },
        [](const CategoryListView&) { return std::string("Select Category"); },
        [](const ProjectListView& v) { return "Projects in " + v.category; },
        [](const FavoritesView&) { return std::string("Favorite Projects"); },
        [](const RecentView&) { return std::string("Recently Opened Projects"); },
        [](const SearchResultsView& v) { return v.source_title + " matching \"" + v.query + "\""; },
        [](const ConfirmLaunchView&) { return std::string("pnav"); },
        [](const HelpView&) { return std::string("pnav"); },
        [](const InputUrlView&) { return std::string("Clone Repository: Paste URL"); },
        [](const CloneCategoryView&) { return std::string("Select Category to Clone into"); },
        [](const ThemeSelectionView&) { return std::string("Choose Theme"); },
    }, view);
}

} // namespace pnav
