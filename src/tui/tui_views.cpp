#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../theme.hpp"
#include <algorithm>

namespace pnav {

void TuiApp::render_list_area() {
    const ViewFrame& frame = list_frame();

    std::visit(overloaded{
        [&](const MainMenuView&) { render_main_menu(frame); },
        [&](const CategoryListView&) { render_category_list(frame, "Categories"); },
        [&](const CloneCategoryView&) { render_category_list(frame, "Clone into"); },
        [&](const ProjectListView&) { render_project_list(frame, "Projects"); },
        [&](const FavoritesView&) { render_project_list(frame, "Favorites"); },
        [&](const RecentView&) { render_project_list(frame, "Recently Opened"); },
        [&](const SearchResultsView& v) {
            if (v.source == SearchSource::Projects) {
                render_project_list(frame, "Search Results");
            } else {
                render_category_list(frame, "Search Results");
            }
        },
        [&](const InputUrlView& v) { render_url_input(v); },
        [&](const ThemeSelectionView&) { render_theme_list(frame); },
        // Overlay views never reach the list area, see list_frame()
        [&](const ConfirmLaunchView&) {},
        [&](const HelpView&) {},
    }, frame.view);
}

void TuiApp::render_main_menu(const ViewFrame& frame) {
    draw_box_title(list_win_, "Actions", COLOR_PAIR_BORDER);

    const int width = getmaxx(list_win_);
    int row = 1;
    for (size_t i = 0; i < kMainMenuItems.size() && row <= visible_rows_; ++i, ++row) {
        const bool selected = static_cast<int>(i) == frame.cursor;
        draw_row_marker(row, selected);

        const int pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_TEXT;
        wattron(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
        mvwprintw(list_win_, row, 3, "%s", truncate(std::string(menu_label(kMainMenuItems[i])), width - 4).c_str());
        wattroff(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
    }
}

void TuiApp::render_theme_list(const ViewFrame& frame) {
    draw_box_title(list_win_, "Choose Theme", COLOR_PAIR_BORDER);

    const auto& names = theme_names();
    const int count = static_cast<int>(names.size());
    scroll_to_cursor(frame.cursor, count);

    const int width = getmaxx(list_win_);
    int row = 1;
    for (int i = scroll_offset_; i < count && row <= visible_rows_; ++i, ++row) {
        const bool selected = i == frame.cursor;
        draw_row_marker(row, selected);

        std::string label = names[i];
        if (label == navigator_->config().theme) {
            label += "  (current)";
        }

        const int pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_TEXT;
        wattron(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
        mvwprintw(list_win_, row, 3, "%s", truncate(label, width - 4).c_str());
        wattroff(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
    }
}

void TuiApp::render_category_list(const ViewFrame& frame, const std::string& title) {
    draw_box_title(list_win_, title, COLOR_PAIR_BORDER);

    const auto categories = navigator_->visible_categories(frame);
    const int count = static_cast<int>(categories.size());
    const int width = getmaxx(list_win_);

    if (categories.empty()) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_ITALIC);
        mvwprintw(list_win_, 1, 3, "No results found");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_ITALIC);
        return;
    }

    scroll_to_cursor(frame.cursor, count);

    int row = 1;
    for (int i = scroll_offset_; i < count && row <= visible_rows_; ++i, ++row) {
        const bool selected = i == frame.cursor;
        draw_row_marker(row, selected);

        const int pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_TEXT;
        wattron(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
        mvwprintw(list_win_, row, 3, "%s", truncate(categories[i], width - 4).c_str());
        wattroff(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
    }
}

void TuiApp::render_project_list(const ViewFrame& frame, const std::string& title) {
    draw_box_title(list_win_, title, COLOR_PAIR_BORDER);

    const auto projects = navigator_->visible_projects(frame);
    const int count = static_cast<int>(projects.size());
    const int width = getmaxx(list_win_);

    if (projects.empty()) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_ITALIC);
        mvwprintw(list_win_, 1, 3, "No results found");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_ITALIC);
        return;
    }

    scroll_to_cursor(frame.cursor, count);

    // Columns: name [language] | git | favorite
    constexpr int kGitWidth = 30;
    constexpr int kFavWidth = 3;
    const int name_width = std::max(10, width - 4 - kGitWidth - kFavWidth);
    const int git_x = 3 + name_width;
    const int fav_x = git_x + kGitWidth;

    int row = 1;
    for (int i = scroll_offset_; i < count && row <= visible_rows_; ++i, ++row) {
        const auto& project = projects[i];
        const bool selected = i == frame.cursor;
        draw_row_marker(row, selected);

        // Name and language label
        const int pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_TEXT;
        std::string name = truncate(project.name, name_width - 1);
        wattron(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));
        mvwprintw(list_win_, row, 3, "%s", name.c_str());
        wattroff(list_win_, COLOR_PAIR(pair) | (selected ? A_BOLD : 0));

        if (project.language) {
            const int lang_x = 3 + static_cast<int>(name.size()) + 1;
            std::string label = "[" + *project.language + "]";
            if (lang_x + static_cast<int>(label.size()) < git_x) {
                wattron(list_win_, COLOR_PAIR(COLOR_PAIR_LANGUAGE) | A_ITALIC);
                mvwprintw(list_win_, row, lang_x, "%s", label.c_str());
                wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_LANGUAGE) | A_ITALIC);
            }
        }

        if (auto glyph = git_glyph(navigator_->status_for(project.path))) {
            const int marker_pair = glyph->dirty ? COLOR_PAIR_GIT_DIRTY : COLOR_PAIR_GIT_CLEAN;
            wattron(list_win_, COLOR_PAIR(marker_pair) | A_BOLD);
            mvwprintw(list_win_, row, git_x, "%s", glyph->dirty ? "*" : "=");
            wattroff(list_win_, COLOR_PAIR(marker_pair) | A_BOLD);

            wattron(list_win_, COLOR_PAIR(COLOR_PAIR_GIT_BRANCH));
            mvwprintw(list_win_, row, git_x + 2, "%s", truncate(glyph->branch, kGitWidth - 3).c_str());
            wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_GIT_BRANCH));
        }

        if (navigator_->is_favorite(project.path)) {
            wattron(list_win_, COLOR_PAIR(COLOR_PAIR_FAVORITE) | A_BOLD);
            mvwprintw(list_win_, row, fav_x, "<3");
            wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_FAVORITE) | A_BOLD);
        }
    }

    // Scroll indicators
    const int max_y = getmaxy(list_win_);
    if (scroll_offset_ > 0) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, 0, width - 5, "^^^");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (scroll_offset_ + visible_rows_ < count) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(list_win_, max_y - 1, width - 5, "vvv");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

void TuiApp::render_url_input(const InputUrlView& view) {
    draw_box_title(list_win_, "Repository URL", COLOR_PAIR_BORDER);

    const int width = getmaxx(list_win_);
    std::string shown = view.url;
    const int field = width - 6;
    if (field > 0 && static_cast<int>(shown.size()) > field) {
        // Keep the end of a long URL visible
        shown = shown.substr(shown.size() - field);
    }

    wattron(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
    mvwprintw(list_win_, 1, 2, ">");
    wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
    mvwprintw(list_win_, 1, 4, "%s", shown.c_str());

    wattron(list_win_, COLOR_PAIR(COLOR_PAIR_NO_GIT));
    mvwprintw(list_win_, 3, 4, "%s", truncate("Enter: choose category   Esc: cancel", width - 6).c_str());
    wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_NO_GIT));

    curs_set(1);
    wmove(list_win_, 1, 4 + static_cast<int>(shown.size()));
}

} // namespace pnav
