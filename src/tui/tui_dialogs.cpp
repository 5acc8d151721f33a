#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <sstream>

namespace pnav {

void TuiApp::render_confirm_dialog(const ConfirmLaunchView& view) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    std::string target = view.target ? view.target->name : "IDE without a project";
    std::string location = view.target ? view.target->path : "";

    // Dialog dimensions
    int dialog_width = std::clamp(static_cast<int>(std::max(target.size(), location.size())) + 8, 44, std::max(44, max_x - 4));
    int dialog_height = location.empty() ? 7 : 8;

    int dialog_x = std::max(0, (max_x - dialog_width) / 2);
    int dialog_y = std::max(0, (max_y - dialog_height) / 2);

    // Create temporary window for dialog
    WINDOW* dialog_win = newwin(dialog_height, dialog_width, dialog_y, dialog_x);
    if (!dialog_win) return;

    // Draw dialog background and border
    wbkgd(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_CONFIRM));
    box(dialog_win, 0, 0);
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_CONFIRM));

    // Title
    std::string title = " Open in IDE ";
    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_CONFIRM) | A_BOLD);
    mvwprintw(dialog_win, 0, (dialog_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_CONFIRM) | A_BOLD);

    mvwprintw(dialog_win, 2, 2, "Launch IDE for:");

    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 3, 4, "%s", truncate(target, dialog_width - 6).c_str());
    wattroff(dialog_win, A_BOLD);

    int row = 4;
    if (!location.empty()) {
        mvwprintw(dialog_win, row++, 4, "%s", truncate(location, dialog_width - 6).c_str());
    }
    row++;

    // Buttons
    wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(dialog_win, row, 6, " [Y] Open ");
    wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    mvwprintw(dialog_win, row, 22, " [N] Cancel ");

    // Refresh dialog
    wrefresh(dialog_win);

    // Delete temporary window (but leave content on screen until next render)
    delwin(dialog_win);
}

void TuiApp::render_error_popup(const std::string& message) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int popup_width = std::clamp(static_cast<int>(message.size()) + 6, 40, std::max(40, max_x - 4));
    int popup_height = 7;
    int popup_x = std::max(0, (max_x - popup_width) / 2);
    int popup_y = std::max(0, (max_y - popup_height) / 2);

    WINDOW* popup_win = newwin(popup_height, popup_width, popup_y, popup_x);
    if (!popup_win) return;

    wbkgd(popup_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    wattron(popup_win, COLOR_PAIR(COLOR_PAIR_ERROR));
    box(popup_win, 0, 0);
    wattroff(popup_win, COLOR_PAIR(COLOR_PAIR_ERROR));

    std::string title = " Error ";
    wattron(popup_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    mvwprintw(popup_win, 0, (popup_width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    mvwprintw(popup_win, 2, 3, "%s", truncate(message, popup_width - 6).c_str());
    wattroff(popup_win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);

    wattron(popup_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(popup_win, popup_height - 2, (popup_width - 24) / 2, " Press any key to close ");
    wattroff(popup_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(popup_win);
    delwin(popup_win);
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Help dialog dimensions
    int help_width = 60;
    int help_height = 29;
    int help_x = std::max(0, (max_x - help_width) / 2);
    int help_y = std::max(0, (max_y - help_height) / 2);

    WINDOW* help_win = newwin(std::min(help_height, max_y), std::min(help_width, max_x), help_y, help_x);
    if (!help_win) return;
    getmaxyx(help_win, help_height, help_width);

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    // Title
    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    // Help content
    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last",
        "  Enter/Right/l   Open selected item",
        "  Left/h/Bksp     Go back one level",
        "  Esc             Clear search / back to main menu",
        "",
        "Projects:",
        "  f               Toggle favorite",
        "  t               Open terminal in project",
        "  r               Refresh git status",
        "  R               Rescan project directory",
        "",
        "Search:",
        "  /               Start typing to filter",
        "  Enter           Keep filtered results",
        "  Esc             Cancel search",
        "",
        "Launch dialog:",
        "  y/Enter         Open in IDE",
        "  n/Esc           Cancel",
        "",
        "General:",
        "  q               Quit",
        "  ?               This help"
    };

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", truncate(desc, help_width - 20).c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    // Close instruction
    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, std::max(1, (help_width - 24) / 2), " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    int max_x = getmaxx(status_win_);

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Left side: a transient message replaces the key hints
    if (auto message = navigator_->status_message()) {
        wattron(status_win_, A_BOLD);
        mvwprintw(status_win_, 0, 1, "%s", truncate(*message, max_x - 2).c_str());
        wattroff(status_win_, A_BOLD);
    } else {
        const char* hints = "q:Quit  /:Search  f:Fav  t:Term  r:Refresh  Esc:Menu  ?:Help";
        mvwprintw(status_win_, 0, 1, "%s", truncate(hints, max_x - 2).c_str());
    }

    // Right side: background work, then the active filter
    std::ostringstream right;
    if (navigator_->clone_in_progress()) {
        right << "[cloning...]";
    }
    const auto& search = navigator_->search();
    if (!search.active && !search.query.empty()) {
        if (right.tellp() > 0) right << "  ";
        right << "Filter: " << truncate(search.query, 20);
    }

    std::string indicator = right.str();
    int indicator_x = max_x - static_cast<int>(indicator.length()) - 2;
    if (!indicator.empty() && indicator_x > 0) {
        mvwprintw(status_win_, 0, indicator_x, "%s", indicator.c_str());
    }
}

void TuiApp::render_search_bar() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Search bar just above the status bar
    int search_y = std::max(0, max_y - kStatusBarHeight - 3);
    int search_width = std::min(50, max_x - 4);
    int search_x = (max_x - search_width) / 2;

    WINDOW* search_win = newwin(3, search_width, search_y, search_x);
    if (!search_win) return;

    wbkgd(search_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    wattron(search_win, COLOR_PAIR(COLOR_PAIR_SEARCH));
    box(search_win, 0, 0);
    mvwprintw(search_win, 0, 2, " Search ");
    wattroff(search_win, COLOR_PAIR(COLOR_PAIR_SEARCH));

    // Keep the tail of a long query visible
    std::string query = navigator_->search().query;
    int field = search_width - 6;
    if (field > 0 && static_cast<int>(query.size()) > field) {
        query = query.substr(query.size() - field);
    }
    mvwprintw(search_win, 1, 2, "/ %s", query.c_str());

    // Show cursor
    curs_set(1);
    wmove(search_win, 1, 4 + static_cast<int>(query.length()));

    wrefresh(search_win);
    delwin(search_win);
}

} // namespace pnav
