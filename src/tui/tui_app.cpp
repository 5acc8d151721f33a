#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <cassert>
#include <csignal>
#include <clocale>
#include <algorithm>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace pnav {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(Navigator* navigator, StatusCache* status_cache)
    : navigator_(navigator)
    , status_cache_(status_cache)
{
    assert(navigator_ != nullptr);
    assert(status_cache_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    std::setlocale(LC_ALL, "");

    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    set_escdelay(25);  // Escape must feel instant

    apply_theme();

    // Set terminal title
    printf("\033]0;pnav\007");
    fflush(stdout);

    // Set up resize handler
    signal(SIGWINCH, handle_resize);

    create_windows();

    // Start git status workers
    status_cache_->start();
    spdlog::info("TUI started");

    running_ = true;

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        // Drain all pending input before drawing
        int ch;
        while ((ch = getch()) != ERR) {
            if (ch == KEY_RESIZE) {
                resize_windows();
                continue;
            }
            if (auto event = translate_key(ch)) {
                navigator_->handle_key(*event);
            }
            if (navigator_->quit_requested()) break;
        }

        if (navigator_->quit_requested()) {
            running_ = false;
            break;
        }

        // Merge finished git status, never waits on workers
        navigator_->tick();

        if (navigator_->config().theme != applied_theme_) {
            apply_theme();
        }

        render();

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    // Cleanup
    status_cache_->stop();
    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
    spdlog::info("TUI stopped");
}

void TuiApp::apply_theme() {
    applied_theme_ = navigator_->config().theme;
    init_colors(get_theme(applied_theme_));
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int width = std::max(10, max_x - 2 * kMargin);
    int list_height = std::max(5, max_y - kTitleHeight - kStatusBarHeight - kMargin);

    int y = 0;
    title_win_ = newwin(kTitleHeight, width, y, kMargin);
    y += kTitleHeight;

    list_win_ = newwin(list_height, width, y, kMargin);
    y += list_height;
    visible_rows_ = list_height - 2;  // Account for border

    status_win_ = newwin(kStatusBarHeight, max_x, std::min(y, max_y - 1), 0);

    keypad(title_win_, TRUE);
    keypad(list_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (title_win_) {
        delwin(title_win_);
        title_win_ = nullptr;
    }
    if (list_win_) {
        delwin(list_win_);
        list_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

const ViewFrame& TuiApp::list_frame() const {
    const auto& stack = navigator_->stack();
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        if (!std::holds_alternative<HelpView>(it->view) &&
            !std::holds_alternative<ConfirmLaunchView>(it->view)) {
            return *it;
        }
    }
    return stack.front();
}

void TuiApp::render() {
    curs_set(0);

    // Clear all windows
    werase(title_win_);
    werase(list_win_);
    werase(status_win_);

    render_title();
    render_list_area();
    render_status_bar();

    wnoutrefresh(stdscr);
    wnoutrefresh(title_win_);
    wnoutrefresh(status_win_);
    wnoutrefresh(list_win_);  // Last, so the URL input keeps the cursor
    doupdate();

    // Overlays are drawn straight to the screen on top
    const auto& view = navigator_->current_view();
    if (const auto* confirm = std::get_if<ConfirmLaunchView>(&view)) {
        render_confirm_dialog(*confirm);
    } else if (std::holds_alternative<HelpView>(view)) {
        render_help_overlay();
    }

    if (navigator_->search().active) {
        render_search_bar();
    }

    if (const auto& error = navigator_->error_popup()) {
        render_error_popup(*error);
    }
}

void TuiApp::render_title() {
    const int width = getmaxx(title_win_);

    wattron(title_win_, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(title_win_, 0, 0);
    wattroff(title_win_, COLOR_PAIR(COLOR_PAIR_BORDER));

    std::string title = " " + view_title(list_frame().view) + " ";
    title = truncate(title, width - 2);

    wattron(title_win_, COLOR_PAIR(COLOR_PAIR_BORDER) | A_BOLD);
    mvwprintw(title_win_, 1, std::max(1, (width - static_cast<int>(title.size())) / 2), "%s", title.c_str());
    wattroff(title_win_, COLOR_PAIR(COLOR_PAIR_BORDER) | A_BOLD);
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title, int color_pair) {
    wattron(win, COLOR_PAIR(color_pair));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(color_pair));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(color_pair) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(color_pair) | A_BOLD);
    }
}

void TuiApp::draw_row_marker(int row, bool selected) {
    if (selected) {
        wattron(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
        mvwprintw(list_win_, row, 1, "> ");
        wattroff(list_win_, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
    } else {
        mvwprintw(list_win_, row, 1, "  ");
    }
}

void TuiApp::scroll_to_cursor(int cursor, int count) {
    if (visible_rows_ <= 0) return;

    if (cursor < scroll_offset_) {
        scroll_offset_ = cursor;
    } else if (cursor >= scroll_offset_ + visible_rows_) {
        scroll_offset_ = cursor - visible_rows_ + 1;
    }
    scroll_offset_ = std::clamp(scroll_offset_, 0, std::max(0, count - visible_rows_));
}

std::string TuiApp::truncate(const std::string& text, int width) {
    if (width <= 0) return {};
    if (static_cast<int>(text.size()) <= width) return text;
    if (width <= 3) return text.substr(0, width);
    return text.substr(0, width - 3) + "...";
}

} // namespace pnav
