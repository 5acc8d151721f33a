#pragma once

#include "../navigator.hpp"
#include "../status_cache.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include <ncurses.h>

namespace pnav {

class TuiApp {
public:
    // Non-owning constructor: TuiApp drives but does not own the navigator
    // or the status cache. Both must outlive the TuiApp instance.
    TuiApp(Navigator* navigator, StatusCache* status_cache);
    ~TuiApp();

    void run();

private:
    // Rendering
    void render();
    void render_title();
    void render_list_area();
    void render_main_menu(const ViewFrame& frame);
    void render_category_list(const ViewFrame& frame, const std::string& title);
    void render_project_list(const ViewFrame& frame, const std::string& title);
    void render_theme_list(const ViewFrame& frame);
    void render_url_input(const InputUrlView& view);
    void render_status_bar();
    void render_search_bar();
    void render_confirm_dialog(const ConfirmLaunchView& view);
    void render_help_overlay();
    void render_error_popup(const std::string& message);

    // Input handling
    [[nodiscard]] static std::optional<KeyEvent> translate_key(int ch);

    // Frame shown in the list area: the top frame, or the one below
    // an overlay view (help, launch confirmation)
    [[nodiscard]] const ViewFrame& list_frame() const;

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    void apply_theme();

    // Utility
    void draw_box_title(WINDOW* win, const std::string& title, int color_pair);
    void draw_row_marker(int row, bool selected);
    void scroll_to_cursor(int cursor, int count);
    static std::string truncate(const std::string& text, int width);

    // Non-owned
    Navigator* navigator_ = nullptr;
    StatusCache* status_cache_ = nullptr;

    // ncurses windows
    WINDOW* title_win_ = nullptr;
    WINDOW* list_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    std::atomic<bool> running_{false};
    std::string applied_theme_;

    // Scroll position of the list area
    int scroll_offset_ = 0;
    int visible_rows_ = 0;

    // Layout constants
    static constexpr int kTitleHeight = 3;
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kMargin = 1;
};

} // namespace pnav
