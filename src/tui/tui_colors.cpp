#include "tui_colors.hpp"

namespace pnav {

static short fg(ThemeColor color) {
    return static_cast<short>(color);
}

void init_colors(const Theme& theme) {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, fg(theme.header_text), -1);
    init_pair(COLOR_PAIR_BORDER, fg(theme.border), -1);
    init_pair(COLOR_PAIR_TEXT, fg(theme.text), -1);
    init_pair(COLOR_PAIR_SELECTED, fg(theme.highlight), -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, fg(theme.border));
    init_pair(COLOR_PAIR_ERROR, fg(theme.error), -1);

    // Project annotations
    init_pair(COLOR_PAIR_GIT_BRANCH, fg(theme.git_branch), -1);
    init_pair(COLOR_PAIR_GIT_CLEAN, fg(theme.git_clean), -1);
    init_pair(COLOR_PAIR_GIT_DIRTY, fg(theme.git_dirty), -1);
    init_pair(COLOR_PAIR_NO_GIT, fg(theme.no_git), -1);
    init_pair(COLOR_PAIR_FAVORITE, fg(theme.git_dirty), -1);
    init_pair(COLOR_PAIR_LANGUAGE, fg(theme.border), -1);

    // Dialogs
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, fg(theme.border));
    init_pair(COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_PAIR_CONFIRM, fg(theme.confirm_border), -1);

    // Search and help
    init_pair(COLOR_PAIR_SEARCH, COLOR_BLACK, COLOR_YELLOW);
    init_pair(COLOR_PAIR_HELP_KEY, fg(theme.header_text), -1);
}

} // namespace pnav
