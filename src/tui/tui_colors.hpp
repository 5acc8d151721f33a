#pragma once

#include "../theme.hpp"
#include <ncurses.h>

namespace pnav {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_TEXT,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_GIT_BRANCH,
    COLOR_PAIR_GIT_CLEAN,
    COLOR_PAIR_GIT_DIRTY,
    COLOR_PAIR_NO_GIT,
    COLOR_PAIR_FAVORITE,
    COLOR_PAIR_LANGUAGE,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_CONFIRM,
    COLOR_PAIR_SEARCH,
    COLOR_PAIR_HELP_KEY,
};

// (Re)initialize ncurses color pairs from a theme
void init_colors(const Theme& theme);

} // namespace pnav
