#pragma once

#include <string>
#include <vector>

namespace pnav {

// The eight ANSI colors plus the terminal default. Values match the
// curses COLOR_* constants.
enum class ThemeColor : short {
    Default = -1,
    Black = 0,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White
};

struct Theme {
    std::string name;
    ThemeColor border;
    ThemeColor header_text;
    ThemeColor highlight;
    ThemeColor confirm_border;
    ThemeColor git_branch;
    ThemeColor git_clean;
    ThemeColor git_dirty;
    ThemeColor no_git;
    ThemeColor text;
    ThemeColor error;
};

[[nodiscard]] const std::vector<std::string>& theme_names();

// Unknown names fall back to the default theme
[[nodiscard]] const Theme& get_theme(const std::string& name);

} // namespace pnav
