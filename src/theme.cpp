#include "theme.hpp"
#include <algorithm>

namespace pnav {

namespace {

using C = ThemeColor;

const std::vector<Theme>& all_themes() {
    //                 name                 border      header      highlight   confirm     branch      clean       dirty       no_git      text        error
    static const std::vector<Theme> themes = {
        {"Darcula (default)", C::Blue,    C::Cyan,    C::Yellow,  C::Magenta, C::Cyan,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Catppuccin Mocha",  C::Magenta, C::Blue,    C::Magenta, C::Red,     C::Blue,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Dracula",           C::Magenta, C::Cyan,    C::Green,   C::Red,     C::Cyan,    C::Green,   C::Yellow,  C::Blue,    C::White,   C::Red},
        {"Gruvbox",           C::Yellow,  C::Yellow,  C::Green,   C::Red,     C::Blue,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Nord",              C::Cyan,    C::Cyan,    C::Blue,    C::Magenta, C::Cyan,    C::Green,   C::Yellow,  C::White,   C::White,   C::Red},
        {"Solarized Dark",    C::Blue,    C::Cyan,    C::Yellow,  C::Magenta, C::Blue,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"One Dark",          C::Blue,    C::Blue,    C::Magenta, C::Red,     C::Cyan,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Tokyo Night",       C::Blue,    C::Magenta, C::Cyan,    C::Magenta, C::Blue,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Everforest",        C::Green,   C::Green,   C::Yellow,  C::Red,     C::Cyan,    C::Green,   C::Yellow,  C::White,   C::Default, C::Red},
        {"Rose Pine",         C::Magenta, C::Red,     C::Yellow,  C::Red,     C::Cyan,    C::Cyan,    C::Yellow,  C::White,   C::Default, C::Red},
        {"Ayu Mirage",        C::Yellow,  C::Yellow,  C::Cyan,    C::Red,     C::Blue,    C::Green,   C::Magenta, C::White,   C::Default, C::Red},
    };
    return themes;
}

} // namespace

const std::vector<std::string>& theme_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& theme : all_themes()) {
            result.push_back(theme.name);
        }
        return result;
    }();
    return names;
}

const Theme& get_theme(const std::string& name) {
    const auto& themes = all_themes();
    auto it = std::ranges::find(themes, name, &Theme::name);
    return it != themes.end() ? *it : themes.front();
}

} // namespace pnav
