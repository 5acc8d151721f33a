#include "tui_app.hpp"

namespace pnav {

std::optional<KeyEvent> TuiApp::translate_key(int ch) {
    switch (ch) {
        case KEY_UP:
            return KeyEvent::key(KeyCode::Up);

        case KEY_DOWN:
            return KeyEvent::key(KeyCode::Down);

        case KEY_LEFT:
            return KeyEvent::key(KeyCode::Left);

        case KEY_RIGHT:
            return KeyEvent::key(KeyCode::Right);

        case KEY_HOME:
            return KeyEvent::key(KeyCode::Home);

        case KEY_END:
            return KeyEvent::key(KeyCode::End);

        case KEY_PPAGE:
            return KeyEvent::key(KeyCode::PageUp);

        case KEY_NPAGE:
            return KeyEvent::key(KeyCode::PageDown);

        case KEY_ENTER:
        case '\n':
        case '\r':
            return KeyEvent::key(KeyCode::Enter);

        case KEY_BACKSPACE:
        case 127:
        case '\b':
            return KeyEvent::key(KeyCode::Backspace);

        case 27:  // Escape
            return KeyEvent::key(KeyCode::Escape);

        default:
            // Printable ASCII only, everything else is ignored
            if (ch >= 32 && ch < 127) {
                return KeyEvent::character(static_cast<char>(ch));
            }
            return std::nullopt;
    }
}

} // namespace pnav
