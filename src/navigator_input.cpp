#include "navigator.hpp"

namespace pnav {

void Navigator::handle_key(const KeyEvent& event) {
    // An error popup takes priority and swallows the key that dismisses it
    if (error_popup_) {
        handle_error_popup_input(event);
        return;
    }

    if (is_showing<HelpView>()) {
        handle_help_input(event);
        return;
    }

    if (is_showing<ConfirmLaunchView>()) {
        handle_confirm_input(event);
        return;
    }

    if (stack_.back().search.active) {
        handle_search_input(event);
        return;
    }

    if (is_showing<InputUrlView>()) {
        handle_url_input(event);
        return;
    }

    handle_list_input(event);
}

void Navigator::handle_error_popup_input([[maybe_unused]] const KeyEvent& event) {
    error_popup_.reset();
}

void Navigator::handle_help_input([[maybe_unused]] const KeyEvent& event) {
    go_back();
}

void Navigator::handle_confirm_input(const KeyEvent& event) {
    switch (event.code) {
        case KeyCode::Enter:
            confirm_launch();
            break;

        case KeyCode::Escape:
        case KeyCode::Backspace:
        case KeyCode::Left:
            go_back();
            break;

        case KeyCode::Char:
            if (event.ch == 'y' || event.ch == 'Y') {
                confirm_launch();
            } else if (event.ch == 'n' || event.ch == 'N') {
                go_back();
            }
            break;

        default:
            break;
    }
}

void Navigator::handle_search_input(const KeyEvent& event) {
    auto& frame = stack_.back();

    switch (event.code) {
        case KeyCode::Escape:
            frame.search.clear();
            clamp_cursor();
            break;

        case KeyCode::Enter:
            commit_search();
            break;

        case KeyCode::Backspace:
            if (!frame.search.query.empty()) {
                frame.search.query.pop_back();
                frame.cursor = 0;
            }
            break;

        case KeyCode::Up:
            move_cursor(-1);
            break;

        case KeyCode::Down:
            move_cursor(1);
            break;

        case KeyCode::PageUp:
            move_cursor(-kPageSize);
            break;

        case KeyCode::PageDown:
            move_cursor(kPageSize);
            break;

        case KeyCode::Char:
            // Printable ASCII only
            if (event.ch >= 32 && event.ch < 127) {
                frame.search.query += event.ch;
                frame.cursor = 0;
            }
            break;

        default:
            break;
    }
}

void Navigator::handle_url_input(const KeyEvent& event) {
    auto& url = std::get<InputUrlView>(stack_.back().view).url;

    switch (event.code) {
        case KeyCode::Enter:
            on_enter();
            break;

        case KeyCode::Backspace:
            if (url.empty()) {
                go_back();
            } else {
                url.pop_back();
            }
            break;

        case KeyCode::Escape:
            on_escape();
            break;

        case KeyCode::Char:
            if (event.ch > 32 && event.ch < 127) {
                url += event.ch;
            }
            break;

        default:
            break;
    }
}

void Navigator::handle_list_input(const KeyEvent& event) {
    switch (event.code) {
        case KeyCode::Up:
            move_cursor(-1);
            return;

        case KeyCode::Down:
            move_cursor(1);
            return;

        case KeyCode::PageUp:
            move_cursor(-kPageSize);
            return;

        case KeyCode::PageDown:
            move_cursor(kPageSize);
            return;

        case KeyCode::Home:
            move_cursor_to(0);
            return;

        case KeyCode::End:
            move_cursor_to(item_count() - 1);
            return;

        case KeyCode::Enter:
        case KeyCode::Right:
            on_enter();
            return;

        case KeyCode::Left:
        case KeyCode::Backspace:
            go_back();
            return;

        case KeyCode::Escape:
            on_escape();
            return;

        case KeyCode::Char:
            break;
    }

    switch (event.ch) {
        case 'q':
        case 'Q':
            request_quit();
            break;

        case 'j':
            move_cursor(1);
            break;

        case 'k':
            move_cursor(-1);
            break;

        case 'g':
            move_cursor_to(0);
            break;

        case 'G':
            move_cursor_to(item_count() - 1);
            break;

        case 'l':
            on_enter();
            break;

        case 'h':
            go_back();
            break;

        case '/':
            begin_search();
            break;

        case '?':
            push(HelpView{});
            break;

        case 'f':  // Toggle favorite
            toggle_favorite();
            break;

        case 't':  // Quick terminal
            open_terminal();
            break;

        case 'r':  // Refresh git status of visible projects
            refresh_status();
            break;

        case 'R':  // Rescan base_dir
            rescan_index();
            break;

        default:
            break;
    }
}

void Navigator::on_escape() {
    auto& search = stack_.back().search;
    if (search.active || !search.query.empty()) {
        search.clear();
        clamp_cursor();
        return;
    }

    if (stack_.size() > 1) {
        pop_to_main();
    }
}

} // namespace pnav
