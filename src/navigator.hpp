#pragma once

#include "clone_worker.hpp"
#include "config.hpp"
#include "interfaces/i_process_launcher.hpp"
#include "persistent_lists.hpp"
#include "project_index.hpp"
#include "status_cache.hpp"
#include "viewmodels/views.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pnav {

enum class KeyCode {
    Char,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Enter,
    Backspace,
    Escape
};

struct KeyEvent {
    KeyCode code = KeyCode::Char;
    char ch = '\0';  // Only for KeyCode::Char

    static KeyEvent key(KeyCode code) { return {code, '\0'}; }
    static KeyEvent character(char c) { return {KeyCode::Char, c}; }
};

struct StatusMessage {
    std::string text;
    std::chrono::steady_clock::time_point shown_at;
};

// The navigation and interaction state machine. Owns the view stack and
// the per-path git status map; everything it talks to is borrowed.
class Navigator {
public:
    static constexpr auto kStatusMessageLifetime = std::chrono::seconds(3);
    static constexpr int kPageSize = 10;

    // Non-owning: all pointers must be non-null and outlive the Navigator
    Navigator(Config config,
              ProjectIndex* index,
              PersistentLists* lists,
              StatusCache* status_cache,
              IProcessLauncher* launcher,
              CloneWorker* clone_worker);

    // Input
    void handle_key(const KeyEvent& event);

    // Once per frame: merge finished git status, request missing status for
    // visible projects, collect a finished clone, expire the status message
    void tick();

    // Stack
    [[nodiscard]] const ViewFrame& top() const { return stack_.back(); }
    [[nodiscard]] const View& current_view() const { return stack_.back().view; }
    [[nodiscard]] size_t depth() const { return stack_.size(); }
    [[nodiscard]] const std::vector<ViewFrame>& stack() const { return stack_; }

    template <typename V>
    [[nodiscard]] bool is_showing() const { return std::holds_alternative<V>(current_view()); }

    // Lists of the top frame (or any frame), after its live search filter
    [[nodiscard]] std::vector<std::string> visible_categories() const { return visible_categories(stack_.back()); }
    [[nodiscard]] std::vector<ProjectEntry> visible_projects() const { return visible_projects(stack_.back()); }
    [[nodiscard]] std::vector<std::string> visible_categories(const ViewFrame& frame) const;
    [[nodiscard]] std::vector<ProjectEntry> visible_projects(const ViewFrame& frame) const;
    [[nodiscard]] int item_count() const;
    [[nodiscard]] int cursor() const { return stack_.back().cursor; }
    [[nodiscard]] std::optional<ProjectEntry> selected_project() const;

    // Whether '/' may start a search on the top view
    [[nodiscard]] bool is_searchable() const;
    [[nodiscard]] const SearchState& search() const { return stack_.back().search; }

    // Status and persistence lookups for rendering
    [[nodiscard]] const GitStatus* status_for(const std::string& path) const;
    [[nodiscard]] const std::map<std::string, GitStatus>& statuses() const { return statuses_; }
    [[nodiscard]] bool is_favorite(const std::string& path) const;

    // Transient UI state
    [[nodiscard]] const std::optional<std::string>& error_popup() const { return error_popup_; }
    [[nodiscard]] std::optional<std::string> status_message() const;
    [[nodiscard]] bool clone_in_progress() const;

    [[nodiscard]] bool quit_requested() const { return quit_requested_; }
    [[nodiscard]] const Config& config() const { return config_; }

    // Called after the theme picker changes the config
    void set_on_config_changed(std::function<void(const Config&)> callback);

private:
    // Input handling per mode
    void handle_error_popup_input(const KeyEvent& event);
    void handle_help_input(const KeyEvent& event);
    void handle_confirm_input(const KeyEvent& event);
    void handle_search_input(const KeyEvent& event);
    void handle_url_input(const KeyEvent& event);
    void handle_list_input(const KeyEvent& event);

    // Stack operations
    void push(View view, int cursor = 0);
    void go_back();
    void pop_to_main();
    void on_enter();
    void on_escape();

    // Actions
    void move_cursor(int delta);
    void move_cursor_to(int position);
    void activate_main_menu_item(MainMenuItem item);
    void begin_search();
    void commit_search();
    void confirm_launch();
    void toggle_favorite();
    void open_terminal();
    void refresh_status();
    void rescan_index();
    void start_clone(const std::string& url, const std::string& category);
    void finish_clone(const CloneResult& result);
    void request_quit();
    void request_visible_status();

    // List sources (before the search filter)
    [[nodiscard]] std::vector<std::string> source_categories(const ViewFrame& frame) const;
    [[nodiscard]] std::vector<ProjectEntry> source_projects(const ViewFrame& frame) const;
    [[nodiscard]] std::vector<ProjectEntry> load_entries(const std::vector<std::string>& paths) const;
    [[nodiscard]] ProjectEntry entry_for_path(const std::string& path) const;
    [[nodiscard]] std::string category_path(const std::string& category) const;
    void clamp_cursor();

    void set_status(std::string text);
    void show_error(std::string message);

    Config config_;

    // Non-owned collaborators
    ProjectIndex* index_ = nullptr;
    PersistentLists* lists_ = nullptr;
    StatusCache* status_cache_ = nullptr;
    IProcessLauncher* launcher_ = nullptr;
    CloneWorker* clone_worker_ = nullptr;

    std::vector<ViewFrame> stack_;
    std::map<std::string, GitStatus> statuses_;

    std::optional<std::string> error_popup_;
    std::optional<StatusMessage> status_message_;
    std::string pending_clone_name_;
    bool quit_requested_ = false;

    std::function<void(const Config&)> on_config_changed_;
};

} // namespace pnav
