#include "navigator.hpp"
#include "errors.hpp"
#include "search_filter.hpp"
#include "theme.hpp"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <format>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace pnav {

Navigator::Navigator(Config config,
                     ProjectIndex* index,
                     PersistentLists* lists,
                     StatusCache* status_cache,
                     IProcessLauncher* launcher,
                     CloneWorker* clone_worker)
    : config_(std::move(config))
    , index_(index)
    , lists_(lists)
    , status_cache_(status_cache)
    , launcher_(launcher)
    , clone_worker_(clone_worker)
{
    assert(index_ != nullptr);
    assert(lists_ != nullptr);
    assert(status_cache_ != nullptr);
    assert(launcher_ != nullptr);
    assert(clone_worker_ != nullptr);

    stack_.push_back(ViewFrame{MainMenuView{}});
}

void Navigator::set_on_config_changed(std::function<void(const Config&)> callback) {
    on_config_changed_ = std::move(callback);
}

void Navigator::tick() {
    // Results for paths that are no longer visible are kept: status is
    // keyed by path and reused when the user navigates back
    for (auto& [path, status] : status_cache_->poll()) {
        statuses_[path] = std::move(status);
    }

    request_visible_status();

    if (auto result = clone_worker_->poll()) {
        finish_clone(*result);
    }

    if (status_message_ && std::chrono::steady_clock::now() - status_message_->shown_at > kStatusMessageLifetime) {
        status_message_.reset();
    }
}

void Navigator::request_visible_status() {
    for (const auto& project : visible_projects()) {
        if (!statuses_.contains(project.path)) {
            status_cache_->request(project.path);
        }
    }
}

// ---------------------------------------------------------------------------
// Lists
// ---------------------------------------------------------------------------

std::vector<std::string> Navigator::source_categories(const ViewFrame& frame) const {
    return std::visit(overloaded{
        [this](const CategoryListView&) {
            std::vector<std::string> names;
            for (const auto& category : *index_->snapshot()) {
                names.push_back(category.name);
            }
            return names;
        },
        [this](const CloneCategoryView&) {
            std::vector<std::string> names;
            for (const auto& category : *index_->snapshot()) {
                names.push_back(category.name);
            }
            return names;
        },
        [](const SearchResultsView& v) {
            return v.source == SearchSource::Projects ? std::vector<std::string>{} : v.categories;
        },
        [](const auto&) { return std::vector<std::string>{}; },
    }, frame.view);
}

std::vector<ProjectEntry> Navigator::source_projects(const ViewFrame& frame) const {
    return std::visit(overloaded{
        [this](const ProjectListView& v) {
            auto snapshot = index_->snapshot();
            auto it = std::ranges::find(*snapshot, v.category, &Category::name);
            return it != snapshot->end() ? it->projects : std::vector<ProjectEntry>{};
        },
        [](const FavoritesView& v) { return v.projects; },
        [](const RecentView& v) { return v.projects; },
        [](const SearchResultsView& v) {
            return v.source == SearchSource::Projects ? v.projects : std::vector<ProjectEntry>{};
        },
        [](const auto&) { return std::vector<ProjectEntry>{}; },
    }, frame.view);
}

std::vector<std::string> Navigator::visible_categories(const ViewFrame& frame) const {
    return filter(source_categories(frame), frame.search.query,
                  [](const std::string& name) { return name; });
}

std::vector<ProjectEntry> Navigator::visible_projects(const ViewFrame& frame) const {
    return filter(source_projects(frame), frame.search.query,
                  [](const ProjectEntry& entry) { return entry.name; });
}

int Navigator::item_count() const {
    return std::visit(overloaded{
        [](const MainMenuView&) { return static_cast<int>(kMainMenuItems.size()); },
        [](const ThemeSelectionView&) { return static_cast<int>(theme_names().size()); },
        [this](const CategoryListView&) { return static_cast<int>(visible_categories().size()); },
        [this](const CloneCategoryView&) { return static_cast<int>(visible_categories().size()); },
        [this](const SearchResultsView& v) {
            return v.source == SearchSource::Projects
                ? static_cast<int>(visible_projects().size())
                : static_cast<int>(visible_categories().size());
        },
        [this](const ProjectListView&) { return static_cast<int>(visible_projects().size()); },
        [this](const FavoritesView&) { return static_cast<int>(visible_projects().size()); },
        [this](const RecentView&) { return static_cast<int>(visible_projects().size()); },
        [](const ConfirmLaunchView&) { return 0; },
        [](const HelpView&) { return 0; },
        [](const InputUrlView&) { return 0; },
    }, current_view());
}

std::optional<ProjectEntry> Navigator::selected_project() const {
    auto projects = visible_projects();
    const int pos = stack_.back().cursor;
    if (pos < 0 || pos >= static_cast<int>(projects.size())) {
        return std::nullopt;
    }
    return projects[pos];
}

bool Navigator::is_searchable() const {
    return is_showing<CategoryListView>() || is_showing<ProjectListView>() ||
           is_showing<FavoritesView>() || is_showing<RecentView>() ||
           is_showing<CloneCategoryView>();
}

ProjectEntry Navigator::entry_for_path(const std::string& path) const {
    for (const auto& category : *index_->snapshot()) {
        auto it = std::ranges::find(category.projects, path, &ProjectEntry::path);
        if (it != category.projects.end()) {
            return *it;
        }
    }

    // Not under base_dir (or not scanned yet): derive what we can from the path
    const fs::path p(path);
    ProjectEntry entry;
    entry.name = p.filename().string();
    entry.path = path;
    entry.category = p.parent_path().filename().string();
    entry.language = ProjectIndex::detect_language(path);
    return entry;
}

std::vector<ProjectEntry> Navigator::load_entries(const std::vector<std::string>& paths) const {
    std::vector<ProjectEntry> entries;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            entries.push_back(entry_for_path(path));
        }
    }
    return entries;
}

std::string Navigator::category_path(const std::string& category) const {
    auto snapshot = index_->snapshot();
    if (auto it = std::ranges::find(*snapshot, category, &Category::name); it != snapshot->end()) {
        return it->path;
    }
    return (fs::path(config_.base_dir) / category).string();
}

const GitStatus* Navigator::status_for(const std::string& path) const {
    auto it = statuses_.find(path);
    return it != statuses_.end() ? &it->second : nullptr;
}

bool Navigator::is_favorite(const std::string& path) const {
    return lists_->is_favorite(path);
}

bool Navigator::clone_in_progress() const {
    return clone_worker_->is_busy();
}

std::optional<std::string> Navigator::status_message() const {
    if (!status_message_) return std::nullopt;
    if (std::chrono::steady_clock::now() - status_message_->shown_at > kStatusMessageLifetime) {
        return std::nullopt;
    }
    return status_message_->text;
}

void Navigator::set_status(std::string text) {
    status_message_ = StatusMessage{std::move(text), std::chrono::steady_clock::now()};
}

void Navigator::show_error(std::string message) {
    spdlog::warn("{}", message);
    error_popup_ = std::move(message);
}

// ---------------------------------------------------------------------------
// Stack
// ---------------------------------------------------------------------------

void Navigator::push(View view, const int cursor) {
    stack_.push_back(ViewFrame{std::move(view), cursor});
    clamp_cursor();
}

void Navigator::go_back() {
    // MainMenu is the floor of the stack
    if (stack_.size() <= 1) return;

    // The frame's search state goes with it
    stack_.pop_back();
    clamp_cursor();
}

void Navigator::pop_to_main() {
    stack_.resize(1);
    stack_.front().search.clear();
}

void Navigator::clamp_cursor() {
    auto& frame = stack_.back();
    const int count = item_count();
    frame.cursor = count == 0 ? 0 : std::clamp(frame.cursor, 0, count - 1);
}

void Navigator::move_cursor(const int delta) {
    move_cursor_to(stack_.back().cursor + delta);
}

void Navigator::move_cursor_to(const int position) {
    auto& frame = stack_.back();
    const int count = item_count();
    if (count == 0) {
        frame.cursor = 0;
        return;
    }
    frame.cursor = std::clamp(position, 0, count - 1);
}

void Navigator::on_enter() {
    const int pos = stack_.back().cursor;

    // Work on a copy: pushing may reallocate the stack
    const View view = current_view();
    std::visit(overloaded{
        [&](const MainMenuView&) {
            if (pos >= 0 && pos < static_cast<int>(kMainMenuItems.size())) {
                activate_main_menu_item(kMainMenuItems[pos]);
            }
        },
        [&](const CategoryListView&) {
            auto categories = visible_categories();
            if (pos < static_cast<int>(categories.size())) {
                push(ProjectListView{categories[pos]});
            }
        },
        [&](const CloneCategoryView& v) {
            auto categories = visible_categories();
            if (pos < static_cast<int>(categories.size())) {
                start_clone(v.url, categories[pos]);
            }
        },
        [&](const ProjectListView&) {
            if (auto project = selected_project()) push(ConfirmLaunchView{*project});
        },
        [&](const FavoritesView&) {
            if (auto project = selected_project()) push(ConfirmLaunchView{*project});
        },
        [&](const RecentView&) {
            if (auto project = selected_project()) push(ConfirmLaunchView{*project});
        },
        [&](const SearchResultsView& v) {
            if (v.source == SearchSource::Projects) {
                if (auto project = selected_project()) push(ConfirmLaunchView{*project});
                return;
            }
            auto categories = visible_categories();
            if (pos >= static_cast<int>(categories.size())) return;
            if (v.source == SearchSource::Categories) {
                push(ProjectListView{categories[pos]});
            } else {
                start_clone(v.clone_url, categories[pos]);
            }
        },
        [&](const ConfirmLaunchView&) {
            confirm_launch();
        },
        [&](const HelpView&) {
            go_back();
        },
        [&](const InputUrlView& v) {
            if (!v.url.empty()) {
                push(CloneCategoryView{v.url});
            }
        },
        [&](const ThemeSelectionView&) {
            const auto& names = theme_names();
            if (pos < static_cast<int>(names.size())) {
                config_.theme = names[pos];
                spdlog::info("Theme set to {}", config_.theme);
                if (on_config_changed_) {
                    on_config_changed_(config_);
                }
                set_status(std::format("Theme: {}", config_.theme));
                go_back();
            }
        },
    }, view);
}

void Navigator::activate_main_menu_item(const MainMenuItem item) {
    switch (item) {
        case MainMenuItem::Favorites: {
            std::vector<std::string> paths(lists_->favorites().begin(), lists_->favorites().end());
            auto projects = load_entries(paths);
            std::ranges::sort(projects, [](const ProjectEntry& a, const ProjectEntry& b) {
                return to_lower(a.name) < to_lower(b.name);
            });
            push(FavoritesView{std::move(projects)});
            break;
        }
        case MainMenuItem::Recent:
            push(RecentView{load_entries(lists_->recents())});
            break;
        case MainMenuItem::OpenProject:
            push(CategoryListView{});
            break;
        case MainMenuItem::CloneRepository:
            push(InputUrlView{});
            break;
        case MainMenuItem::OpenIde:
            push(ConfirmLaunchView{std::nullopt});
            break;
        case MainMenuItem::ChooseTheme: {
            const auto& names = theme_names();
            auto it = std::ranges::find(names, config_.theme);
            push(ThemeSelectionView{}, it != names.end() ? static_cast<int>(it - names.begin()) : 0);
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Search
// ---------------------------------------------------------------------------

void Navigator::begin_search() {
    if (!is_searchable()) return;
    auto& search = stack_.back().search;
    search.active = true;
}

void Navigator::commit_search() {
    auto& frame = stack_.back();
    if (frame.search.query.empty()) {
        frame.search.clear();
        return;
    }

    SearchResultsView results;
    results.query = frame.search.query;
    results.source_title = view_title(frame.view);

    if (const auto* clone_view = std::get_if<CloneCategoryView>(&frame.view)) {
        results.source = SearchSource::CloneCategories;
        results.clone_url = clone_view->url;
        results.categories = visible_categories();
    } else if (std::holds_alternative<CategoryListView>(frame.view)) {
        results.source = SearchSource::Categories;
        results.categories = visible_categories();
    } else {
        results.source = SearchSource::Projects;
        results.projects = visible_projects();
    }

    // The source view goes back to its full list; the results are frozen
    frame.search.clear();
    frame.cursor = 0;
    push(std::move(results));
}

// ---------------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------------

void Navigator::confirm_launch() {
    const auto* confirm = std::get_if<ConfirmLaunchView>(&current_view());
    if (!confirm) return;

    const auto target = confirm->target;
    std::optional<std::string> project_path;
    if (target) {
        project_path = target->path;
    }

    const LaunchResult result = launcher_->launch_ide(project_path);

    if (!result.success) {
        // ConfirmLaunch stays on top so the user can retry or cancel
        show_error(std::format("Launch failed: {}", result.error_message));
        return;
    }

    if (target) {
        lists_->record_opened(target->path);
        spdlog::info("Launched IDE for {}", target->path);
        set_status(std::format("Launched {}!", target->name));
    } else {
        spdlog::info("Launched IDE");
        set_status("Opening IDE...");
    }
    go_back();
}

void Navigator::toggle_favorite() {
    auto project = selected_project();
    if (!project) return;

    if (lists_->toggle_favorite(project->path)) {
        set_status(std::format("Added {} to favorites", project->name));
    } else {
        set_status(std::format("Removed {} from favorites", project->name));
    }
}

void Navigator::open_terminal() {
    auto project = selected_project();
    if (!project) return;

    const LaunchResult result = launcher_->open_terminal(project->path);
    if (!result.success) {
        show_error(std::format("Could not open terminal: {}", result.error_message));
        return;
    }
    set_status(std::format("Opened terminal for {}!", project->name));
}

void Navigator::refresh_status() {
    auto& frame = stack_.back();

    // Favorites and recents are re-read, other lists come from the index
    if (std::holds_alternative<FavoritesView>(frame.view)) {
        std::vector<std::string> paths(lists_->favorites().begin(), lists_->favorites().end());
        auto projects = load_entries(paths);
        std::ranges::sort(projects, [](const ProjectEntry& a, const ProjectEntry& b) {
            return to_lower(a.name) < to_lower(b.name);
        });
        frame.view = FavoritesView{std::move(projects)};
    } else if (std::holds_alternative<RecentView>(frame.view)) {
        frame.view = RecentView{load_entries(lists_->recents())};
    }
    clamp_cursor();

    for (const auto& project : visible_projects()) {
        status_cache_->invalidate(project.path);
        status_cache_->request(project.path);
    }
    set_status("Status refreshed!");
}

void Navigator::rescan_index() {
    try {
        index_->rescan(config_.base_dir);
    } catch (const ScanError& e) {
        show_error(e.what());
        return;
    }
    clamp_cursor();
    set_status("Projects rescanned");
}

void Navigator::start_clone(const std::string& url, const std::string& category) {
    if (clone_worker_->is_busy()) {
        show_error("Another clone is still running");
        return;
    }

    pending_clone_name_ = repository_name(url);

    if (!clone_worker_->start(url, category_path(category))) {
        show_error("Another clone is still running");
        return;
    }
    set_status(std::format("Cloning {}...", pending_clone_name_));
    pop_to_main();
}

void Navigator::finish_clone(const CloneResult& result) {
    if (!result.success) {
        show_error(std::format("Clone failed: {}", result.error_message));
        return;
    }

    try {
        index_->rescan(config_.base_dir);
    } catch (const ScanError& e) {
        spdlog::warn("Rescan after clone failed: {}", e.what());
    }

    lists_->record_opened(result.project_path);

    const LaunchResult launch = launcher_->launch_ide(result.project_path);
    if (!launch.success) {
        show_error(std::format("Cloned {}, but launch failed: {}", pending_clone_name_, launch.error_message));
        return;
    }
    set_status(std::format("Cloned and opened {}!", pending_clone_name_));
}

void Navigator::request_quit() {
    if (!lists_->flush()) {
        spdlog::warn("Favorites or recent projects were not saved");
    }
    quit_requested_ = true;
}

} // namespace pnav
