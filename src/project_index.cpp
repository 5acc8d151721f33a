#include "project_index.hpp"
#include "errors.hpp"
#include "search_filter.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace pnav {

namespace {

bool is_hidden(const std::string& name) {
    return name.empty() || name[0] == '.';
}

// Visible subdirectories of dir, ordered case-insensitively.
// Entries that disappear or cannot be stat'ed while listing are skipped.
std::vector<fs::path> list_subdirectories(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> result;
    fs::directory_iterator it(dir, ec);
    if (ec) return result;

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        const auto name = it->path().filename().string();
        if (is_hidden(name)) continue;

        std::error_code entry_ec;
        if (!it->is_directory(entry_ec) || entry_ec) continue;

        result.push_back(it->path());
    }

    std::ranges::sort(result, [](const fs::path& a, const fs::path& b) {
        return to_lower(a.filename().string()) < to_lower(b.filename().string());
    });
    return result;
}

} // namespace

ProjectIndex::ProjectIndex()
    : categories_(std::make_shared<const Categories>()) {
}

Categories ProjectIndex::scan(const std::string& base_dir) {
    std::error_code ec;
    fs::path base = fs::canonical(base_dir, ec);
    if (ec) {
        throw ScanError(std::format("Base directory {} does not exist: {}", base_dir, ec.message()));
    }
    if (!fs::is_directory(base, ec)) {
        throw ScanError(std::format("Base directory {} is not a directory", base.string()));
    }

    auto category_dirs = list_subdirectories(base, ec);
    if (ec) {
        throw ScanError(std::format("Cannot read base directory {}: {}", base.string(), ec.message()));
    }

    Categories categories;
    categories.reserve(category_dirs.size());

    for (const auto& category_dir : category_dirs) {
        Category category;
        category.name = category_dir.filename().string();
        category.path = category_dir.string();

        std::error_code cat_ec;
        for (const auto& project_dir : list_subdirectories(category_dir, cat_ec)) {
            ProjectEntry entry;
            entry.name = project_dir.filename().string();
            entry.path = project_dir.string();
            entry.category = category.name;
            entry.language = detect_language(entry.path);
            category.projects.push_back(std::move(entry));
        }
        if (cat_ec) {
            // Unreadable category: keep it listed, just empty
            spdlog::warn("Cannot read category {}: {}", category.path, cat_ec.message());
        }

        categories.push_back(std::move(category));
    }

    return categories;
}

void ProjectIndex::rescan(const std::string& base_dir) {
    auto fresh = std::make_shared<const Categories>(scan(base_dir));

    size_t project_count = 0;
    for (const auto& category : *fresh) {
        project_count += category.projects.size();
    }
    spdlog::info("Scanned {}: {} categories, {} projects", base_dir, fresh->size(), project_count);

    std::lock_guard lock(mutex_);
    categories_ = std::move(fresh);
    base_dir_ = base_dir;
}

std::shared_ptr<const Categories> ProjectIndex::snapshot() const {
    std::lock_guard lock(mutex_);
    return categories_;
}

std::optional<std::string> ProjectIndex::detect_language(const std::string& dir) {
    static const std::pair<const char*, const char*> markers[] = {
        {"Cargo.toml", "Rust"},
        {"pom.xml", "Java"},
        {"build.gradle", "Java"},
        {"package.json", "JS/TS"},
        {"pyproject.toml", "Python"},
        {"requirements.txt", "Python"},
        {"go.mod", "Go"},
    };

    const fs::path root(dir);
    for (const auto& [file, language] : markers) {
        std::error_code ec;
        if (fs::exists(root / file, ec)) {
            return language;
        }
    }
    return std::nullopt;
}

} // namespace pnav
