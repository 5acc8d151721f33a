#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pnav {

// One launchable project directory (second level below base_dir).
// Identity is the canonical path.
struct ProjectEntry {
    std::string name;
    std::string path;
    std::string category;
    std::optional<std::string> language;  // From marker files, e.g. Cargo.toml

    bool operator==(const ProjectEntry& other) const { return path == other.path; }
};

struct Category {
    std::string name;
    std::string path;
    std::vector<ProjectEntry> projects;
};

using Categories = std::vector<Category>;

// Git summary for a project directory. available == false means the status
// could not be computed (not a repository, git missing, timeout).
struct GitStatus {
    bool available = false;
    std::optional<std::string> branch;  // nullopt on detached HEAD
    bool dirty = false;
    std::chrono::steady_clock::time_point fetched_at;

    static GitStatus unavailable() {
        GitStatus status;
        status.fetched_at = std::chrono::steady_clock::now();
        return status;
    }
};

} // namespace pnav
