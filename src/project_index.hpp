#pragma once

#include "project_info.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace pnav {

class ProjectIndex {
public:
    ProjectIndex();

    // Scan base_dir two levels deep: categories, then projects.
    // Throws ScanError if base_dir is missing or unreadable.
    [[nodiscard]] static Categories scan(const std::string& base_dir);

    // Build a fresh snapshot and swap it in. Readers holding the old
    // snapshot keep a valid copy.
    void rescan(const std::string& base_dir);

    [[nodiscard]] std::shared_ptr<const Categories> snapshot() const;

    [[nodiscard]] const std::string& base_dir() const { return base_dir_; }

    // Detect a language label from well-known marker files
    [[nodiscard]] static std::optional<std::string> detect_language(const std::string& dir);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Categories> categories_;
    std::string base_dir_;
};

} // namespace pnav
