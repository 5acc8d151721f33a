#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace pnav {

// Favorites and recently opened projects, keyed by path and written
// through to storage on every change.
class PersistentLists {
public:
    static constexpr size_t kMaxRecents = 10;

    explicit PersistentLists(std::filesystem::path storage_dir);

    // Read both files. Every stored path is kept, including ones that do
    // not exist right now (unmounted drive); views skip those when listing.
    void load();

    // Add or remove path; returns the new membership
    bool toggle_favorite(const std::string& path);
    [[nodiscard]] bool is_favorite(const std::string& path) const;

    // Move path to the front of the recent list, evicting past kMaxRecents
    void record_opened(const std::string& path);

    // Write both lists; false if either write failed
    bool flush();

    [[nodiscard]] const std::set<std::string>& favorites() const { return favorites_; }
    [[nodiscard]] const std::vector<std::string>& recents() const { return recents_; }

    [[nodiscard]] std::filesystem::path favorites_file() const { return storage_dir_ / "favorites.yaml"; }
    [[nodiscard]] std::filesystem::path recents_file() const { return storage_dir_ / "recents.yaml"; }

private:
    bool save_favorites();
    bool save_recents();

    static std::vector<std::string> read_list(const std::filesystem::path& file, const char* key);

    std::filesystem::path storage_dir_;
    std::set<std::string> favorites_;
    std::vector<std::string> recents_;
};

} // namespace pnav
