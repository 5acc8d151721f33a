#include "persistent_lists.hpp"
#include "fs_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace pnav {

namespace {

std::string emit_list(const char* key, const auto& paths) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& path : paths) {
        out << path;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

} // namespace

PersistentLists::PersistentLists(fs::path storage_dir)
    : storage_dir_(std::move(storage_dir)) {
}

std::vector<std::string> PersistentLists::read_list(const fs::path& file, const char* key) {
    std::vector<std::string> result;

    std::error_code ec;
    if (!fs::exists(file, ec)) return result;

    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (YAML::Node list = root[key]; list && list.IsSequence()) {
            for (const auto& item : list) {
                if (item.IsScalar()) {
                    result.push_back(item.as<std::string>());
                }
            }
        }
    } catch (const YAML::Exception& e) {
        // A corrupt list is treated as empty; it is replaced on the next save
        spdlog::warn("Ignoring unreadable {}: {}", file.string(), e.what());
    }
    return result;
}

void PersistentLists::load() {
    favorites_.clear();
    recents_.clear();

    for (auto& path : read_list(favorites_file(), "favorites")) {
        favorites_.insert(std::move(path));
    }

    for (auto& path : read_list(recents_file(), "recent")) {
        if (recents_.size() >= kMaxRecents) break;
        if (std::ranges::find(recents_, path) == recents_.end()) {
            recents_.push_back(std::move(path));
        }
    }

    spdlog::info("Loaded {} favorites and {} recent projects", favorites_.size(), recents_.size());
}

bool PersistentLists::toggle_favorite(const std::string& path) {
    bool now_favorite;
    if (favorites_.erase(path) > 0) {
        now_favorite = false;
    } else {
        favorites_.insert(path);
        now_favorite = true;
    }
    save_favorites();
    return now_favorite;
}

bool PersistentLists::is_favorite(const std::string& path) const {
    return favorites_.contains(path);
}

void PersistentLists::record_opened(const std::string& path) {
    std::erase(recents_, path);
    recents_.insert(recents_.begin(), path);
    if (recents_.size() > kMaxRecents) {
        recents_.resize(kMaxRecents);
    }
    save_recents();
}

bool PersistentLists::flush() {
    bool ok = save_favorites();
    ok = save_recents() && ok;
    return ok;
}

bool PersistentLists::save_favorites() {
    std::string error;
    if (!write_file_atomic(favorites_file(), emit_list("favorites", favorites_), error)) {
        spdlog::error("Failed to save favorites: {}", error);
        return false;
    }
    return true;
}

bool PersistentLists::save_recents() {
    std::string error;
    if (!write_file_atomic(recents_file(), emit_list("recent", recents_), error)) {
        spdlog::error("Failed to save recent projects: {}", error);
        return false;
    }
    return true;
}

} // namespace pnav
