#include "config.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include <cstdlib>
#include <format>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace pnav {

namespace {

void read_string(const YAML::Node& root, const char* key, std::string& out) {
    if (YAML::Node value = root[key]; value) {
        if (!value.IsScalar()) {
            throw ConfigError(std::format("config key '{}' must be a string", key));
        }
        out = value.as<std::string>();
    }
}

std::string expand_home(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace

fs::path legacy_config_file(const fs::path& file) {
    return file.parent_path().parent_path() / "idea-tui" / "default-config.toml";
}

Config Config::defaults() {
    Config config;
    if (const char* home = std::getenv("HOME")) {
        config.base_dir = (fs::path(home) / "dev").string();
    } else {
        config.base_dir = "dev";
    }
    return config;
}

Config load_config(const fs::path& file) {
    Config config = Config::defaults();

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        spdlog::info("No config at {}, writing defaults", file.string());
        if (const fs::path legacy = legacy_config_file(file); fs::exists(legacy, ec)) {
            spdlog::warn("Found old config {}; it is not read, copy its values into {}",
                         legacy.string(), file.string());
        }
        if (!save_config(config, file)) {
            spdlog::warn("Continuing with built-in defaults");
        }
        return config;
    }

    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (root.IsMap()) {
            read_string(root, "base_dir", config.base_dir);
            read_string(root, "idea_path", config.idea_path);
            read_string(root, "terminal_command", config.terminal_command);
            read_string(root, "theme", config.theme);
        } else if (!root.IsNull()) {
            throw ConfigError(std::format("{}: expected a mapping at top level", file.string()));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::format("{}: {}", file.string(), e.what()));
    }

    config.base_dir = expand_home(config.base_dir);
    config.idea_path = expand_home(config.idea_path);
    return config;
}

bool save_config(const Config& config, const fs::path& file) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "base_dir" << YAML::Value << config.base_dir;
    out << YAML::Key << "idea_path" << YAML::Value << config.idea_path;
    out << YAML::Key << "terminal_command" << YAML::Value << config.terminal_command;
    out << YAML::Key << "theme" << YAML::Value << config.theme;
    out << YAML::EndMap;

    std::string error;
    if (!write_file_atomic(file, std::string(out.c_str()) + "\n", error)) {
        spdlog::error("Failed to save config: {}", error);
        return false;
    }
    return true;
}

void validate_config(const Config& config) {
    std::error_code ec;
    if (config.base_dir.empty() || !fs::exists(config.base_dir, ec)) {
        throw ConfigError(std::format("base_dir '{}' does not exist", config.base_dir));
    }
    if (!fs::is_directory(config.base_dir, ec)) {
        throw ConfigError(std::format("base_dir '{}' is not a directory", config.base_dir));
    }
    if (find_executable(config.idea_path).empty()) {
        throw ConfigError(std::format("idea_path '{}' is not an executable file or on PATH", config.idea_path));
    }
}

} // namespace pnav
