#pragma once

#include <filesystem>
#include <string>

namespace pnav {

struct Config {
    std::string base_dir;
    std::string idea_path = "idea";
    std::string terminal_command = "kitty --directory";
    std::string theme = "Darcula (default)";

    static Config defaults();
};

// Load config from file, creating it with defaults if absent.
// Missing keys take their default values. Throws ConfigError on
// unreadable or malformed files.
Config load_config(const std::filesystem::path& file);

// Where older releases kept their TOML config, next to the pnav config
// directory. Only reported when the YAML config is first created.
std::filesystem::path legacy_config_file(const std::filesystem::path& file);

// Persist config; false (and a logged error) on failure
bool save_config(const Config& config, const std::filesystem::path& file);

// Startup checks: base_dir is an existing directory and idea_path
// resolves to an executable. Throws ConfigError describing the problem.
void validate_config(const Config& config);

} // namespace pnav
