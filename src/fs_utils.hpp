#pragma once

#include <filesystem>
#include <string>

namespace pnav {

// $XDG_CONFIG_HOME/pnav, falling back to ~/.config/pnav
[[nodiscard]] std::filesystem::path default_config_dir();

// Write content to a temporary sibling of path and rename it over path,
// so readers see either the old file or the new one. Creates missing
// parent directories. Returns false and fills error on failure.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content, std::string& error);

// Resolve an executable the way execvp would: names containing '/' are
// checked directly, bare names are searched in $PATH. Returns an empty
// path if nothing executable was found.
[[nodiscard]] std::filesystem::path find_executable(const std::string& name);

} // namespace pnav
