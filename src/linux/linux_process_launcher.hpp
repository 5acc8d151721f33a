#pragma once

#include "../interfaces/i_process_launcher.hpp"
#include <string>
#include <vector>

namespace pnav {

// Split a terminal command template on whitespace. A "{path}" token is
// replaced by directory; without one, directory is appended.
std::vector<std::string> build_terminal_argv(const std::string& command_template, const std::string& directory);

class LinuxProcessLauncher : public IProcessLauncher {
public:
    LinuxProcessLauncher(std::string idea_path, std::string terminal_command);

    LaunchResult launch_ide(const std::optional<std::string>& project_path) override;
    LaunchResult open_terminal(const std::string& directory) override;

private:
    std::string idea_path_;
    std::string terminal_command_;
};

} // namespace pnav
