#pragma once

#include <optional>
#include <string>

namespace pnav {

struct LaunchResult {
    bool success = false;
    std::string error_message;
};

// Fire-and-forget process spawning. Implementations never wait for the
// launched program and never throw.
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Start the IDE, optionally opening project_path
    virtual LaunchResult launch_ide(const std::optional<std::string>& project_path) = 0;

    // Start a terminal emulator in directory
    virtual LaunchResult open_terminal(const std::string& directory) = 0;
};

} // namespace pnav
