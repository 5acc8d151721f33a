#include "linux_process_launcher.hpp"
#include "subprocess.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace pnav {

std::vector<std::string> build_terminal_argv(const std::string& command_template, const std::string& directory) {
    std::vector<std::string> argv;
    bool substituted = false;

    std::istringstream tokens(command_template);
    std::string token;
    while (tokens >> token) {
        if (auto pos = token.find("{path}"); pos != std::string::npos) {
            token.replace(pos, 6, directory);
            substituted = true;
        }
        argv.push_back(std::move(token));
    }

    if (!argv.empty() && !substituted) {
        argv.push_back(directory);
    }
    return argv;
}

LinuxProcessLauncher::LinuxProcessLauncher(std::string idea_path, std::string terminal_command)
    : idea_path_(std::move(idea_path))
    , terminal_command_(std::move(terminal_command)) {
}

LaunchResult LinuxProcessLauncher::launch_ide(const std::optional<std::string>& project_path) {
    std::vector<std::string> argv{idea_path_};
    if (project_path) {
        argv.push_back(*project_path);
    }

    LaunchResult result;
    result.error_message = spawn_detached(argv, {});
    result.success = result.error_message.empty();
    if (!result.success) {
        spdlog::error("IDE launch failed: {}", result.error_message);
    }
    return result;
}

LaunchResult LinuxProcessLauncher::open_terminal(const std::string& directory) {
    LaunchResult result;

    auto argv = build_terminal_argv(terminal_command_, directory);
    if (argv.empty()) {
        result.error_message = "terminal_command is empty";
        return result;
    }

    result.error_message = spawn_detached(argv, directory);
    result.success = result.error_message.empty();
    if (result.success) {
        spdlog::info("Opened terminal in {}", directory);
    } else {
        spdlog::error("Terminal launch failed: {}", result.error_message);
    }
    return result;
}

} // namespace pnav
