#include "../platform_factory.hpp"
#include "linux_git_client.hpp"
#include "linux_process_launcher.hpp"

namespace pnav {

std::unique_ptr<IGitClient> make_git_client() {
    return std::make_unique<LinuxGitClient>();
}

std::unique_ptr<IProcessLauncher> make_process_launcher(const Config& config) {
    return std::make_unique<LinuxProcessLauncher>(config.idea_path, config.terminal_command);
}

} // namespace pnav
