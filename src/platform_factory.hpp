#pragma once

#include "config.hpp"
#include "interfaces/i_git_client.hpp"
#include "interfaces/i_process_launcher.hpp"
#include <memory>

namespace pnav {

// Factory functions for the platform collaborators.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<IGitClient> make_git_client();
std::unique_ptr<IProcessLauncher> make_process_launcher(const Config& config);

} // namespace pnav
