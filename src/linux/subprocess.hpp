#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pnav {

struct CommandResult {
    bool started = false;     // fork/exec succeeded
    bool timed_out = false;   // Killed after the deadline
    int exit_code = -1;       // Valid when started && !timed_out
    std::string output;       // Captured stdout
    std::string error_message;

    [[nodiscard]] bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Run argv[0] (searched in PATH) in cwd, capture stdout, discard stderr.
// The child is killed with SIGKILL once timeout expires.
CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          std::chrono::milliseconds timeout);

// Start argv detached from this process (own session, stdio on /dev/null)
// and return without waiting for it. Exec failures are reported back.
// Returns an empty string on success, the error otherwise.
std::string spawn_detached(const std::vector<std::string>& argv, const std::string& cwd);

} // namespace pnav
