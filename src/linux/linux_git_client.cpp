#include "linux_git_client.hpp"
#include "subprocess.hpp"
#include "../clone_worker.hpp"
#include <filesystem>
#include <format>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace pnav {

PorcelainStatus parse_porcelain_status(const std::string& output) {
    PorcelainStatus status;

    std::istringstream lines(output);
    std::string line;
    bool first = true;

    while (std::getline(lines, line)) {
        if (first && line.starts_with("## ")) {
            first = false;
            std::string header = line.substr(3);

            // Unborn branch: "## No commits yet on main" (older git: "Initial commit on main")
            for (const char* prefix : {"No commits yet on ", "Initial commit on "}) {
                if (header.starts_with(prefix)) {
                    header = header.substr(std::char_traits<char>::length(prefix));
                    break;
                }
            }

            // Detached HEAD: "## HEAD (no branch)"
            if (header.starts_with("HEAD (no branch)")) {
                continue;
            }

            // "main...origin/main [ahead 1]" -> "main"
            if (auto dots = header.find("..."); dots != std::string::npos) {
                header = header.substr(0, dots);
            } else if (auto space = header.find(' '); space != std::string::npos) {
                header = header.substr(0, space);
            }

            if (!header.empty()) {
                status.branch = header;
            }
            continue;
        }
        first = false;

        if (!line.empty()) {
            status.dirty = true;
        }
    }

    return status;
}

GitQueryResult LinuxGitClient::query_status(const std::string& dir, const std::chrono::milliseconds timeout) {
    GitQueryResult result;

    // Only the project's own repository counts, not an enclosing one
    std::error_code ec;
    if (!fs::exists(fs::path(dir) / ".git", ec)) {
        result.error_message = "not a git repository";
        return result;
    }

    auto command = run_command({"git", "status", "--porcelain=v1", "--branch"}, dir, timeout);
    if (!command.ok()) {
        result.error_message = command.error_message.empty()
            ? std::format("git status exited with {}", command.exit_code)
            : command.error_message;
        return result;
    }

    auto parsed = parse_porcelain_status(command.output);
    result.success = true;
    result.branch = std::move(parsed.branch);
    result.dirty = parsed.dirty;
    return result;
}

CloneResult LinuxGitClient::clone(const std::string& url, const std::string& dest_dir) {
    CloneResult result;
    const std::string name = repository_name(url);
    const fs::path target = fs::path(dest_dir) / name;

    std::error_code ec;
    if (fs::exists(target, ec)) {
        result.error_message = std::format("{} already exists", target.string());
        return result;
    }

    // Prefer the GitHub CLI (understands owner/repo shorthand), fall back to git
    auto command = run_command({"gh", "repo", "clone", url, name, "--", "--quiet"}, dest_dir, kCloneTimeout);
    if (!command.ok()) {
        spdlog::debug("gh repo clone failed ({}), falling back to git clone",
                      command.error_message.empty() ? std::format("exit {}", command.exit_code) : command.error_message);

        // gh may have left a partial checkout behind
        fs::remove_all(target, ec);

        command = run_command({"git", "clone", "--quiet", url, name}, dest_dir, kCloneTimeout);
    }

    if (!command.ok()) {
        result.error_message = command.error_message.empty()
            ? std::format("git clone exited with {}", command.exit_code)
            : command.error_message;
        return result;
    }

    result.success = true;
    result.project_path = target.string();
    return result;
}

} // namespace pnav
