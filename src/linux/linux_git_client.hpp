#pragma once

#include "../interfaces/i_git_client.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace pnav {

// Result of parsing `git status --porcelain=v1 --branch`
struct PorcelainStatus {
    std::optional<std::string> branch;
    bool dirty = false;
};

// Parse the porcelain output. The first line is the "## " branch header;
// every further non-empty line is a changed or untracked path.
PorcelainStatus parse_porcelain_status(const std::string& output);

class LinuxGitClient : public IGitClient {
public:
    static constexpr std::chrono::minutes kCloneTimeout{10};

    GitQueryResult query_status(const std::string& dir, std::chrono::milliseconds timeout) override;
    CloneResult clone(const std::string& url, const std::string& dest_dir) override;
};

} // namespace pnav
