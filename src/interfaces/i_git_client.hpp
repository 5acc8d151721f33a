#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pnav {

struct GitQueryResult {
    bool success = false;
    std::optional<std::string> branch;
    bool dirty = false;
    std::string error_message;
};

struct CloneResult {
    bool success = false;
    std::string project_path;  // Directory the repository was cloned into
    std::string error_message;
};

class IGitClient {
public:
    virtual ~IGitClient() = default;

    // Branch and dirty state of the working tree at dir.
    // Must return within roughly timeout; success == false otherwise.
    virtual GitQueryResult query_status(const std::string& dir, std::chrono::milliseconds timeout) = 0;

    // Clone url into a new subdirectory of dest_dir
    virtual CloneResult clone(const std::string& url, const std::string& dest_dir) = 0;
};

} // namespace pnav
