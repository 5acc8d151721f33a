#pragma once

#include "interfaces/i_git_client.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pnav {

// Directory name a clone of url ends up in: the last path segment
// without ".git", e.g. "git@host:team/tool.git" -> "tool"
[[nodiscard]] std::string repository_name(const std::string& url);

// Runs one repository clone at a time in the background
class CloneWorker {
public:
    // git must outlive the CloneWorker
    explicit CloneWorker(IGitClient* git);
    ~CloneWorker();

    CloneWorker(const CloneWorker&) = delete;
    CloneWorker& operator=(const CloneWorker&) = delete;

    // Start cloning url into dest_dir. False if a clone is already running.
    bool start(const std::string& url, const std::string& dest_dir);

    // Result of the finished clone, once
    [[nodiscard]] std::optional<CloneResult> poll();

    [[nodiscard]] bool is_busy() const { return busy_; }

    // Block until the running clone (if any) finishes; logs when it has to wait
    void wait();

private:
    IGitClient* git_ = nullptr;
    std::thread thread_;
    std::atomic<bool> busy_{false};

    std::mutex result_mutex_;
    std::optional<CloneResult> result_;
};

} // namespace pnav
