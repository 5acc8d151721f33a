#pragma once

#include "interfaces/i_git_client.hpp"
#include "project_info.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pnav {

using StatusUpdate = std::pair<std::string, GitStatus>;

// Computes git status off the render loop on a bounded pool of workers.
// At most one computation per path is outstanding at any time.
class StatusCache {
public:
    static constexpr size_t kDefaultWorkers = 4;
    static constexpr std::chrono::milliseconds kDefaultTimeout{3000};

    // git must outlive the StatusCache
    explicit StatusCache(IGitClient* git,
                         size_t max_workers = kDefaultWorkers,
                         std::chrono::milliseconds timeout = kDefaultTimeout);
    ~StatusCache();

    StatusCache(const StatusCache&) = delete;
    StatusCache& operator=(const StatusCache&) = delete;

    // Start/stop the worker threads
    void start();
    void stop();

    // Queue a computation for path unless one is pending or a result was
    // already produced since the last invalidate(). Returns true if queued.
    bool request(const std::string& path);

    // Completed results since the last poll. Never blocks on workers.
    [[nodiscard]] std::vector<StatusUpdate> poll();

    // Forget the completed result so the next request() recomputes
    void invalidate(const std::string& path);

    [[nodiscard]] bool is_pending(const std::string& path) const;
    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] size_t max_workers() const { return max_workers_; }

private:
    enum class PathState {
        Pending,
        PendingInvalidated,  // Invalidated while in flight
        Done
    };

    void worker_thread();
    GitStatus compute(const std::string& path);

    IGitClient* git_ = nullptr;
    const size_t max_workers_;
    const std::chrono::milliseconds timeout_;

    // Job queue and per-path bookkeeping
    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;
    std::map<std::string, PathState> states_;

    // Completion channel drained by poll()
    std::mutex results_mutex_;
    std::vector<StatusUpdate> results_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};

} // namespace pnav
