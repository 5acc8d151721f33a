#include "status_cache.hpp"
#include <spdlog/spdlog.h>

namespace pnav {

StatusCache::StatusCache(IGitClient* git, const size_t max_workers, const std::chrono::milliseconds timeout)
    : git_(git)
    , max_workers_(max_workers == 0 ? 1 : max_workers)
    , timeout_(timeout) {
}

StatusCache::~StatusCache() {
    stop();
}

void StatusCache::start() {
    if (running_) return;

    running_ = true;
    workers_.reserve(max_workers_);
    for (size_t i = 0; i < max_workers_; ++i) {
        workers_.emplace_back(&StatusCache::worker_thread, this);
    }
}

void StatusCache::stop() {
    if (!running_) return;

    {
        std::lock_guard lock(mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

bool StatusCache::request(const std::string& path) {
    {
        std::lock_guard lock(mutex_);
        if (states_.contains(path)) {
            return false;
        }
        states_[path] = PathState::Pending;
        queue_.push_back(path);
    }
    queue_cv_.notify_one();
    return true;
}

std::vector<StatusUpdate> StatusCache::poll() {
    std::vector<StatusUpdate> drained;
    std::lock_guard lock(results_mutex_);
    drained.swap(results_);
    return drained;
}

void StatusCache::invalidate(const std::string& path) {
    std::lock_guard lock(mutex_);
    auto it = states_.find(path);
    if (it == states_.end()) return;

    if (it->second == PathState::Done) {
        states_.erase(it);
    } else {
        it->second = PathState::PendingInvalidated;
    }
}

bool StatusCache::is_pending(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = states_.find(path);
    return it != states_.end() && it->second != PathState::Done;
}

size_t StatusCache::pending_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [path, state] : states_) {
        if (state != PathState::Done) count++;
    }
    return count;
}

void StatusCache::worker_thread() {
    while (true) {
        std::string path;

        {
            std::unique_lock lock(mutex_);
            queue_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_;
            });

            if (!running_) break;

            path = std::move(queue_.front());
            queue_.pop_front();
        }

        GitStatus status = compute(path);

        // Publish the result before releasing the path, so a request racing
        // with this completion never produces a second result ahead of this one
        {
            std::lock_guard lock(results_mutex_);
            results_.emplace_back(path, std::move(status));
        }

        {
            std::lock_guard lock(mutex_);
            if (auto it = states_.find(path); it != states_.end()) {
                if (it->second == PathState::PendingInvalidated) {
                    states_.erase(it);
                } else {
                    it->second = PathState::Done;
                }
            }
        }
    }
}

GitStatus StatusCache::compute(const std::string& path) {
    GitQueryResult result;
    try {
        result = git_->query_status(path, timeout_);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    if (!result.success) {
        spdlog::debug("Git status unavailable for {}: {}", path, result.error_message);
        return GitStatus::unavailable();
    }

    GitStatus status;
    status.available = true;
    status.branch = std::move(result.branch);
    status.dirty = result.dirty;
    status.fetched_at = std::chrono::steady_clock::now();
    return status;
}

} // namespace pnav
