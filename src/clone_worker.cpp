#include "clone_worker.hpp"
#include <spdlog/spdlog.h>

namespace pnav {

std::string repository_name(const std::string& url) {
    std::string name = url;
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    if (auto slash = name.find_last_of("/:"); slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name.ends_with(".git")) {
        name.resize(name.size() - 4);
    }
    return name.empty() ? "new-project" : name;
}

CloneWorker::CloneWorker(IGitClient* git)
    : git_(git) {
}

CloneWorker::~CloneWorker() {
    wait();
}

bool CloneWorker::start(const std::string& url, const std::string& dest_dir) {
    if (busy_) return false;

    // Reap the previous, already finished thread
    if (thread_.joinable()) {
        thread_.join();
    }

    busy_ = true;
    spdlog::info("Cloning {} into {}", url, dest_dir);

    thread_ = std::thread([this, url, dest_dir] {
        CloneResult result;
        try {
            result = git_->clone(url, dest_dir);
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = e.what();
        }

        if (result.success) {
            spdlog::info("Cloned {} to {}", url, result.project_path);
        } else {
            spdlog::warn("Clone of {} failed: {}", url, result.error_message);
        }

        {
            std::lock_guard lock(result_mutex_);
            result_ = std::move(result);
        }
        busy_ = false;
    });
    return true;
}

std::optional<CloneResult> CloneWorker::poll() {
    std::lock_guard lock(result_mutex_);
    std::optional<CloneResult> result;
    result.swap(result_);
    return result;
}

void CloneWorker::wait() {
    if (busy_) {
        spdlog::info("Waiting for clone to finish");
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace pnav
