#include "test_helpers.hpp"
#include "clone_worker.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace pnav::test {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "pnav-test-XXXXXX").string();
    if (!mkdtemp(pattern.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = fs::canonical(pattern);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDir::make_dir(const std::string& relative) const {
    fs::path dir = path_ / relative;
    fs::create_directories(dir);
    return dir;
}

fs::path TempDir::write_file(const std::string& relative, const std::string& content) const {
    fs::path file = path_ / relative;
    fs::create_directories(file.parent_path());
    std::ofstream out(file);
    out << content;
    return file;
}

GitQueryResult FakeGitClient::query_status(const std::string& dir, [[maybe_unused]] std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    ++status_calls_;
    queried_paths_.push_back(dir);
    cv_.notify_all();
    wait_if_blocked(lock);

    if (throw_on_status) {
        throw std::runtime_error("git exploded");
    }
    return status_result;
}

CloneResult FakeGitClient::clone(const std::string& url, const std::string& dest_dir) {
    std::unique_lock lock(mutex_);
    ++clone_calls_;
    cv_.notify_all();
    wait_if_blocked(lock);

    if (throw_on_clone) {
        throw std::runtime_error("clone exploded");
    }

    CloneResult result;
    if (!clone_error.empty()) {
        result.error_message = clone_error;
        return result;
    }

    const fs::path target = fs::path(dest_dir) / repository_name(url);
    fs::create_directories(target);
    result.success = true;
    result.project_path = target.string();
    return result;
}

void FakeGitClient::wait_if_blocked(std::unique_lock<std::mutex>& lock) {
    cv_.wait(lock, [this] { return !blocked_; });
}

void FakeGitClient::block() {
    std::lock_guard lock(mutex_);
    blocked_ = true;
}

void FakeGitClient::release() {
    {
        std::lock_guard lock(mutex_);
        blocked_ = false;
    }
    cv_.notify_all();
}

bool FakeGitClient::wait_for_calls(const int n, const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, n] { return status_calls_ + clone_calls_ >= n; });
}

int FakeGitClient::status_calls() const {
    std::lock_guard lock(mutex_);
    return status_calls_;
}

int FakeGitClient::clone_calls() const {
    std::lock_guard lock(mutex_);
    return clone_calls_;
}

std::vector<std::string> FakeGitClient::queried_paths() const {
    std::lock_guard lock(mutex_);
    return queried_paths_;
}

} // namespace pnav::test
