#include "fs_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <pwd.h>

namespace fs = std::filesystem;

namespace pnav {

fs::path default_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "pnav";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config" / "pnav";
    }
    // No HOME in the environment: ask the password database
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir) / ".config" / "pnav";
    }
    return fs::path("/tmp") / std::format("pnav-{}", getuid());
}

bool write_file_atomic(const fs::path& path, const std::string& content, std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = std::format("cannot create {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    fs::path tmp = path;
    tmp += std::format(".tmp.{}", getpid());

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = std::format("cannot open {}: {}", tmp.string(), std::strerror(errno));
        return false;
    }

    auto fail = [&](const char* what) {
        error = std::format("cannot {} {}: {}", what, tmp.string(), std::strerror(errno));
        close(fd);
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    };

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("write");
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    // Contents must be on disk before the rename makes them visible
    if (fsync(fd) != 0) return fail("sync");
    if (close(fd) != 0) {
        error = std::format("cannot close {}: {}", tmp.string(), std::strerror(errno));
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        error = std::format("cannot replace {}: {}", path.string(), ec.message());
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return false;
    }
    return true;
}

fs::path find_executable(const std::string& name) {
    if (name.empty()) return {};

    auto is_executable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? fs::path(name) : fs::path();
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return {};

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return {};
}

} // namespace pnav
