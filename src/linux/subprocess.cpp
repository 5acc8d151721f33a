#include "subprocess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pnav {

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> result;
    result.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        result.push_back(const_cast<char*>(arg.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

void redirect_to_dev_null(int fd, int flags) {
    int null_fd = open("/dev/null", flags);
    if (null_fd >= 0) {
        dup2(null_fd, fd);
        if (null_fd != fd) close(null_fd);
    }
}

// Retry waitpid across EINTR
int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.error_message = "empty command";
        return result;
    }

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.error_message = std::format("pipe: {}", std::strerror(errno));
        return result;
    }

    // Second pipe reports exec failure; it closes silently on success
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.error_message = std::format("pipe: {}", std::strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    auto args = make_argv(argv);

    pid_t pid = fork();
    if (pid < 0) {
        result.error_message = std::format("fork: {}", std::strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(out_pipe[1], STDOUT_FILENO);
        redirect_to_dev_null(STDIN_FILENO, O_RDONLY);
        redirect_to_dev_null(STDERR_FILENO, O_WRONLY);
        if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
            int err = errno;
            ssize_t n = write(err_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }
        execvp(args[0], args.data());
        int err = errno;
        ssize_t n = write(err_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfd{out_pipe[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::format("poll: {}", std::strerror(errno));
            result.timed_out = true;  // Treat as a stuck child and kill it
            break;
        }
        if (rc == 0) {
            result.timed_out = true;
            break;
        }

        ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof = true;
        }
    }
    close(out_pipe[0]);

    if (result.timed_out) {
        kill(pid, SIGKILL);
    }
    int status = wait_for(pid);

    int exec_errno = 0;
    ssize_t n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error_message = std::format("{}: {}", argv[0], std::strerror(exec_errno));
        return result;
    }

    result.started = true;
    if (result.timed_out) {
        if (result.error_message.empty()) {
            result.error_message = std::format("{} timed out after {} ms", argv[0], timeout.count());
        }
        return result;
    }

    if (status >= 0 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (status >= 0 && WIFSIGNALED(status)) {
        result.error_message = std::format("{} killed by signal {}", argv[0], WTERMSIG(status));
    }
    return result;
}

std::string spawn_detached(const std::vector<std::string>& argv, const std::string& cwd) {
    if (argv.empty()) {
        return "empty command";
    }

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        return std::format("pipe: {}", std::strerror(errno));
    }

    auto args = make_argv(argv);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return std::format("fork: {}", std::strerror(err));
    }

    if (pid == 0) {
        // Intermediate child: new session, fork again so the launched
        // program is reparented to init and never becomes our zombie
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            int err = errno;
            ssize_t n = write(err_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(1);
        }
        if (grandchild > 0) {
            _exit(0);
        }

        redirect_to_dev_null(STDIN_FILENO, O_RDONLY);
        redirect_to_dev_null(STDOUT_FILENO, O_WRONLY);
        redirect_to_dev_null(STDERR_FILENO, O_WRONLY);
        if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
            int err = errno;
            ssize_t n = write(err_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }
        execvp(args[0], args.data());
        int err = errno;
        ssize_t n = write(err_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    close(err_pipe[1]);
    wait_for(pid);

    // Blocks only until the grandchild has exec'd (pipe closed) or failed
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return std::format("{}: {}", argv[0], std::strerror(exec_errno));
    }
    return {};
}

} // namespace pnav
