#include "child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

namespace {

// Reports errno to the parent through the status pipe and exits
[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t written = ::write(status_fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

std::vector<char *> to_cstrings(std::vector<std::string> &values) {
    std::vector<char *> result;
    result.reserve(values.size() + 1);
    for (auto &value : values) {
        result.push_back(&value[0]);
    }
    result.push_back(nullptr);
    return result;
}

}  // namespace

ChildProcess::~ChildProcess() {
    if (pid_ > 0) {
        kill_group();
        std::optional<int> exit_code;
        common::Error error;
        if (!wait(exit_code, error)) {
            LOG_WARN("[Process] " << error.message);
        }
    }
}

bool ChildProcess::spawn(const Command &command, common::Error &error) {
    if (command.argv.empty()) {
        return common::fail(error, common::ErrorCode::CONFIGURATION, "empty command");
    }
    if (pid_ > 0) {
        return common::fail(error, common::ErrorCode::CONFIGURATION, "process already spawned");
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    int status_pipe[2];

    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        return common::fail(error, common::ErrorCode::IO, "failed to create stdout pipe: " + std::string(strerror(errno)));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return common::fail(error, common::ErrorCode::IO, "failed to create stderr pipe: " + std::string(strerror(err)));
    }
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        return common::fail(error, common::ErrorCode::IO, "failed to create status pipe: " + std::string(strerror(err)));
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> args = command.argv;
    std::vector<std::string> env = command.build_environment();
    std::vector<char *> argv = to_cstrings(args);
    std::vector<char *> envp = to_cstrings(env);
    const char *working_dir = command.working_dir.empty() ? nullptr : command.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], status_pipe[0],
                       status_pipe[1]}) {
            close(fd);
        }
        return common::fail(error, common::ErrorCode::IO, "fork failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) {
            child_fail(status_pipe[1]);
        }
        if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0 || dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            child_fail(status_pipe[1]);
        }

        if (working_dir != nullptr && chdir(working_dir) < 0) {
            child_fail(status_pipe[1]);
        }

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(status_pipe[1]);
    }

    // Parent process
    setpgid(pid, pid);  // Also done by the child; whichever runs first wins
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    pid_ = pid;
    stdout_.reset(stdout_pipe[0]);
    stderr_.reset(stderr_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        std::optional<int> exit_code;
        common::Error wait_error;
        if (!wait(exit_code, wait_error)) {
            LOG_WARN("[Process] " << wait_error.message);
        }
        close_stdout();
        close_stderr();
        return common::fail(error, common::ErrorCode::IO,
                            "failed to execute " + command.to_string() + ": " + strerror(child_errno));
    }

    LOG_DEBUG("[Process] Spawned " << command.to_string() << " (PID=" << pid_ << ")");
    return true;
}

void ChildProcess::kill_group() {
    if (pid_ <= 0) {
        return;
    }
    if (kill(-pid_, SIGKILL) < 0) {
        // Group may not exist yet if setpgid lost the race; fall back to the child itself
        kill(pid_, SIGKILL);
    }
}

bool ChildProcess::wait(std::optional<int> &exit_code, common::Error &error) {
    exit_code.reset();
    if (pid_ <= 0) {
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            pid_ = -1;
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            }
            return true;
        }
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                // Already reaped elsewhere
                pid_ = -1;
                return true;
            }
            return common::fail(error, common::ErrorCode::IO, "waitpid failed: " + std::string(strerror(errno)));
        }
    }
}

}  // namespace exec
}  // namespace envkeeper
