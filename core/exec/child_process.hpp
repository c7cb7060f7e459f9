#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

#include "common/errors.hpp"
#include "common/unique_fd.hpp"
#include "exec/command.hpp"

namespace envkeeper {
namespace exec {

// ChildProcess owns one spawned command
// - Runs in its own process group so the whole tree can be killed
// - stdin is /dev/null, stdout and stderr are pipes read by the parent
// - Killed and reaped on destruction if still running
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Fails with IO when the program cannot be executed (not found, not
    // executable, bad working directory); the errno from exec is reported.
    bool spawn(const Command &command, common::Error &error);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0; }

    int stdout_fd() const { return stdout_.get(); }
    int stderr_fd() const { return stderr_.get(); }
    void close_stdout() { stdout_.reset(); }
    void close_stderr() { stderr_.reset(); }

    // SIGKILL to the process group; failures are ignored
    void kill_group();

    // Blocks until the child exits. exit_code is empty when it was killed by a signal.
    bool wait(std::optional<int> &exit_code, common::Error &error);

private:
    pid_t pid_ = -1;
    common::UniqueFd stdout_;
    common::UniqueFd stderr_;
};

}  // namespace exec
}  // namespace envkeeper
