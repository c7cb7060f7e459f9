#pragma once

#include <functional>
#include <string>

#include "common/errors.hpp"
#include "exec/command.hpp"
#include "exec/i_progress_handler.hpp"
#include "exec/listener_manager.hpp"
#include "exec/run_config.hpp"

namespace envkeeper {
namespace exec {

enum class StreamKind {
    STDOUT,
    STDERR
};

struct CommandOutput {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
};

// Reported as the exit status when the child was killed by a signal
constexpr int kSignalExitStatus = -42;

// Removes cursor movement sequences (ESC[..A/B/C/D/K) and carriage returns
std::string strip_control_characters(const std::string &line);

/**
 * @brief Runs a command, mirroring its output to a progress handler
 *
 * Combined output is written to "<tmp>/envkeeper-exec.<stamp>.XXXXXX". The
 * log is removed on success and kept (error.log_path) on a non-zero exit.
 * Askpass relay events hide the progress display while the user is prompted.
 */
bool run_progress(const Command &command, IProgressHandler &progress, const RunConfig &config,
                  common::Error &error);

// Same, with caller supplied listeners served alongside the ones the config asks for
bool run_progress(const Command &command, IProgressHandler &progress, const RunConfig &config,
                  ListenerManager &listeners, common::Error &error);

// Each output line goes to handler, tagged with its stream. No IPC relay.
bool run_command_with_handler(const Command &command,
                              const std::function<void(StreamKind, const std::string &)> &handler,
                              const RunConfig &config, common::Error &error);

// Captures stdout, stderr and the exit code. A non-zero exit is not an error.
bool get_command_output(const Command &command, const RunConfig &config, CommandOutput &output,
                        common::Error &error);

}  // namespace exec
}  // namespace envkeeper
