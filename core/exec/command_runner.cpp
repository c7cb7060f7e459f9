#include "command_runner.hpp"

#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <regex>
#include <vector>

#include "common/timestamp.hpp"
#include "common/unique_fd.hpp"
#include "exec/child_process.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kTickMs = 1000;
constexpr size_t kReadChunk = 8192;

struct SuperviseHooks {
    std::function<void(StreamKind, const char *, size_t)> on_chunk;
    std::function<void(StreamKind, const std::string &)> on_line;
    std::function<void(ListenerEvent &)> on_event;
};

// One output pipe of the child with its pending partial line
struct StreamState {
    StreamKind kind;
    bool open = true;
    std::string pending;
};

void emit_lines(StreamState &stream, const SuperviseHooks &hooks, bool flush) {
    size_t start = 0;
    size_t newline;
    while ((newline = stream.pending.find('\n', start)) != std::string::npos) {
        std::string line = stream.pending.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (hooks.on_line) {
            hooks.on_line(stream.kind, line);
        }
        start = newline + 1;
    }
    stream.pending.erase(0, start);

    if (flush && !stream.pending.empty()) {
        std::string line;
        line.swap(stream.pending);
        if (line.back() == '\r') {
            line.pop_back();
        }
        if (hooks.on_line) {
            hooks.on_line(stream.kind, line);
        }
    }
}

void stop_listeners(ListenerManager *listeners) {
    if (listeners == nullptr) {
        return;
    }
    std::string error;
    if (!listeners->stop(error)) {
        LOG_WARN("[Runner] " << error);
    }
}

// Spawns command and serves its output and the listeners until both output
// streams reached end-of-file, then reaps the child. exit_code is empty when
// the child was killed by a signal.
bool supervise(const Command &command, const RunConfig &config, ListenerManager *listeners,
               const SuperviseHooks &hooks, std::optional<int> &exit_code, common::Error &error) {
    Command effective = command;
    if (listeners != nullptr && !listeners->empty()) {
        std::string listener_error;
        if (!listeners->set_process_env(effective, listener_error)) {
            stop_listeners(listeners);
            return common::fail(error, common::ErrorCode::CONFIGURATION, listener_error);
        }
    }

    ChildProcess child;
    if (!child.spawn(effective, error)) {
        stop_listeners(listeners);
        return false;
    }
    LOG_DEBUG("[Runner] Started pid " << child.pid() << ": " << command.to_string());

    if (listeners != nullptr) {
        listeners->start();
    }

    StreamState out{StreamKind::STDOUT};
    StreamState err{StreamKind::STDERR};
    auto last_activity = Clock::now();
    std::vector<char> buffer(kReadChunk);

    while (out.open || err.open) {
        int wait_ms = kTickMs;
        if (config.timeout) {
            auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_activity);
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*config.timeout) - idle;
            if (remaining.count() <= 0) {
                LOG_WARN("[Runner] No output for " << config.timeout->count() << "s, killing " << command.to_string());
                child.kill_group();
                common::Error wait_error;
                std::optional<int> ignored;
                if (!child.wait(ignored, wait_error)) {
                    LOG_WARN("[Runner] " << wait_error.message);
                }
                stop_listeners(listeners);
                common::fail(error, common::ErrorCode::TIMEOUT,
                             "command timed out after " + std::to_string(config.timeout->count()) +
                                 "s without output: " + command.to_string());
                error.command = command.to_string();
                return false;
            }
            wait_ms = static_cast<int>(std::min<int64_t>(kTickMs, remaining.count()));
        }

        std::vector<pollfd> fds;
        StreamState *streams[2] = {&out, &err};
        int stream_fds[2] = {child.stdout_fd(), child.stderr_fd()};
        for (int i = 0; i < 2; ++i) {
            if (streams[i]->open) {
                pollfd entry;
                entry.fd = stream_fds[i];
                entry.events = POLLIN;
                entry.revents = 0;
                fds.push_back(entry);
            }
        }
        size_t stream_count = fds.size();
        if (listeners != nullptr) {
            listeners->collect_pollfds(fds);
        }

        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            common::fail(error, common::ErrorCode::IO, "poll failed: " + std::string(strerror(errno)));
            error.command = command.to_string();
            stop_listeners(listeners);
            return false;
        }
        if (ready == 0) {
            continue;
        }

        for (size_t k = 0; k < stream_count; ++k) {
            if (fds[k].revents == 0) {
                continue;
            }
            StreamState &stream = fds[k].fd == child.stdout_fd() ? out : err;
            ssize_t n = ::read(fds[k].fd, buffer.data(), buffer.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                if (n < 0) {
                    LOG_WARN("[Runner] Read failed: " << strerror(errno));
                }
                emit_lines(stream, hooks, true);
                stream.open = false;
                if (stream.kind == StreamKind::STDOUT) {
                    child.close_stdout();
                } else {
                    child.close_stderr();
                }
                continue;
            }

            last_activity = Clock::now();
            if (hooks.on_chunk) {
                hooks.on_chunk(stream.kind, buffer.data(), static_cast<size_t>(n));
            }
            stream.pending.append(buffer.data(), static_cast<size_t>(n));
            emit_lines(stream, hooks, false);
        }

        if (listeners != nullptr && fds.size() > stream_count) {
            std::vector<pollfd> listener_fds(fds.begin() + static_cast<std::ptrdiff_t>(stream_count), fds.end());
            listeners->take_ready(listener_fds);
            for (size_t served = 0; served < listeners->size(); ++served) {
                auto event = listeners->next(0);
                if (!event) {
                    break;
                }
                if (hooks.on_event) {
                    hooks.on_event(*event);
                }
                // Time spent answering a prompt does not count as idle
                last_activity = Clock::now();
            }
        }
    }

    bool waited = child.wait(exit_code, error);
    stop_listeners(listeners);
    if (!waited) {
        error.command = command.to_string();
        return false;
    }
    return true;
}

std::string temp_directory() {
    const char *tmp = std::getenv("TMPDIR");
    if (tmp != nullptr && tmp[0] != '\0') {
        return tmp;
    }
    return "/tmp";
}

bool create_log_file(std::string &path, common::UniqueFd &fd, common::Error &error) {
    std::string pattern = temp_directory() + "/envkeeper-exec." +
                          common::compact_utc_stamp(std::chrono::system_clock::now()) + ".XXXXXX";
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');
    int raw = mkstemp(name.data());
    if (raw < 0) {
        return common::fail(error, common::ErrorCode::IO,
                            "failed to create log file " + pattern + ": " + strerror(errno));
    }
    fd.reset(raw);
    path = name.data();
    return true;
}

void remove_log_file(const std::string &path) {
    if (unlink(path.c_str()) < 0 && errno != ENOENT) {
        LOG_WARN("[Runner] Failed to remove log file " << path << ": " << strerror(errno));
    }
}

}  // namespace

std::string strip_control_characters(const std::string &line) {
    static const std::regex control("(\\x1B\\[[0-9;]*[ABCDK]|\\x0D)");
    return std::regex_replace(line, control, "");
}

bool run_progress(const Command &command, IProgressHandler &progress, const RunConfig &config,
                  common::Error &error) {
    ListenerManager listeners;
    return run_progress(command, progress, config, listeners, error);
}

bool run_progress(const Command &command, IProgressHandler &progress, const RunConfig &config,
                  ListenerManager &listeners, common::Error &error) {
    std::string listener_error;
    if (!config.listener_manager_for_command(command, listeners, listener_error)) {
        return common::fail(error, common::ErrorCode::CONFIGURATION, listener_error);
    }

    std::string log_path;
    common::UniqueFd log_fd;
    if (!create_log_file(log_path, log_fd, error)) {
        return false;
    }
    LOG_DEBUG("[Runner] Logging output of " << command.to_string() << " to " << log_path);

    bool log_failed = false;
    SuperviseHooks hooks;
    hooks.on_chunk = [&](StreamKind, const char *data, size_t size) {
        size_t total = 0;
        while (!log_failed && total < size) {
            ssize_t n = ::write(log_fd.get(), data + total, size - total);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_WARN("[Runner] Failed to write log file " << log_path << ": " << strerror(errno));
                log_failed = true;
                break;
            }
            total += static_cast<size_t>(n);
        }
    };
    hooks.on_line = [&](StreamKind, const std::string &line) {
        std::string shown = config.strip_ctrl_chars ? strip_control_characters(line) : line;
        if (!shown.empty()) {
            progress.progress(shown);
        }
    };
    hooks.on_event = [&](ListenerEvent &event) {
        if (event.needs_ui_pause) {
            progress.hide();
        }
        std::string event_error;
        bool ok = event.handler(event_error);
        if (event.needs_ui_pause) {
            progress.show();
        }
        if (!ok) {
            LOG_WARN("[Runner] Listener event failed: " << event_error);
            progress.progress("error: " + event_error);
        }
    };

    std::optional<int> exit_code;
    if (!supervise(command, config, &listeners, hooks, exit_code, error)) {
        log_fd.reset();
        remove_log_file(log_path);
        return false;
    }
    log_fd.reset();

    int status = exit_code ? *exit_code : kSignalExitStatus;
    if (status != 0) {
        common::fail(error, common::ErrorCode::EXECUTION,
                     "process exited with status " + std::to_string(status) + "; log is available at " + log_path);
        error.command = command.to_string();
        error.log_path = log_path;
        error.exit_code = status;
        return false;
    }

    remove_log_file(log_path);
    return true;
}

bool run_command_with_handler(const Command &command,
                              const std::function<void(StreamKind, const std::string &)> &handler,
                              const RunConfig &config, common::Error &error) {
    SuperviseHooks hooks;
    hooks.on_line = handler;

    std::optional<int> exit_code;
    if (!supervise(command, config, nullptr, hooks, exit_code, error)) {
        return false;
    }

    int status = exit_code ? *exit_code : kSignalExitStatus;
    if (status != 0) {
        common::fail(error, common::ErrorCode::EXECUTION,
                     "command " + command.to_string() + " exited with status " + std::to_string(status));
        error.command = command.to_string();
        error.exit_code = status;
        return false;
    }
    return true;
}

bool get_command_output(const Command &command, const RunConfig &config, CommandOutput &output,
                        common::Error &error) {
    ListenerManager listeners;
    std::string listener_error;
    if (!config.listener_manager_for_command(command, listeners, listener_error)) {
        return common::fail(error, common::ErrorCode::CONFIGURATION, listener_error);
    }

    output = CommandOutput();
    SuperviseHooks hooks;
    hooks.on_chunk = [&](StreamKind kind, const char *data, size_t size) {
        if (kind == StreamKind::STDOUT) {
            output.stdout_data.append(data, size);
        } else {
            output.stderr_data.append(data, size);
        }
    };
    hooks.on_event = [](ListenerEvent &event) {
        std::string event_error;
        if (!event.handler(event_error)) {
            LOG_WARN("[Runner] Listener event failed: " << event_error);
        }
    };

    std::optional<int> exit_code;
    if (!supervise(command, config, &listeners, hooks, exit_code, error)) {
        return false;
    }
    output.exit_code = exit_code ? *exit_code : kSignalExitStatus;
    return true;
}

}  // namespace exec
}  // namespace envkeeper
