#pragma once

#include <functional>
#include <optional>
#include <string>

#include "exec/command.hpp"

namespace envkeeper {
namespace exec {

// Work produced by a listener when its descriptor became readable. The
// handler runs on the supervisor's thread; needs_ui_pause asks for the
// progress display to be hidden while it runs (interactive prompt).
struct ListenerEvent {
    std::function<bool(std::string &error)> handler;
    bool needs_ui_pause = false;
};

/**
 * @brief Asynchronous event source attached to a command execution
 *
 * A listener owns its IPC endpoint from construction on. It exports how to
 * reach the endpoint through the child's environment, exposes a descriptor
 * to poll, and turns readiness into events until stopped.
 */
class IListener {
public:
    virtual ~IListener() = default;

    virtual std::string name() const = 0;

    // Adds the environment the child needs to reach this listener
    virtual bool set_process_env(Command &command, std::string &error) = 0;

    // Descriptor polled for readability; negative when nothing is left to watch
    virtual int wait_fd() const = 0;

    // Called when wait_fd() is readable. Empty when the readiness was spurious.
    virtual std::optional<ListenerEvent> next() = 0;

    // Releases the endpoint (sockets, FIFOs, temp directories)
    virtual bool stop(std::string &error) = 0;
};

}  // namespace exec
}  // namespace envkeeper
