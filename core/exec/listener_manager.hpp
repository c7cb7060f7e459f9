#pragma once

#include <poll.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "exec/command.hpp"
#include "exec/i_listener.hpp"

namespace envkeeper {
namespace exec {

// ListenerManager multiplexes any number of listeners into one event stream
// - Listeners live in an arena and are addressed by index
// - An armed listener is watched; once it produced an event it is re-armed
// - Ready listeners are served round-robin so a busy one cannot starve others
class ListenerManager {
public:
    ListenerManager() = default;
    ~ListenerManager();

    ListenerManager(const ListenerManager &) = delete;
    ListenerManager &operator=(const ListenerManager &) = delete;

    // Takes ownership; armed right away when the manager is already started
    size_t add(std::unique_ptr<IListener> listener);

    size_t size() const { return listeners_.size(); }
    bool empty() const { return listeners_.empty(); }
    IListener &at(size_t index) { return *listeners_.at(index); }
    bool started() const { return started_; }

    // Stops at the first listener that fails
    bool set_process_env(Command &command, std::string &error);

    // Arms every listener
    void start();

    // Appends one entry per armed listener, for callers running their own poll()
    void collect_pollfds(std::vector<pollfd> &fds) const;

    // Marks listeners whose descriptor is readable in fds (as filled by poll())
    void take_ready(const std::vector<pollfd> &fds);

    // Next event from a ready listener. When none is ready, polls armed
    // listeners for up to timeout_ms (0 = do not wait, negative = forever).
    std::optional<ListenerEvent> next(int timeout_ms);

    // Stops every listener even after failures. The error lists each failure
    // as "Error stopping listeners: <name>: <message>; ...".
    bool stop(std::string &error);

private:
    std::optional<ListenerEvent> next_ready();

    std::vector<std::unique_ptr<IListener>> listeners_;
    std::vector<bool> armed_;
    std::vector<bool> ready_;
    size_t cursor_ = 0;
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace exec
}  // namespace envkeeper
