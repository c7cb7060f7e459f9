#include "listener_manager.hpp"

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

ListenerManager::~ListenerManager() {
    if (stopped_ || listeners_.empty()) {
        return;
    }
    std::string error;
    if (!stop(error)) {
        LOG_WARN("[Listeners] " << error);
    }
}

size_t ListenerManager::add(std::unique_ptr<IListener> listener) {
    size_t index = listeners_.size();
    LOG_DEBUG("[Listeners] Adding " << listener->name() << " at index " << index);
    listeners_.push_back(std::move(listener));
    armed_.push_back(started_);
    ready_.push_back(false);
    stopped_ = false;
    return index;
}

bool ListenerManager::set_process_env(Command &command, std::string &error) {
    for (auto &listener : listeners_) {
        if (!listener->set_process_env(command, error)) {
            error = listener->name() + ": " + error;
            return false;
        }
    }
    return true;
}

void ListenerManager::start() {
    for (size_t i = 0; i < listeners_.size(); ++i) {
        armed_[i] = true;
        ready_[i] = false;
    }
    started_ = true;
    stopped_ = false;
}

void ListenerManager::collect_pollfds(std::vector<pollfd> &fds) const {
    for (size_t i = 0; i < listeners_.size(); ++i) {
        int fd = listeners_[i]->wait_fd();
        if (!armed_[i] || fd < 0) {
            continue;
        }
        pollfd entry;
        entry.fd = fd;
        entry.events = POLLIN;
        entry.revents = 0;
        fds.push_back(entry);
    }
}

void ListenerManager::take_ready(const std::vector<pollfd> &fds) {
    for (const auto &entry : fds) {
        if (entry.revents == 0) {
            continue;
        }
        for (size_t i = 0; i < listeners_.size(); ++i) {
            if (!armed_[i] || listeners_[i]->wait_fd() != entry.fd) {
                continue;
            }
            if ((entry.revents & POLLNVAL) != 0) {
                LOG_WARN("[Listeners] " << listeners_[i]->name() << " descriptor is invalid, disarming");
                armed_[i] = false;
            } else if ((entry.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                ready_[i] = true;
            }
        }
    }
}

std::optional<ListenerEvent> ListenerManager::next_ready() {
    size_t count = listeners_.size();
    for (size_t k = 0; k < count; ++k) {
        size_t i = (cursor_ + k) % count;
        if (!ready_[i] || !armed_[i]) {
            continue;
        }
        ready_[i] = false;
        cursor_ = (i + 1) % count;

        // The listener stays armed: its next readiness is picked up by the next poll
        auto event = listeners_[i]->next();
        if (event) {
            return event;
        }
    }
    return std::nullopt;
}

std::optional<ListenerEvent> ListenerManager::next(int timeout_ms) {
    if (!started_ || listeners_.empty()) {
        return std::nullopt;
    }

    auto event = next_ready();
    if (event) {
        return event;
    }

    std::vector<pollfd> fds;
    collect_pollfds(fds);
    if (fds.empty()) {
        return std::nullopt;
    }

    int result = poll(fds.data(), fds.size(), timeout_ms);
    if (result < 0) {
        if (errno != EINTR) {
            LOG_WARN("[Listeners] poll failed: " << strerror(errno));
        }
        return std::nullopt;
    }
    if (result == 0) {
        return std::nullopt;
    }

    take_ready(fds);
    return next_ready();
}

bool ListenerManager::stop(std::string &error) {
    started_ = false;
    stopped_ = true;

    std::string failures;
    for (size_t i = 0; i < listeners_.size(); ++i) {
        armed_[i] = false;
        ready_[i] = false;

        std::string listener_error;
        if (!listeners_[i]->stop(listener_error)) {
            if (!failures.empty()) {
                failures += "; ";
            }
            failures += listeners_[i]->name() + ": " + listener_error;
        }
    }

    if (failures.empty()) {
        return true;
    }
    error = "Error stopping listeners: " + failures;
    return false;
}

}  // namespace exec
}  // namespace envkeeper
