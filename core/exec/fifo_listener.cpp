#include "fifo_listener.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "common/temp_dir.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

FifoListener::FifoListener(const std::string &dir, const std::string &env_var)
    : dir_(dir), path_(dir + "/env.fifo"), env_var_(env_var) {}

FifoListener::~FifoListener() {
    std::string error;
    if (!stop(error)) {
        LOG_WARN("[Fifo] " << error);
    }
}

std::unique_ptr<FifoListener> FifoListener::create(const std::string &env_var, std::string &error) {
    if (env_var.empty()) {
        error = "fifo listener needs an environment variable name";
        return nullptr;
    }

    std::string dir;
    if (!common::create_private_temp_dir("envkeeper-fifo", dir, error)) {
        return nullptr;
    }

    std::unique_ptr<FifoListener> listener(new FifoListener(dir, env_var));
    if (mkfifo(listener->path_.c_str(), S_IRUSR | S_IWUSR) < 0) {
        error = "failed to create fifo " + listener->path_ + ": " + strerror(errno);
        return nullptr;
    }

    listener->read_end_.reset(open(listener->path_.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
    if (!listener->read_end_.valid()) {
        error = "failed to open fifo " + listener->path_ + ": " + strerror(errno);
        return nullptr;
    }
    listener->write_end_.reset(open(listener->path_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC));
    if (!listener->write_end_.valid()) {
        error = "failed to open fifo " + listener->path_ + " for writing: " + strerror(errno);
        return nullptr;
    }

    LOG_DEBUG("[Fifo] Listening on " << listener->path_);
    return listener;
}

bool FifoListener::set_process_env(Command &command, std::string &error) {
    if (dir_.empty()) {
        error = "fifo listener already stopped";
        return false;
    }
    command.set_env(env_var_, path_);
    return true;
}

bool FifoListener::drain(std::string &error) {
    if (!read_end_.valid()) {
        return true;
    }

    char buffer[4096];
    while (true) {
        ssize_t n = ::read(read_end_.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            error = "failed to read fifo " + path_ + ": " + strerror(errno);
            return false;
        }
        if (n == 0) {
            break;
        }
        partial_.append(buffer, static_cast<size_t>(n));
    }

    size_t start = 0;
    size_t newline;
    while ((newline = partial_.find('\n', start)) != std::string::npos) {
        lines_.push_back(partial_.substr(start, newline - start));
        start = newline + 1;
    }
    partial_.erase(0, start);
    return true;
}

std::optional<ListenerEvent> FifoListener::next() {
    ListenerEvent event;
    event.handler = [this](std::string &error) { return drain(error); };
    return event;
}

bool FifoListener::stop(std::string &error) {
    if (dir_.empty()) {
        return true;
    }

    bool ok = drain(error);
    if (!partial_.empty()) {
        lines_.push_back(partial_);
        partial_.clear();
    }
    read_end_.reset();
    write_end_.reset();

    std::string dir = dir_;
    dir_.clear();
    std::string remove_error;
    if (!common::remove_temp_dir(dir, remove_error)) {
        if (ok) {
            error = remove_error;
        } else {
            error += "; " + remove_error;
        }
        return false;
    }
    return ok;
}

}  // namespace exec
}  // namespace envkeeper
