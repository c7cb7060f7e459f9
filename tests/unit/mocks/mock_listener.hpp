#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <optional>
#include <string>

#include "exec/i_listener.hpp"

namespace envkeeper::tests {

using namespace envkeeper;
using namespace testing;

class MockListener : public exec::IListener {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(bool, set_process_env, (exec::Command &, std::string &), (override));
    MOCK_METHOD(int, wait_fd, (), (const, override));
    MOCK_METHOD(std::optional<exec::ListenerEvent>, next, (), (override));
    MOCK_METHOD(bool, stop, (std::string &), (override));
};

// Pipe whose read end stands in for a listener endpoint; each byte written
// makes the listener ready once
class ListenerPipe {
public:
    ListenerPipe() {
        if (::pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~ListenerPipe() {
        for (int fd : fds_) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    ListenerPipe(const ListenerPipe &) = delete;
    ListenerPipe &operator=(const ListenerPipe &) = delete;

    int read_fd() const { return fds_[0]; }

    bool signal() {
        char c = 'x';
        return ::write(fds_[1], &c, 1) == 1;
    }

    bool consume() {
        char c;
        return ::read(fds_[0], &c, 1) == 1;
    }

private:
    int fds_[2];
};

}  // namespace envkeeper::tests
