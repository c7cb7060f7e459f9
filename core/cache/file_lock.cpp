#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

std::unique_ptr<FileLock> FileLock::acquire(const std::string &path, Mode mode, common::Error &error) {
    int flags = mode == Mode::EXCLUSIVE ? (O_RDWR | O_CREAT) : O_RDONLY;
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) {
        common::fail(error, common::ErrorCode::IO, "failed to open " + path + ": " + std::strerror(errno));
        return nullptr;
    }

    int op = mode == Mode::EXCLUSIVE ? LOCK_EX : LOCK_SH;
    while (flock(fd, op) != 0) {
        if (errno == EINTR) {
            continue;
        }
        common::fail(error, common::ErrorCode::IO, "failed to lock " + path + ": " + std::strerror(errno));
        ::close(fd);
        return nullptr;
    }

    return std::unique_ptr<FileLock>(new FileLock(path, mode, fd));
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        if (flock(fd_, LOCK_UN) != 0) {
            LOG_WARN("[FileLock] Failed to unlock " << path_ << ": " << std::strerror(errno));
        }
        ::close(fd_);
    }
}

bool FileLock::read_all(std::string &contents, common::Error &error) const {
    contents.clear();
    char buffer[8192];
    off_t offset = 0;
    while (true) {
        ssize_t n = pread(fd_, buffer, sizeof(buffer), offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return common::fail(error, common::ErrorCode::IO,
                                "failed to read " + path_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            return true;
        }
        contents.append(buffer, static_cast<size_t>(n));
        offset += n;
    }
}

bool FileLock::write_all(const std::string &contents, common::Error &error) {
    if (mode_ != Mode::EXCLUSIVE) {
        return common::fail(error, common::ErrorCode::IO, "write to " + path_ + " requires an exclusive lock");
    }
    if (ftruncate(fd_, 0) != 0) {
        return common::fail(error, common::ErrorCode::IO,
                            "failed to truncate " + path_ + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = pwrite(fd_, contents.data() + written, contents.size() - written, static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return common::fail(error, common::ErrorCode::IO,
                                "failed to write " + path_ + ": " + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }

    if (fsync(fd_) != 0) {
        return common::fail(error, common::ErrorCode::IO, "failed to sync " + path_ + ": " + std::strerror(errno));
    }
    return true;
}

}  // namespace cache
}  // namespace envkeeper
