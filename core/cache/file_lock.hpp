#pragma once

#include <memory>
#include <string>

#include "common/errors.hpp"

namespace envkeeper {
namespace cache {

// Advisory flock() on a legacy cache file, held for the object's lifetime.
// Readers take SHARED, the in-place rewrite during normalization takes EXCLUSIVE.
class FileLock {
public:
    enum class Mode { SHARED, EXCLUSIVE };

    // Blocks until the lock is granted. Returns nullptr and sets error when the
    // file cannot be opened or locked. EXCLUSIVE creates the file if missing.
    static std::unique_ptr<FileLock> acquire(const std::string &path, Mode mode, common::Error &error);

    ~FileLock();

    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    bool read_all(std::string &contents, common::Error &error) const;

    // Replaces the whole file content through the locked descriptor
    bool write_all(const std::string &contents, common::Error &error);

    Mode mode() const { return mode_; }
    const std::string &path() const { return path_; }

private:
    FileLock(const std::string &path, Mode mode, int fd) : path_(path), mode_(mode), fd_(fd) {}

    std::string path_;
    Mode mode_;
    int fd_;
};

}  // namespace cache
}  // namespace envkeeper
