#pragma once

#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "exec/i_progress_handler.hpp"

namespace envkeeper {
namespace exec {

// Single redrawn status line with an animated spinner (interactive terminals).
// A background thread redraws every 100ms until success() or error().
class SpinnerProgressHandler : public IProgressHandler {
public:
    SpinnerProgressHandler(const std::string &desc, std::optional<std::pair<size_t, size_t>> step = std::nullopt,
                           std::ostream &out = std::cerr);
    ~SpinnerProgressHandler() override;

    SpinnerProgressHandler(const SpinnerProgressHandler &) = delete;
    SpinnerProgressHandler &operator=(const SpinnerProgressHandler &) = delete;

    void println(const std::string &message) override;
    void progress(const std::string &message) override;
    void success() override;
    void success_with_message(const std::string &message) override;
    void error() override;
    void error_with_message(const std::string &message) override;
    void hide() override;
    void show() override;

    bool hidden() const;
    bool finished() const;

private:
    void run();
    void draw_locked();
    void clear_locked();
    void finish(const char *mark, const std::string &message);

    std::string prefix_;
    std::string desc_;
    std::ostream &out_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::string message_ = "-";
    size_t frame_ = 0;
    bool hidden_ = false;
    bool finished_ = false;
    std::thread thread_;
};

}  // namespace exec
}  // namespace envkeeper
