#include "spinner_progress_handler.hpp"

#include <chrono>

#include "exec/print_progress_handler.hpp"

namespace envkeeper {
namespace exec {

namespace {

const char *const kFrames[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
constexpr size_t kFrameCount = sizeof(kFrames) / sizeof(kFrames[0]);

}  // namespace

SpinnerProgressHandler::SpinnerProgressHandler(const std::string &desc,
                                               std::optional<std::pair<size_t, size_t>> step, std::ostream &out)
    : prefix_(progress_prefix(step)), desc_(desc), out_(out) {
    thread_ = std::thread(&SpinnerProgressHandler::run, this);
}

SpinnerProgressHandler::~SpinnerProgressHandler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!finished_) {
            clear_locked();
            finished_ = true;
        }
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SpinnerProgressHandler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!finished_) {
        if (!hidden_) {
            draw_locked();
            frame_ = (frame_ + 1) % kFrameCount;
        }
        wake_.wait_for(lock, std::chrono::milliseconds(100));
    }
}

void SpinnerProgressHandler::draw_locked() {
    out_ << "\r" << prefix_ << kFrames[frame_] << " " << desc_ << " " << message_ << "\x1B[K" << std::flush;
}

void SpinnerProgressHandler::clear_locked() { out_ << "\r\x1B[K" << std::flush; }

void SpinnerProgressHandler::println(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hidden_ && !finished_) {
        clear_locked();
    }
    out_ << message << std::endl;
    if (!hidden_ && !finished_) {
        draw_locked();
    }
}

void SpinnerProgressHandler::progress(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
    if (!hidden_ && !finished_) {
        draw_locked();
    }
}

void SpinnerProgressHandler::finish(const char *mark, const std::string &message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        message_ = message;
        out_ << "\r" << prefix_ << mark << " " << desc_ << " " << message_ << "\x1B[K" << std::endl;
    }
    wake_.notify_all();
}

void SpinnerProgressHandler::success() { success_with_message("done"); }

void SpinnerProgressHandler::success_with_message(const std::string &message) { finish("✔", message); }

void SpinnerProgressHandler::error() {
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message = message_;
    }
    finish("✖", message);
}

void SpinnerProgressHandler::error_with_message(const std::string &message) { finish("✖", message); }

void SpinnerProgressHandler::hide() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hidden_ && !finished_) {
        clear_locked();
    }
    hidden_ = true;
}

void SpinnerProgressHandler::show() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hidden_ = false;
    }
    wake_.notify_all();
}

bool SpinnerProgressHandler::hidden() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hidden_;
}

bool SpinnerProgressHandler::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

}  // namespace exec
}  // namespace envkeeper
