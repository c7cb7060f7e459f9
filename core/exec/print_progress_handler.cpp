#include "print_progress_handler.hpp"

#include <iomanip>
#include <sstream>

namespace envkeeper {
namespace exec {

std::string progress_prefix(const std::optional<std::pair<size_t, size_t>> &step) {
    if (!step) {
        return std::string();
    }
    int width = static_cast<int>(std::to_string(step->second).size());
    std::stringstream prefix;
    prefix << "[" << std::setw(width) << step->first << "/" << std::setw(width) << step->second << "] ";
    return prefix.str();
}

PrintProgressHandler::PrintProgressHandler(const std::string &desc, std::optional<std::pair<size_t, size_t>> step,
                                           std::ostream &out)
    : prefix_(progress_prefix(step)), desc_(desc), out_(out) {}

void PrintProgressHandler::emit(const char *mark, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << prefix_ << mark << " " << desc_ << " " << message << std::endl;
}

void PrintProgressHandler::println(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << message << std::endl;
}

void PrintProgressHandler::progress(const std::string &message) { emit("-", message); }

void PrintProgressHandler::success() { success_with_message("done"); }

void PrintProgressHandler::success_with_message(const std::string &message) { emit("✔", message); }

void PrintProgressHandler::error() { error_with_message("error"); }

void PrintProgressHandler::error_with_message(const std::string &message) { emit("✖", message); }

}  // namespace exec
}  // namespace envkeeper
