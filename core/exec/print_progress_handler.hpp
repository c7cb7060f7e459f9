#pragma once

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "exec/i_progress_handler.hpp"

namespace envkeeper {
namespace exec {

// "[ 3/12] " with both numbers padded to the width of total; empty without a step
std::string progress_prefix(const std::optional<std::pair<size_t, size_t>> &step);

// Prints every update on its own line as "[cur/total] <mark> <desc> <message>"
class PrintProgressHandler : public IProgressHandler {
public:
    PrintProgressHandler(const std::string &desc, std::optional<std::pair<size_t, size_t>> step = std::nullopt,
                         std::ostream &out = std::cerr);

    void println(const std::string &message) override;
    void progress(const std::string &message) override;
    void success() override;
    void success_with_message(const std::string &message) override;
    void error() override;
    void error_with_message(const std::string &message) override;
    void hide() override {}
    void show() override {}

private:
    void emit(const char *mark, const std::string &message);

    std::string prefix_;
    std::string desc_;
    std::ostream &out_;
    std::mutex mutex_;
};

}  // namespace exec
}  // namespace envkeeper
