#pragma once

#include "exec/i_progress_handler.hpp"

namespace envkeeper {
namespace exec {

// Discards everything
class VoidProgressHandler : public IProgressHandler {
public:
    void println(const std::string &) override {}
    void progress(const std::string &) override {}
    void success() override {}
    void success_with_message(const std::string &) override {}
    void error() override {}
    void error_with_message(const std::string &) override {}
    void hide() override {}
    void show() override {}
};

}  // namespace exec
}  // namespace envkeeper
