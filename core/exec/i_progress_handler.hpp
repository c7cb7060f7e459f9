#pragma once

#include <string>

namespace envkeeper {
namespace exec {

/**
 * @brief Sink for the progress of one provisioning step
 *
 * The process supervisor reports each output line through progress(), and
 * brackets interactive prompts (askpass) with hide() and show() so a live
 * display does not draw over the prompt.
 */
class IProgressHandler {
public:
    virtual ~IProgressHandler() = default;

    virtual void println(const std::string &message) = 0;
    virtual void progress(const std::string &message) = 0;
    virtual void success() = 0;
    virtual void success_with_message(const std::string &message) = 0;
    virtual void error() = 0;
    virtual void error_with_message(const std::string &message) = 0;
    virtual void hide() = 0;
    virtual void show() = 0;
};

}  // namespace exec
}  // namespace envkeeper
