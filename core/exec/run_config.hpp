#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "exec/askpass_listener.hpp"
#include "exec/command.hpp"
#include "exec/listener_manager.hpp"
#include "runtime/config.hpp"

namespace envkeeper {
namespace exec {

// Options for one command execution
struct RunConfig {
    std::optional<std::chrono::seconds> timeout;  // Idle timeout, reset by every read; none when empty
    bool strip_ctrl_chars = true;                 // Remove cursor movement and \r from progress lines
    bool askpass = false;                         // Relay sudo/ssh password prompts
    runtime::AskPassConfig askpass_options;
    PasswordPrompter askpass_prompter;  // Empty: prompt on the terminal

    RunConfig &with_timeout(std::chrono::seconds value) {
        timeout = value;
        return *this;
    }

    RunConfig &with_askpass(bool value = true) {
        askpass = value;
        return *this;
    }

    // Adds the listeners this configuration asks for
    bool listener_manager_for_command(const Command &command, ListenerManager &manager, std::string &error) const;
};

}  // namespace exec
}  // namespace envkeeper
