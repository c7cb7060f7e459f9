#include "run_config.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

bool RunConfig::listener_manager_for_command(const Command &command, ListenerManager &manager,
                                             std::string &error) const {
    if (!askpass || !askpass_options.enabled) {
        return true;
    }

    AskPassOptions options;
    options.enable_gui = askpass_options.enable_gui;
    options.prefer_gui = askpass_options.prefer_gui;
    options.command = command.to_string();
    options.prompter = askpass_prompter;

    auto listener = AskPassListener::create(options, error);
    if (!listener) {
        if (!error.empty()) {
            error = "unable to set up askpass relay: " + error;
            return false;
        }
        return true;
    }

    LOG_DEBUG("[Runner] Askpass relay for " << command.to_string() << " at " << listener->socket_path());
    manager.add(std::move(listener));
    return true;
}

}  // namespace exec
}  // namespace envkeeper
