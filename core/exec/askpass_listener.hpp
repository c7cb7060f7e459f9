#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/unique_fd.hpp"
#include "exec/i_listener.hpp"

namespace envkeeper {
namespace exec {

// Asks the user for the password requested by prompt
using PasswordPrompter = std::function<bool(const std::string &prompt, std::string &answer, std::string &error)>;

// Reads a line from the controlling terminal with echo disabled
bool prompt_password_on_tty(const std::string &prompt, std::string &answer, std::string &error);

struct AskPassOptions {
    std::vector<std::string> tools = {"sudo", "ssh"};
    bool enable_gui = true;
    bool prefer_gui = false;
    std::string executable;      // Program the scripts call back; empty resolves the running binary
    std::string command;         // Command the password is requested for (script comment)
    PasswordPrompter prompter;   // Empty: prompt_password_on_tty
};

// Request sent by "envkeeper askpass" over the relay socket:
// {"p": "<prompt>"} followed by a NUL byte. The reply is the raw answer,
// terminated by the server closing the connection.
class AskPassRequest {
public:
    AskPassRequest() = default;
    explicit AskPassRequest(const std::string &prompt) : prompt_(prompt) {}

    const std::string &prompt() const { return prompt_; }

    // "Password:" when the requesting tool gave no prompt
    std::string display_prompt() const;

    std::string to_json() const;
    static bool parse(const std::string &payload, AskPassRequest &request, std::string &error);

    // Client side: sends the request and waits for the answer
    bool send(const std::string &socket_path, std::string &answer, std::string &error) const;

private:
    std::string prompt_;
};

/**
 * @brief Relays sudo/ssh password prompts from the child to the user
 *
 * Creates a 0700 temporary directory holding a Unix socket and one
 * "<tool>-askpass.sh" script per tool. The child finds the scripts through
 * SUDO_ASKPASS / SSH_ASKPASS; each script calls back into this program,
 * which forwards the prompt over the socket. Every accepted connection
 * becomes an event that needs the progress display paused.
 */
class AskPassListener : public IListener {
public:
    // Tools whose <TOOL>_ASKPASS is not already set in the current environment
    static std::vector<std::string> tools_needing_askpass(const std::vector<std::string> &tools);

    // Returns nullptr with an empty error when no tool needs a relay
    static std::unique_ptr<AskPassListener> create(const AskPassOptions &options, std::string &error);

    ~AskPassListener() override;

    std::string name() const override { return "askpass"; }
    bool set_process_env(Command &command, std::string &error) override;
    int wait_fd() const override { return socket_.get(); }
    std::optional<ListenerEvent> next() override;
    bool stop(std::string &error) override;

    const std::string &directory() const { return dir_; }
    const std::string &socket_path() const { return socket_path_; }
    const std::vector<std::string> &tools() const { return tools_; }
    std::string script_path(const std::string &tool) const;

    // Serves one accepted connection: reads the request (1s timeout per read),
    // asks the prompter and writes the answer back
    static bool handle_request(int fd, const PasswordPrompter &prompter, std::string &error);

private:
    AskPassListener(const std::string &dir, const std::vector<std::string> &tools, PasswordPrompter prompter);

    bool write_script(const std::string &tool, const AskPassOptions &options, std::string &error) const;
    bool bind_socket(std::string &error);

    std::string dir_;
    std::string socket_path_;
    std::vector<std::string> tools_;
    PasswordPrompter prompter_;
    common::UniqueFd socket_;
};

}  // namespace exec
}  // namespace envkeeper
