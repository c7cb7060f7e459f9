#include "askpass_listener.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/temp_dir.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace exec {

namespace {

constexpr int kRequestReadTimeoutMs = 1000;

std::string upper(const std::string &value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string shell_quote(const std::string &value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string current_executable() {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "envkeeper";
    }
    return path.string();
}

bool write_all(int fd, const std::string &data, std::string &error) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "failed to write to socket: " + std::string(strerror(errno));
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

bool fill_address(const std::string &path, sockaddr_un &addr, std::string &error) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        error = "socket path too long: " + path;
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

}  // namespace

bool prompt_password_on_tty(const std::string &prompt, std::string &answer, std::string &error) {
    common::UniqueFd tty(open("/dev/tty", O_RDWR | O_CLOEXEC));
    if (!tty.valid()) {
        error = "no terminal available to ask for the password";
        return false;
    }

    std::string shown = prompt;
    if (!shown.empty() && shown.back() != ' ') {
        shown += ' ';
    }
    ssize_t written = ::write(tty.get(), shown.data(), shown.size());
    (void)written;

    termios original;
    bool restore = tcgetattr(tty.get(), &original) == 0;
    if (restore) {
        termios silent = original;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(tty.get(), TCSAFLUSH, &silent);
    }

    answer.clear();
    bool ok = true;
    while (true) {
        char c;
        ssize_t n = ::read(tty.get(), &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0 || c == '\n' || c == '\r') {
            ok = n >= 0;
            break;
        }
        answer += c;
    }

    if (restore) {
        tcsetattr(tty.get(), TCSAFLUSH, &original);
    }
    written = ::write(tty.get(), "\n", 1);
    (void)written;

    if (!ok) {
        error = "failed to read password from terminal";
        return false;
    }
    return true;
}

std::string AskPassRequest::display_prompt() const { return prompt_.empty() ? std::string("Password:") : prompt_; }

std::string AskPassRequest::to_json() const { return nlohmann::json{{"p", prompt_}}.dump(); }

bool AskPassRequest::parse(const std::string &payload, AskPassRequest &request, std::string &error) {
    try {
        auto j = nlohmann::json::parse(payload);
        if (j.contains("p")) {
            request.prompt_ = j.at("p").get<std::string>();
        } else if (j.contains("prompt")) {
            request.prompt_ = j.at("prompt").get<std::string>();
        } else {
            request.prompt_.clear();
        }
    } catch (const nlohmann::json::exception &e) {
        error = "failed to parse request: " + std::string(e.what());
        return false;
    }
    return true;
}

bool AskPassRequest::send(const std::string &socket_path, std::string &answer, std::string &error) const {
    struct stat info;
    if (stat(socket_path.c_str(), &info) < 0) {
        error = "socket path does not exist: " + socket_path;
        return false;
    }
    if (!S_ISSOCK(info.st_mode)) {
        error = "socket path is not a socket: " + socket_path;
        return false;
    }

    sockaddr_un addr;
    if (!fill_address(socket_path, addr, error)) {
        return false;
    }

    common::UniqueFd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        error = "failed to create socket: " + std::string(strerror(errno));
        return false;
    }
    if (connect(fd.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "error connecting to socket: " + std::string(strerror(errno));
        return false;
    }

    std::string request = to_json();
    request.push_back('\0');
    if (!write_all(fd.get(), request, error)) {
        return false;
    }

    std::string reply;
    char buffer[512];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "error reading from socket: " + std::string(strerror(errno));
            return false;
        }
        if (n == 0) {
            break;
        }
        reply.append(buffer, static_cast<size_t>(n));
    }

    // Only the first line is the answer
    auto newline = reply.find('\n');
    if (newline != std::string::npos) {
        reply.erase(newline);
    }
    while (!reply.empty() && std::isspace(static_cast<unsigned char>(reply.back()))) {
        reply.pop_back();
    }
    answer = reply;
    return true;
}

std::vector<std::string> AskPassListener::tools_needing_askpass(const std::vector<std::string> &tools) {
    std::vector<std::string> result;
    for (const auto &tool : tools) {
        const char *existing = std::getenv((upper(tool) + "_ASKPASS").c_str());
        if (existing == nullptr || existing[0] == '\0') {
            result.push_back(tool);
        }
    }
    return result;
}

AskPassListener::AskPassListener(const std::string &dir, const std::vector<std::string> &tools,
                                 PasswordPrompter prompter)
    : dir_(dir), socket_path_(dir + "/socket"), tools_(tools), prompter_(std::move(prompter)) {
    if (!prompter_) {
        prompter_ = prompt_password_on_tty;
    }
}

AskPassListener::~AskPassListener() {
    std::string error;
    if (!stop(error)) {
        LOG_WARN("[AskPass] " << error);
    }
}

std::unique_ptr<AskPassListener> AskPassListener::create(const AskPassOptions &options, std::string &error) {
    error.clear();
    auto tools = tools_needing_askpass(options.tools);
    if (tools.empty()) {
        LOG_DEBUG("[AskPass] Every tool already has an askpass program");
        return nullptr;
    }

    std::string dir;
    if (!common::create_private_temp_dir("envkeeper-askpass", dir, error)) {
        return nullptr;
    }

    std::unique_ptr<AskPassListener> listener(new AskPassListener(dir, tools, options.prompter));
    for (const auto &tool : tools) {
        if (!listener->write_script(tool, options, error)) {
            return nullptr;
        }
    }
    if (!listener->bind_socket(error)) {
        return nullptr;
    }

    LOG_DEBUG("[AskPass] Listening on " << listener->socket_path());
    return listener;
}

std::string AskPassListener::script_path(const std::string &tool) const { return dir_ + "/" + tool + "-askpass.sh"; }

bool AskPassListener::write_script(const std::string &tool, const AskPassOptions &options,
                                   std::string &error) const {
    std::string executable = options.executable.empty() ? current_executable() : options.executable;
    std::string command = options.command;
    std::replace(command.begin(), command.end(), '\n', ' ');
    bool prefer_gui = options.enable_gui && options.prefer_gui;

    std::stringstream script;
    script << "#!/bin/sh\n";
    script << "# Relays " << tool << " password prompts";
    if (!command.empty()) {
        script << " for: " << command;
    }
    script << "\n\n";
    script << "gui_prompt() {\n"
           << "    if command -v osascript >/dev/null 2>&1; then\n"
           << "        osascript -e 'on run argv' \\\n"
           << "            -e 'text returned of (display dialog (item 1 of argv) default answer \"\" with hidden "
              "answer)' \\\n"
           << "            -e 'end run' \"${1:-Password:}\" 2>/dev/null\n"
           << "        return $?\n"
           << "    fi\n"
           << "    if command -v zenity >/dev/null 2>&1; then\n"
           << "        zenity --password --title=\"${1:-Password:}\" 2>/dev/null\n"
           << "        return $?\n"
           << "    fi\n"
           << "    return 1\n"
           << "}\n\n";
    script << "ENABLE_GUI=" << (options.enable_gui ? 1 : 0) << "\n";
    script << "PREFER_GUI=" << (prefer_gui ? 1 : 0) << "\n\n";
    script << "if [ \"$PREFER_GUI\" = 1 ] && gui_prompt \"$@\"; then\n"
           << "    exit 0\n"
           << "fi\n";
    script << "if " << shell_quote(executable) << " askpass --socket " << shell_quote(socket_path_)
           << " -- \"$@\"; then\n"
           << "    exit 0\n"
           << "fi\n";
    script << "if [ \"$ENABLE_GUI\" = 1 ] && [ \"$PREFER_GUI\" != 1 ]; then\n"
           << "    gui_prompt \"$@\" && exit 0\n"
           << "fi\n"
           << "exit 1\n";

    std::string path = script_path(tool);
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            error = "failed to write askpass script " + path;
            return false;
        }
        out << script.str();
    }

    if (chmod(path.c_str(), S_IRWXU) < 0) {
        error = "failed to set permissions on askpass script " + path + ": " + strerror(errno);
        return false;
    }
    return true;
}

bool AskPassListener::bind_socket(std::string &error) {
    sockaddr_un addr;
    if (!fill_address(socket_path_, addr, error)) {
        return false;
    }

    common::UniqueFd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!fd.valid()) {
        error = "failed to create socket: " + std::string(strerror(errno));
        return false;
    }
    if (bind(fd.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "failed to bind to socket " + socket_path_ + ": " + strerror(errno);
        return false;
    }
    if (listen(fd.get(), 8) < 0) {
        error = "failed to listen on socket " + socket_path_ + ": " + strerror(errno);
        return false;
    }
    socket_ = std::move(fd);
    return true;
}

bool AskPassListener::set_process_env(Command &command, std::string &error) {
    if (dir_.empty()) {
        error = "askpass listener already stopped";
        return false;
    }
    for (const auto &tool : tools_) {
        command.set_env(upper(tool) + "_ASKPASS", script_path(tool));
    }
    command.set_env("SSH_ASKPASS_REQUIRE", "force");
    command.remove_env("DISPLAY");
    return true;
}

std::optional<ListenerEvent> AskPassListener::next() {
    int client = accept4(socket_.get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_WARN("[AskPass] accept failed: " << strerror(errno));
        }
        return std::nullopt;
    }

    auto connection = std::make_shared<common::UniqueFd>(client);
    PasswordPrompter prompter = prompter_;

    ListenerEvent event;
    event.needs_ui_pause = true;
    event.handler = [connection, prompter](std::string &error) {
        bool ok = AskPassListener::handle_request(connection->get(), prompter, error);
        connection->reset();
        return ok;
    };
    return event;
}

bool AskPassListener::handle_request(int fd, const PasswordPrompter &prompter, std::string &error) {
    std::string payload;
    bool terminated = false;
    while (!terminated) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, kRequestReadTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "failed to read request from socket: " + std::string(strerror(errno));
            return false;
        }
        if (ready == 0) {
            error = "timeout reading request from socket";
            return false;
        }

        char buffer[256];
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            error = "failed to read request from socket: " + std::string(strerror(errno));
            return false;
        }
        if (n == 0) {
            break;
        }
        for (ssize_t i = 0; i < n; ++i) {
            if (buffer[i] == '\0') {
                terminated = true;
                break;
            }
            payload += buffer[i];
        }
    }

    AskPassRequest request;
    if (!AskPassRequest::parse(payload, request, error)) {
        return false;
    }

    std::string answer;
    if (!prompter(request.display_prompt(), answer, error)) {
        if (error.empty()) {
            error = "no password provided";
        }
        return false;
    }
    return write_all(fd, answer, error);
}

bool AskPassListener::stop(std::string &error) {
    socket_.reset();
    if (dir_.empty()) {
        return true;
    }
    std::string dir = dir_;
    dir_.clear();
    return common::remove_temp_dir(dir, error);
}

}  // namespace exec
}  // namespace envkeeper
