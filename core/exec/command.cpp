#include "command.hpp"

#include <sstream>

extern char **environ;

namespace envkeeper {
namespace exec {

void Command::set_env(const std::string &name, const std::string &value) {
    env_set[name] = value;
    env_remove.erase(name);
}

void Command::remove_env(const std::string &name) {
    env_remove.insert(name);
    env_set.erase(name);
}

std::vector<std::string> Command::build_environment() const {
    std::vector<std::string> env;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        std::string name = var.substr(0, var.find('='));
        if (env_remove.count(name) > 0 || env_set.count(name) > 0) {
            continue;
        }
        env.push_back(var);
    }
    for (const auto &var : env_set) {
        env.push_back(var.first + "=" + var.second);
    }
    return env;
}

std::string Command::to_string() const {
    std::stringstream out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        const std::string &arg = argv[i];
        if (arg.find(' ') == std::string::npos) {
            out << arg;
            continue;
        }
        out << '"';
        for (char c : arg) {
            if (c == '"') {
                out << '\\';
            }
            out << c;
        }
        out << '"';
    }
    return out.str();
}

}  // namespace exec
}  // namespace envkeeper
