#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace envkeeper {
namespace exec {

// External command to run: program and arguments, environment changes
// relative to the current process, and an optional working directory
struct Command {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env_set;
    std::set<std::string> env_remove;
    std::string working_dir;

    Command() = default;
    explicit Command(std::vector<std::string> args) : argv(std::move(args)) {}

    void set_env(const std::string &name, const std::string &value);
    void remove_env(const std::string &name);

    // Current environment with env_set and env_remove applied, as NAME=VALUE
    std::vector<std::string> build_environment() const;

    // Space separated argv; arguments containing spaces are double quoted
    std::string to_string() const;
};

}  // namespace exec
}  // namespace envkeeper
