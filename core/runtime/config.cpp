#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace envkeeper {
namespace runtime {

namespace {

bool is_known_key(const std::string &key, const std::vector<std::string> &valid_keys) {
    for (const auto &valid_key : valid_keys) {
        if (key == valid_key) {
            return true;
        }
    }
    return false;
}

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys,
                       const std::string &section) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (!is_known_key(key, valid_keys)) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

std::string expand_home(const std::string &path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

void load_backend(const YAML::Node &node, const std::string &section, BackendCacheConfig &backend,
                  const std::vector<std::string> &extra_keys = {}) {
    std::vector<std::string> valid_keys = {"cleanup_after", "versions_expire", "versions_retention",
                                           "update_expire"};
    valid_keys.insert(valid_keys.end(), extra_keys.begin(), extra_keys.end());
    warn_unknown_keys(node, valid_keys, section);

    if (node["cleanup_after"]) {
        backend.cleanup_after = node["cleanup_after"].as<int64_t>();
    }
    if (node["versions_expire"]) {
        backend.versions_expire = node["versions_expire"].as<int64_t>();
    }
    if (node["versions_retention"]) {
        backend.versions_retention = node["versions_retention"].as<int64_t>();
    }
    if (node["update_expire"]) {
        backend.update_expire = node["update_expire"].as<int64_t>();
    }
}

bool validate_backend(const BackendCacheConfig &backend, const std::string &name, std::string &error) {
    if (backend.cleanup_after < 0) {
        error = "cache." + name + ".cleanup_after must be >= 0";
        return false;
    }
    if (backend.versions_expire < 0) {
        error = "cache." + name + ".versions_expire must be >= 0";
        return false;
    }
    if (backend.versions_retention < 0) {
        error = "cache." + name + ".versions_retention must be >= 0";
        return false;
    }
    if (backend.update_expire < 0) {
        error = "cache." + name + ".update_expire must be >= 0";
        return false;
    }
    return true;
}

}  // namespace

std::string default_cache_path() {
    const char *xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg != nullptr && xdg[0] != '\0') {
        return std::string(xdg) + "/envkeeper";
    }
    const char *home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return std::string(home) + "/.cache/envkeeper";
    }
    return "/tmp/envkeeper-cache";
}

CoreConfig default_config() {
    CoreConfig config;
    config.cache.path = default_cache_path();
    return config;
}

bool validate_config(const CoreConfig &config, std::string &error) {
    logging::Level level;
    if (!logging::parse_level(config.logging.level, level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    if (config.cache.path.empty()) {
        error = "cache.path must not be empty";
        return false;
    }
    if (config.cache.pool_size < 1) {
        error = "cache.pool_size must be at least 1";
        return false;
    }
    if (config.cache.busy_timeout_ms < 0) {
        error = "cache.busy_timeout_ms must be >= 0";
        return false;
    }

    const auto &env = config.cache.environment;
    if (env.retention < 0) {
        error = "cache.environment.retention must be >= 0";
        return false;
    }
    if (env.max_per_workdir && *env.max_per_workdir < 1) {
        error = "cache.environment.max_per_workdir must be >= 1";
        return false;
    }
    if (env.max_total && *env.max_total < 1) {
        error = "cache.environment.max_total must be >= 1";
        return false;
    }

    if (!validate_backend(config.cache.mise, "mise", error) ||
        !validate_backend(config.cache.homebrew, "homebrew", error) ||
        !validate_backend(config.cache.cargo_install, "cargo_install", error) ||
        !validate_backend(config.cache.go_install, "go_install", error) ||
        !validate_backend(config.cache.github_release, "github_release", error)) {
        return false;
    }
    if (config.cache.homebrew.install_check_expire < 0) {
        error = "cache.homebrew.install_check_expire must be >= 0";
        return false;
    }

    if (config.askpass.prefer_gui && !config.askpass.enable_gui) {
        LOG_WARN("[Config] askpass.prefer_gui has no effect while askpass.enable_gui is false");
    }

    return true;
}

bool load_config(const std::string &config_path, CoreConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, {"logging", "cache", "askpass"}, "");

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (yaml["cache"]) {
            const auto &cache = yaml["cache"];
            warn_unknown_keys(cache,
                              {"path", "pool_size", "busy_timeout_ms", "environment", "mise", "homebrew",
                               "cargo_install", "go_install", "github_release"},
                              "cache");

            if (cache["path"]) {
                config.cache.path = expand_home(cache["path"].as<std::string>());
            }
            if (cache["pool_size"]) {
                config.cache.pool_size = cache["pool_size"].as<int>();
            }
            if (cache["busy_timeout_ms"]) {
                config.cache.busy_timeout_ms = cache["busy_timeout_ms"].as<int>();
            }

            if (cache["environment"]) {
                const auto &env = cache["environment"];
                warn_unknown_keys(env, {"retention", "max_per_workdir", "max_total"}, "cache.environment");
                if (env["retention"]) {
                    config.cache.environment.retention = env["retention"].as<int64_t>();
                }
                if (env["max_per_workdir"] && !env["max_per_workdir"].IsNull()) {
                    config.cache.environment.max_per_workdir = env["max_per_workdir"].as<int64_t>();
                }
                if (env["max_total"] && !env["max_total"].IsNull()) {
                    config.cache.environment.max_total = env["max_total"].as<int64_t>();
                }
            }

            if (cache["mise"]) {
                load_backend(cache["mise"], "cache.mise", config.cache.mise);
            }
            if (cache["homebrew"]) {
                load_backend(cache["homebrew"], "cache.homebrew", config.cache.homebrew, {"install_check_expire"});
                if (cache["homebrew"]["install_check_expire"]) {
                    config.cache.homebrew.install_check_expire =
                        cache["homebrew"]["install_check_expire"].as<int64_t>();
                }
            }
            if (cache["cargo_install"]) {
                load_backend(cache["cargo_install"], "cache.cargo_install", config.cache.cargo_install);
            }
            if (cache["go_install"]) {
                load_backend(cache["go_install"], "cache.go_install", config.cache.go_install);
            }
            if (cache["github_release"]) {
                load_backend(cache["github_release"], "cache.github_release", config.cache.github_release);
            }
        }

        if (yaml["askpass"]) {
            const auto &askpass = yaml["askpass"];
            warn_unknown_keys(askpass, {"enabled", "enable_gui", "prefer_gui"}, "askpass");
            if (askpass["enabled"]) {
                config.askpass.enabled = askpass["enabled"].as<bool>();
            }
            if (askpass["enable_gui"]) {
                config.askpass.enable_gui = askpass["enable_gui"].as<bool>();
            }
            if (askpass["prefer_gui"]) {
                config.askpass.prefer_gui = askpass["prefer_gui"].as<bool>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Cache path: " << config.cache.path << " (pool size " << config.cache.pool_size << ")");

        std::stringstream env_msg;
        env_msg << "[Config] Environment retention: " << config.cache.environment.retention << "s";
        if (config.cache.environment.max_per_workdir) {
            env_msg << ", max " << *config.cache.environment.max_per_workdir << " per workdir";
        }
        if (config.cache.environment.max_total) {
            env_msg << ", max " << *config.cache.environment.max_total << " total";
        }
        LOG_INFO(env_msg.str());

        LOG_INFO("[Config] Askpass: " << (config.askpass.enabled ? "enabled" : "disabled"));
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace envkeeper
