#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace envkeeper {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

// Retention and expiry for one provisioning backend (all values in seconds)
struct BackendCacheConfig {
    int64_t cleanup_after = 604800;          // Grace period before an unreferenced install is forgotten (1 week)
    int64_t versions_expire = 86400;         // TTL of a fetched versions list (1 day)
    int64_t versions_retention = 7776000;    // Versions lists of non-installed names dropped after this (90 days)
    int64_t update_expire = 86400;           // How often the backend itself is refreshed (1 day)
};

struct HomebrewCacheConfig : BackendCacheConfig {
    int64_t install_check_expire = 43200;  // Re-check an installed formula after 12 hours
};

// History and environment version retention (cache.environment: in YAML)
struct EnvironmentCacheConfig {
    int64_t retention = 7776000;              // Closed history entries older than this are removed (90 days)
    std::optional<int64_t> max_per_workdir;   // Unlimited when unset
    std::optional<int64_t> max_total;         // Unlimited when unset
};

struct CacheConfig {
    std::string path;            // Directory holding cache.db and the legacy JSON files
    int pool_size = 10;          // Maximum pooled database connections
    int busy_timeout_ms = 5000;  // SQLite busy handler timeout per connection

    EnvironmentCacheConfig environment;
    BackendCacheConfig mise;
    HomebrewCacheConfig homebrew;
    BackendCacheConfig cargo_install;
    BackendCacheConfig go_install;
    BackendCacheConfig github_release;

    CacheConfig() { mise.versions_expire = 3600; }
};

struct AskPassConfig {
    bool enabled = true;      // Relay sudo/ssh password prompts through the parent process
    bool enable_gui = true;   // Allow the generated scripts to fall back to a GUI dialog
    bool prefer_gui = false;  // Try the GUI dialog before the terminal prompt
};

struct CoreConfig {
    LoggingConfig logging;
    CacheConfig cache;
    AskPassConfig askpass;
};

// $XDG_CACHE_HOME/envkeeper, or ~/.cache/envkeeper
std::string default_cache_path();

// Defaults with cache.path resolved
CoreConfig default_config();

// Loads configuration from a YAML file on top of default_config()
bool load_config(const std::string &config_path, CoreConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const CoreConfig &config, std::string &error);

}  // namespace runtime
}  // namespace envkeeper
