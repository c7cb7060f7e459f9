#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/connection_pool.hpp"
#include "common/errors.hpp"
#include "runtime/config.hpp"

namespace envkeeper {
namespace cache {

// Tool version resolved for a work directory. dir scopes the version to a
// subdirectory (relative to the work directory); empty applies everywhere.
struct UpVersion {
    std::string tool;
    std::optional<std::string> tool_real_name;
    std::string version;
    std::string dir;
    std::optional<std::string> data_path;
};

struct UpEnvVar {
    std::string name;
    std::optional<std::string> value;
    std::string operation = "set";  // set, prepend, append, remove, prefix, suffix
};

// Resolved environment of a work directory. Stored immutably as an
// environment version keyed by "<workdir_id>%<hash_string()>".
struct UpEnvironment {
    std::vector<UpVersion> versions;
    std::vector<std::string> paths;
    std::vector<UpEnvVar> env_vars;
    std::map<std::string, uint64_t> config_modtimes;
    std::string config_hash;
    std::string last_assigned_at;  // not part of the content hash

    void add_version(const std::string &tool, const std::optional<std::string> &tool_real_name,
                     const std::string &version, const std::string &dir);
    bool add_path(const std::string &path);
    void add_env_var(const std::string &name, const std::string &value, const std::string &operation = "set");

    // For each tool, the version whose dir is the most specific ancestor of
    // dir (empty, equal, or "<version.dir>/" prefix). Sorted by tool name.
    std::vector<UpVersion> versions_for_dir(const std::string &dir) const;

    // Stable 64-bit content hash, 16 lowercase hex digits
    std::string hash_string() const;
};

void to_json(nlohmann::json &j, const UpVersion &v);
void from_json(const nlohmann::json &j, UpVersion &v);
void to_json(nlohmann::json &j, const UpEnvVar &v);
void from_json(const nlohmann::json &j, UpEnvVar &v);

struct HistoryEntry {
    int64_t id = 0;
    std::string workdir_id;
    std::optional<std::string> head_sha;
    std::string env_version_id;
    std::string used_from_date;
    std::optional<std::string> used_until_date;

    bool is_open() const { return !used_until_date.has_value(); }
};

// Environment versions, the workdir -> version pointer, and the usage history
class UpEnvironmentsCache {
public:
    UpEnvironmentsCache(ConnectionPool &pool, const runtime::EnvironmentCacheConfig &config);

    // Stores env as a version (reusing an identical one), points workdir_id
    // at it, records the switch in the history and prunes. env.last_assigned_at
    // is refreshed. new_env tells whether the version did not exist yet.
    bool assign_environment(const std::string &workdir_id, const std::optional<std::string> &head_sha,
                            UpEnvironment &env, bool &new_env, std::string &env_version_id,
                            common::Error &error);

    std::optional<UpEnvironment> get_env(const std::string &workdir_id);
    std::optional<UpEnvironment> get_env_version(const std::string &env_version_id);
    std::optional<std::string> get_env_version_id(const std::string &workdir_id);
    bool env_version_exists(const std::string &env_version_id, common::Error &error);

    // Forgets the workdir pointer and closes its open history entry
    bool clear(const std::string &workdir_id, common::Error &error);

    // Closes the open history entry of workdir_id, if any
    bool close_history(const std::string &workdir_id, common::Error &error);

    // Most recent first, open entries first. Empty workdir_id lists everything.
    bool list_history(const std::string &workdir_id, std::vector<HistoryEntry> &entries, common::Error &error);

    // Deletes a version with its history rows and pointers. Every backend's
    // required_by rows for it go away through ON DELETE CASCADE.
    bool delete_env_version(const std::string &env_version_id, common::Error &error);

    // History pruning followed by removal of versions nothing refers to
    bool cleanup(common::Error &error);

private:
    bool cleanup_with(Connection &conn, common::Error &error);
    bool add_history(Connection &conn, const std::string &workdir_id, const std::optional<std::string> &head_sha,
                     const std::string &env_version_id, common::Error &error);
    bool close_open_history(Connection &conn, const std::string &workdir_id, common::Error &error);
    std::optional<UpEnvironment> load_version(Connection &conn, const std::string &env_version_id);

    ConnectionPool &pool_;
    runtime::EnvironmentCacheConfig config_;
};

}  // namespace cache
}  // namespace envkeeper
