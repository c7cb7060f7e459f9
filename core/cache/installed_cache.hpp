#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/backend.hpp"
#include "cache/connection_pool.hpp"
#include "common/errors.hpp"
#include "common/timestamp.hpp"
#include "runtime/config.hpp"

namespace envkeeper {
namespace cache {

// Identity of an installed artifact within one backend. An empty version is
// stored as '__NULL__' (unversioned formula, tap). Homebrew casks use the
// variant "cask".
struct ArtifactKey {
    std::string name;
    std::string version;
    std::string variant;

    bool operator<(const ArtifactKey &other) const {
        if (name != other.name) {
            return name < other.name;
        }
        if (version != other.version) {
            return version < other.version;
        }
        return variant < other.variant;
    }
    bool operator==(const ArtifactKey &other) const {
        return name == other.name && version == other.version && variant == other.variant;
    }
};

struct Artifact {
    ArtifactKey key;
    std::string last_required_at;
    std::set<std::string> required_by;  // env_version_ids
    std::optional<std::vector<std::string>> bin_paths;
};

// Fetched list of available versions (or releases) for one name
struct VersionsCacheEntry {
    nlohmann::json versions;
    common::TimePoint fetched_at;

    bool is_stale(std::chrono::seconds ttl) const;
};

/**
 * @brief Reference-counted record of what one backend has installed
 *
 * An artifact stays in the cache as long as an environment version requires
 * it. Once its last reference disappears (the environment version was
 * deleted and the rows cascaded) it only becomes eligible for removal after
 * cleanup_after seconds without being requested again.
 */
class InstalledCache {
public:
    InstalledCache(ConnectionPool &pool, Backend backend);

    Backend backend() const { return backend_; }

    // Inserts the artifact or refreshes its last_required_at
    bool record_installed(const ArtifactKey &key, bool &created, common::Error &error);

    // Fails when the artifact is not installed or the environment version is unknown.
    // Recording the same reference twice succeeds.
    bool record_required_by(const std::string &env_version_id, const ArtifactKey &key, common::Error &error);

    bool list_installed(std::vector<Artifact> &artifacts, common::Error &error);

    // Unreferenced artifacts not requested for longer than grace
    bool list_removable(std::chrono::seconds grace, std::vector<ArtifactKey> &keys, common::Error &error);

    // Deletes the artifact and its references
    bool remove(const ArtifactKey &key, common::Error &error);

    bool set_bin_paths(const ArtifactKey &key, const std::vector<std::string> &bin_paths, common::Error &error);
    std::optional<std::vector<std::string>> get_bin_paths(const ArtifactKey &key);

    // Replaces the whole cached versions list of name
    bool add_versions(const std::string &name, const nlohmann::json &versions, common::Error &error);
    std::optional<VersionsCacheEntry> get_versions(const std::string &name);

    // Whether the backend itself was last refreshed more than ttl ago (or never)
    bool should_update(std::chrono::seconds ttl);
    bool mark_updated(common::Error &error);

    // Drops unreferenced artifacts older than cleanup_after, then versions
    // lists of names not installed that are older than versions_retention
    bool cleanup(const runtime::BackendCacheConfig &config, common::Error &error);

private:
    std::string updated_at_key() const;

    ConnectionPool &pool_;
    Backend backend_;
    const BackendTables &tables_;
};

}  // namespace cache
}  // namespace envkeeper
