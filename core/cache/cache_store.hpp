#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "cache/backend.hpp"
#include "cache/connection_pool.hpp"
#include "cache/installed_cache.hpp"
#include "cache/up_environments.hpp"
#include "common/errors.hpp"
#include "runtime/config.hpp"

namespace envkeeper {
namespace cache {

// Entry point to every cache of one database: one InstalledCache per backend
// plus the environments cache
class CacheStore {
public:
    CacheStore(ConnectionPool &pool, const runtime::CacheConfig &config);

    InstalledCache &installed(Backend backend);
    UpEnvironmentsCache &environments() { return environments_; }

    // Cached versions list of name, or nullopt when missing or older than
    // the backend's versions_expire
    std::optional<VersionsCacheEntry> fresh_versions(Backend backend, const std::string &name);

    // Whether the backend was last refreshed more than update_expire ago
    bool needs_update(Backend backend);

    // Runs the environment cleanup, then every backend's cleanup. A failing
    // step is logged and does not prevent the others; the returned error
    // lists every failure.
    bool cleanup(common::Error &error);

private:
    runtime::CacheConfig config_;
    UpEnvironmentsCache environments_;
    std::map<Backend, std::unique_ptr<InstalledCache>> installed_;
};

}  // namespace cache
}  // namespace envkeeper
