#include "cache_store.hpp"

#include <chrono>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

CacheStore::CacheStore(ConnectionPool &pool, const runtime::CacheConfig &config)
    : config_(config), environments_(pool, config.environment) {
    for (Backend backend : all_backends()) {
        installed_[backend] = std::make_unique<InstalledCache>(pool, backend);
    }
}

InstalledCache &CacheStore::installed(Backend backend) { return *installed_.at(backend); }

std::optional<VersionsCacheEntry> CacheStore::fresh_versions(Backend backend, const std::string &name) {
    std::optional<VersionsCacheEntry> entry = installed(backend).get_versions(name);
    if (!entry) {
        return std::nullopt;
    }
    std::chrono::seconds ttl(backend_cache_config(config_, backend).versions_expire);
    if (entry->is_stale(ttl)) {
        LOG_DEBUG("[Cache] Versions of " << name << " for " << backend_to_string(backend) << " are stale");
        return std::nullopt;
    }
    return entry;
}

bool CacheStore::needs_update(Backend backend) {
    return installed(backend).should_update(std::chrono::seconds(backend_cache_config(config_, backend).update_expire));
}

bool CacheStore::cleanup(common::Error &error) {
    std::vector<std::string> failures;

    // Environments first so versions it drops release their artifacts
    common::Error env_error;
    if (!environments_.cleanup(env_error)) {
        LOG_ERROR("[Cache] Environment cleanup failed: " << env_error.message);
        failures.push_back("environments: " + env_error.message);
    }

    for (Backend backend : all_backends()) {
        common::Error backend_error;
        if (!installed_.at(backend)->cleanup(backend_cache_config(config_, backend), backend_error)) {
            LOG_ERROR("[Cache] " << backend_to_string(backend) << " cleanup failed: " << backend_error.message);
            failures.push_back(std::string(backend_to_string(backend)) + ": " + backend_error.message);
        }
    }

    if (failures.empty()) {
        return true;
    }

    std::stringstream message;
    message << "cleanup failed for ";
    for (size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) {
            message << "; ";
        }
        message << failures[i];
    }
    return common::fail(error, common::ErrorCode::SQL, message.str());
}

}  // namespace cache
}  // namespace envkeeper
