#pragma once

#include <string>
#include <vector>

#include "runtime/config.hpp"

namespace envkeeper {
namespace cache {

// Provisioning backends tracked by the cache. The set is closed: adding a
// backend means adding an enumerator here and a row in backend.cpp.
enum class Backend {
    MISE,
    HOMEBREW_INSTALL,
    HOMEBREW_TAP,
    CARGO_INSTALL,
    GO_INSTALL,
    GITHUB_RELEASE
};

// Table names for one backend, all sharing the same column layout:
//   <installed>   (name, version, variant, bin_paths, last_required_at)
//   <required_by> (name, version, variant, env_version_id)
//   <versions>    (name, versions, fetched_at)
struct BackendTables {
    const char *installed;
    const char *required_by;
    const char *versions;
    const char *metadata_prefix;  // metadata keys "<prefix>.updated_at"
};

const std::vector<Backend> &all_backends();

const BackendTables &backend_tables(Backend backend);

const char *backend_to_string(Backend backend);
bool parse_backend(const std::string &name, Backend &backend);

// Retention settings that apply to a backend (both Homebrew backends share one section)
const runtime::BackendCacheConfig &backend_cache_config(const runtime::CacheConfig &config, Backend backend);

}  // namespace cache
}  // namespace envkeeper
