#pragma once

#include <string>

#include "cache/database.hpp"
#include "common/errors.hpp"

namespace envkeeper {
namespace cache {

// Legacy JSON cache files, looked up in the cache directory
constexpr const char *kLegacyEnvironmentsFile = "up_environments.json";
constexpr const char *kLegacyMiseFile = "asdf_operation.json";
constexpr const char *kLegacyHomebrewFile = "homebrew_operation.json";
constexpr const char *kLegacyGithubReleaseFile = "github_release_operation.json";

/**
 * @brief Rewrites pre-versioning legacy files in place
 *
 * An up_environments.json still in the {"env": {workdir: env}} layout is
 * converted to the versioned layout (workdir_env, versioned_env, history),
 * and the required_by sets of the other legacy files are rewritten from
 * workdir ids to the new environment version ids. Files already in the
 * versioned layout are left untouched. Each file is held under an exclusive
 * flock while it is rewritten.
 */
bool normalize_legacy_cache(const std::string &dir, common::Error &error);

/**
 * @brief Copies the legacy JSON files into freshly created tables
 *
 * Must run inside the schema creation transaction. Missing or empty files are
 * skipped. required_by rows pointing at unknown environment versions are
 * dropped silently.
 */
bool import_legacy_cache(Connection &conn, const std::string &dir, common::Error &error);

}  // namespace cache
}  // namespace envkeeper
