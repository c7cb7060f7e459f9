#include "installed_cache.hpp"

#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

using common::Error;
using common::ErrorCode;
using nlohmann::json;

namespace {

const char *kNullVersion = "__NULL__";

std::string stored_version(const std::string &version) { return version.empty() ? kNullVersion : version; }

std::string loaded_version(const std::string &version) { return version == kNullVersion ? std::string() : version; }

std::string describe(const ArtifactKey &key) {
    std::string text = key.name;
    if (!key.version.empty()) {
        text += "@" + key.version;
    }
    if (!key.variant.empty()) {
        text += " (" + key.variant + ")";
    }
    return text;
}

void bind_key(Statement &stmt, const ArtifactKey &key, int first = 1) {
    stmt.bind_text(first, key.name);
    stmt.bind_text(first + 1, stored_version(key.version));
    stmt.bind_text(first + 2, key.variant);
}

// Steps a "SELECT 1 ..." statement
bool row_exists(Connection &conn, Statement &stmt, bool &exists, Error &error) {
    auto step = stmt.step();
    if (step == Statement::StepResult::ERROR) {
        return common::fail(error, ErrorCode::SQL, conn.error_message("lookup failed"));
    }
    exists = step == Statement::StepResult::ROW;
    return true;
}

}  // namespace

bool VersionsCacheEntry::is_stale(std::chrono::seconds ttl) const {
    return fetched_at + ttl < std::chrono::system_clock::now();
}

InstalledCache::InstalledCache(ConnectionPool &pool, Backend backend)
    : pool_(pool), backend_(backend), tables_(backend_tables(backend)) {}

std::string InstalledCache::updated_at_key() const { return std::string(tables_.metadata_prefix) + ".updated_at"; }

bool InstalledCache::record_installed(const ArtifactKey &key, bool &created, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    bool existed = false;
    bool ok = with_transaction(
        *conn,
        [&](Error &err) {
            Statement lookup;
            if (!conn->prepare(std::string("SELECT 1 FROM ") + tables_.installed +
                                   " WHERE name = ?1 AND version = ?2 AND variant = ?3",
                               lookup, err)) {
                return false;
            }
            bind_key(lookup, key);
            if (!row_exists(*conn, lookup, existed, err)) {
                return false;
            }

            Statement upsert;
            if (!conn->prepare(std::string("INSERT INTO ") + tables_.installed +
                                   " (name, version, variant, last_required_at) "
                                   "VALUES (?1, ?2, ?3, strftime('%Y-%m-%dT%H:%M:%SZ', 'now')) "
                                   "ON CONFLICT (name, version, variant) DO UPDATE SET "
                                   "last_required_at = strftime('%Y-%m-%dT%H:%M:%SZ', 'now')",
                               upsert, err)) {
                return false;
            }
            bind_key(upsert, key);
            return conn->run(upsert, err);
        },
        error);
    if (!ok) {
        return false;
    }

    created = !existed;
    LOG_DEBUG("[Cache] " << backend_to_string(backend_) << ": " << (created ? "recorded " : "refreshed ")
                         << describe(key));
    return true;
}

bool InstalledCache::record_required_by(const std::string &env_version_id, const ArtifactKey &key, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement installed;
            if (!conn->prepare(std::string("SELECT 1 FROM ") + tables_.installed +
                                   " WHERE name = ?1 AND version = ?2 AND variant = ?3",
                               installed, err)) {
                return false;
            }
            bind_key(installed, key);
            bool exists = false;
            if (!row_exists(*conn, installed, exists, err)) {
                return false;
            }
            if (!exists) {
                return common::fail(err, ErrorCode::SQL,
                                    std::string(backend_to_string(backend_)) + ": " + describe(key) +
                                        " is not installed");
            }

            Statement env;
            if (!conn->prepare("SELECT 1 FROM env_versions WHERE env_version_id = ?1", env, err)) {
                return false;
            }
            env.bind_text(1, env_version_id);
            if (!row_exists(*conn, env, exists, err)) {
                return false;
            }
            if (!exists) {
                return common::fail(err, ErrorCode::SQL, "unknown environment version " + env_version_id);
            }

            Statement insert;
            if (!conn->prepare(std::string("INSERT INTO ") + tables_.required_by +
                                   " (name, version, variant, env_version_id) VALUES (?1, ?2, ?3, ?4) "
                                   "ON CONFLICT (name, version, variant, env_version_id) DO NOTHING",
                               insert, err)) {
                return false;
            }
            bind_key(insert, key);
            insert.bind_text(4, env_version_id);
            return conn->run(insert, err);
        },
        error);
}

bool InstalledCache::list_installed(std::vector<Artifact> &artifacts, Error &error) {
    artifacts.clear();
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    Statement stmt;
    std::string sql = std::string("SELECT i.name, i.version, i.variant, i.bin_paths, i.last_required_at, "
                                  "r.env_version_id FROM ") +
                      tables_.installed + " AS i LEFT JOIN " + tables_.required_by +
                      " AS r ON r.name = i.name AND r.version = i.version AND r.variant = i.variant "
                      "ORDER BY i.name, i.version, i.variant";
    if (!conn->prepare(sql, stmt, error)) {
        return false;
    }

    while (true) {
        auto step = stmt.step();
        if (step == Statement::StepResult::DONE) {
            return true;
        }
        if (step == Statement::StepResult::ERROR) {
            return common::fail(error, ErrorCode::SQL, conn->error_message("listing installed artifacts failed"));
        }

        ArtifactKey key{stmt.column_text(0), loaded_version(stmt.column_text(1)), stmt.column_text(2)};
        if (artifacts.empty() || !(artifacts.back().key == key)) {
            Artifact artifact;
            artifact.key = key;
            artifact.last_required_at = stmt.column_text(4);
            if (!stmt.column_is_null(3)) {
                try {
                    artifact.bin_paths = json::parse(stmt.column_text(3)).get<std::vector<std::string>>();
                } catch (const json::exception &e) {
                    LOG_WARN("[Cache] Ignoring malformed bin paths of " << describe(key) << ": " << e.what());
                }
            }
            artifacts.push_back(artifact);
        }
        if (!stmt.column_is_null(5)) {
            artifacts.back().required_by.insert(stmt.column_text(5));
        }
    }
}

bool InstalledCache::list_removable(std::chrono::seconds grace, std::vector<ArtifactKey> &keys, Error &error) {
    keys.clear();
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    Statement stmt;
    std::string sql = std::string("SELECT i.name, i.version, i.variant FROM ") + tables_.installed +
                      " AS i WHERE NOT EXISTS (SELECT 1 FROM " + tables_.required_by +
                      " AS r WHERE r.name = i.name AND r.version = i.version AND r.variant = i.variant) "
                      "AND CAST(strftime('%s', 'now') AS INTEGER) > "
                      "(CAST(strftime('%s', i.last_required_at) AS INTEGER) + ?1) "
                      "ORDER BY i.name, i.version, i.variant";
    if (!conn->prepare(sql, stmt, error)) {
        return false;
    }
    stmt.bind_int64(1, grace.count());

    while (true) {
        auto step = stmt.step();
        if (step == Statement::StepResult::DONE) {
            return true;
        }
        if (step == Statement::StepResult::ERROR) {
            return common::fail(error, ErrorCode::SQL, conn->error_message("listing removable artifacts failed"));
        }
        keys.push_back(ArtifactKey{stmt.column_text(0), loaded_version(stmt.column_text(1)), stmt.column_text(2)});
    }
}

bool InstalledCache::remove(const ArtifactKey &key, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare(std::string("DELETE FROM ") + tables_.installed +
                                   " WHERE name = ?1 AND version = ?2 AND variant = ?3",
                               stmt, err)) {
                return false;
            }
            bind_key(stmt, key);
            if (!conn->run(stmt, err)) {
                return false;
            }
            LOG_DEBUG("[Cache] " << backend_to_string(backend_) << ": removed " << describe(key));
            return true;
        },
        error);
}

bool InstalledCache::set_bin_paths(const ArtifactKey &key, const std::vector<std::string> &bin_paths,
                                   Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare(std::string("UPDATE ") + tables_.installed +
                                   " SET bin_paths = ?4 WHERE name = ?1 AND version = ?2 AND variant = ?3",
                               stmt, err)) {
                return false;
            }
            bind_key(stmt, key);
            stmt.bind_text(4, json(bin_paths).dump());
            if (!conn->run(stmt, err)) {
                return false;
            }
            if (conn->changes() == 0) {
                return common::fail(err, ErrorCode::SQL,
                                    std::string(backend_to_string(backend_)) + ": " + describe(key) +
                                        " is not installed");
            }
            return true;
        },
        error);
}

std::optional<std::vector<std::string>> InstalledCache::get_bin_paths(const ArtifactKey &key) {
    Error error;
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        LOG_WARN("[Cache] " << error.message);
        return std::nullopt;
    }

    Statement stmt;
    if (!conn->prepare(std::string("SELECT bin_paths FROM ") + tables_.installed +
                           " WHERE name = ?1 AND version = ?2 AND variant = ?3",
                       stmt, error)) {
        LOG_WARN("[Cache] " << error.message);
        return std::nullopt;
    }
    bind_key(stmt, key);
    if (stmt.step() != Statement::StepResult::ROW || stmt.column_is_null(0)) {
        return std::nullopt;
    }

    try {
        return json::parse(stmt.column_text(0)).get<std::vector<std::string>>();
    } catch (const json::exception &e) {
        LOG_WARN("[Cache] Malformed bin paths for " << describe(key) << ": " << e.what());
        return std::nullopt;
    }
}

bool InstalledCache::add_versions(const std::string &name, const json &versions, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare(std::string("INSERT INTO ") + tables_.versions +
                                   " (name, versions, fetched_at) "
                                   "VALUES (?1, ?2, strftime('%Y-%m-%dT%H:%M:%SZ', 'now')) "
                                   "ON CONFLICT (name) DO UPDATE SET versions = excluded.versions, "
                                   "fetched_at = excluded.fetched_at",
                               stmt, err)) {
                return false;
            }
            stmt.bind_text(1, name);
            stmt.bind_text(2, versions.dump());
            return conn->run(stmt, err);
        },
        error);
}

std::optional<VersionsCacheEntry> InstalledCache::get_versions(const std::string &name) {
    Error error;
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        LOG_WARN("[Cache] " << error.message);
        return std::nullopt;
    }

    Statement stmt;
    if (!conn->prepare(std::string("SELECT versions, fetched_at FROM ") + tables_.versions + " WHERE name = ?1",
                       stmt, error)) {
        LOG_WARN("[Cache] " << error.message);
        return std::nullopt;
    }
    stmt.bind_text(1, name);
    if (stmt.step() != Statement::StepResult::ROW) {
        return std::nullopt;
    }

    VersionsCacheEntry entry;
    try {
        entry.versions = json::parse(stmt.column_text(0));
    } catch (const json::exception &e) {
        LOG_WARN("[Cache] Malformed versions cache for " << name << ": " << e.what());
        return std::nullopt;
    }
    if (!common::parse_rfc3339(stmt.column_text(1), entry.fetched_at)) {
        LOG_WARN("[Cache] Malformed fetched_at for " << name << ": " << stmt.column_text(1));
        return std::nullopt;
    }
    return entry;
}

bool InstalledCache::should_update(std::chrono::seconds ttl) {
    Error error;
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        LOG_WARN("[Cache] " << error.message);
        return true;
    }

    Statement stmt;
    if (!conn->prepare("SELECT CASE WHEN value IS NULL THEN 1 "
                       "WHEN CAST(strftime('%s', 'now') AS INTEGER) > "
                       "(CAST(strftime('%s', value) AS INTEGER) + ?2) THEN 1 ELSE 0 END "
                       "FROM metadata WHERE key = ?1",
                       stmt, error)) {
        LOG_WARN("[Cache] " << error.message);
        return true;
    }
    stmt.bind_text(1, updated_at_key());
    stmt.bind_int64(2, ttl.count());

    if (stmt.step() != Statement::StepResult::ROW) {
        return true;
    }
    return stmt.column_int64(0) != 0;
}

bool InstalledCache::mark_updated(Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare("INSERT INTO metadata (key, value) "
                               "VALUES (?1, strftime('%Y-%m-%dT%H:%M:%fZ', 'now')) "
                               "ON CONFLICT (key) DO UPDATE SET value = excluded.value",
                               stmt, err)) {
                return false;
            }
            stmt.bind_text(1, updated_at_key());
            return conn->run(stmt, err);
        },
        error);
}

bool InstalledCache::cleanup(const runtime::BackendCacheConfig &config, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    bool installed_ok = with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            std::string sql = std::string("DELETE FROM ") + tables_.installed +
                              " WHERE NOT EXISTS (SELECT 1 FROM " + tables_.required_by + " AS r WHERE r.name = " +
                              tables_.installed + ".name AND r.version = " + tables_.installed +
                              ".version AND r.variant = " + tables_.installed +
                              ".variant) AND CAST(strftime('%s', 'now') AS INTEGER) > "
                              "(CAST(strftime('%s', last_required_at) AS INTEGER) + ?1)";
            if (!conn->prepare(sql, stmt, err)) {
                return false;
            }
            stmt.bind_int64(1, config.cleanup_after);
            if (!conn->run(stmt, err)) {
                return false;
            }
            if (conn->changes() > 0) {
                LOG_INFO("[Cache] " << backend_to_string(backend_) << ": forgot " << conn->changes()
                                    << " unreferenced artifact(s)");
            }
            return true;
        },
        error);
    if (!installed_ok) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            std::string sql = std::string("DELETE FROM ") + tables_.versions + " WHERE NOT EXISTS (SELECT 1 FROM " +
                              tables_.installed + " AS i WHERE i.name = " + tables_.versions +
                              ".name) AND CAST(strftime('%s', 'now') AS INTEGER) > "
                              "(CAST(strftime('%s', fetched_at) AS INTEGER) + ?1)";
            if (!conn->prepare(sql, stmt, err)) {
                return false;
            }
            stmt.bind_int64(1, config.versions_retention);
            return conn->run(stmt, err);
        },
        error);
}

}  // namespace cache
}  // namespace envkeeper
