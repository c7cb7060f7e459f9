#include "schema.hpp"

#include <functional>
#include <sstream>
#include <vector>

#include "cache/backend.hpp"
#include "cache/legacy_import.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

namespace {

const char *kBaseTables = R"SQL(
CREATE TABLE IF NOT EXISTS metadata (
    key TEXT PRIMARY KEY COLLATE NOCASE,
    value TEXT
);

CREATE TABLE IF NOT EXISTS env_versions (
    env_version_id TEXT PRIMARY KEY,
    versions TEXT NOT NULL,
    paths TEXT NOT NULL,
    env_vars TEXT NOT NULL,
    config_modtimes TEXT NOT NULL,
    config_hash TEXT NOT NULL,
    last_assigned_at TEXT NOT NULL DEFAULT '1970-01-01T00:00:00.000Z'
);

CREATE TABLE IF NOT EXISTS workdir_env (
    workdir_id TEXT PRIMARY KEY COLLATE NOCASE,
    env_version_id TEXT NOT NULL,
    FOREIGN KEY(env_version_id) REFERENCES env_versions(env_version_id)
);

CREATE TABLE IF NOT EXISTS env_history (
    env_history_id INTEGER PRIMARY KEY AUTOINCREMENT,
    workdir_id TEXT NOT NULL COLLATE NOCASE,
    env_version_id TEXT NOT NULL,
    head_sha TEXT,
    used_from_date TEXT NOT NULL,
    used_until_date TEXT,
    FOREIGN KEY(env_version_id) REFERENCES env_versions(env_version_id)
);

CREATE INDEX IF NOT EXISTS idx_workdir_env_env_version_id ON workdir_env(env_version_id);
CREATE INDEX IF NOT EXISTS idx_env_history_workdir ON env_history(workdir_id);
CREATE INDEX IF NOT EXISTS idx_env_history_env_version_id ON env_history(env_version_id);
)SQL";

std::string backend_tables_sql(const BackendTables &t) {
    std::stringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << t.installed << " (\n"
        << "    name TEXT NOT NULL COLLATE NOCASE,\n"
        << "    version TEXT NOT NULL DEFAULT '__NULL__',\n"
        << "    variant TEXT NOT NULL DEFAULT '' COLLATE NOCASE,\n"
        << "    bin_paths TEXT,\n"
        << "    last_required_at TEXT NOT NULL DEFAULT '1970-01-01T00:00:00.000Z',\n"
        << "    PRIMARY KEY (name, version, variant)\n"
        << ");\n";

    sql << "CREATE TABLE IF NOT EXISTS " << t.required_by << " (\n"
        << "    name TEXT NOT NULL COLLATE NOCASE,\n"
        << "    version TEXT NOT NULL DEFAULT '__NULL__',\n"
        << "    variant TEXT NOT NULL DEFAULT '' COLLATE NOCASE,\n"
        << "    env_version_id TEXT NOT NULL,\n"
        << "    PRIMARY KEY (name, version, variant, env_version_id),\n"
        << "    FOREIGN KEY(name, version, variant) REFERENCES " << t.installed
        << "(name, version, variant) ON DELETE CASCADE,\n"
        << "    FOREIGN KEY(env_version_id) REFERENCES env_versions(env_version_id) ON DELETE CASCADE\n"
        << ");\n";

    sql << "CREATE TABLE IF NOT EXISTS " << t.versions << " (\n"
        << "    name TEXT PRIMARY KEY COLLATE NOCASE,\n"
        << "    versions TEXT NOT NULL,\n"
        << "    fetched_at TEXT NOT NULL\n"
        << ");\n";

    sql << "CREATE INDEX IF NOT EXISTS idx_" << t.required_by << "_artifact ON " << t.required_by
        << "(name, version, variant);\n";
    sql << "CREATE INDEX IF NOT EXISTS idx_" << t.required_by << "_env ON " << t.required_by
        << "(env_version_id);\n";
    return sql.str();
}

struct UpgradeStep {
    int from_version;
    const char *description;
    std::function<bool(Connection &, common::Error &)> apply;
};

// Step upgrades applied after the tables exist. Each runs in its own
// transaction together with the user_version bump.
const std::vector<UpgradeStep> &upgrade_steps() {
    static const std::vector<UpgradeStep> steps = {
        {1, "clear cached GitHub release lists",
         [](Connection &conn, common::Error &error) {
             return conn.exec(std::string("DELETE FROM ") + backend_tables(Backend::GITHUB_RELEASE).versions + ";",
                              error);
         }},
    };
    return steps;
}

}  // namespace

bool create_tables(Connection &conn, common::Error &error) {
    std::string sql = kBaseTables;
    for (Backend backend : all_backends()) {
        sql += backend_tables_sql(backend_tables(backend));
    }
    sql += "PRAGMA user_version = 1;\n";
    return conn.exec(sql, error);
}

bool upgrade_database(Connection &conn, const std::string &legacy_dir, common::Error &error) {
    UpgradeFailure failure = UpgradeFailure::NONE;
    return upgrade_database(conn, legacy_dir, failure, error);
}

bool upgrade_database(Connection &conn, const std::string &legacy_dir, UpgradeFailure &failure,
                      common::Error &error) {
    failure = UpgradeFailure::OTHER;
    int version = 0;
    if (!conn.user_version(version, error)) {
        return false;
    }

    if (version == 0) {
        LOG_INFO("[Schema] Initializing cache database");

        if (!legacy_dir.empty() && !normalize_legacy_cache(legacy_dir, error)) {
            error.message = "legacy cache normalization failed: " + error.message;
            return false;
        }

        // Set when the migration itself failed, as opposed to taking the write lock or committing
        bool migration_failed = false;
        bool created = with_transaction(
            conn,
            [&](common::Error &err) {
                // Another process may have initialized the file while we waited for the write lock
                int current = 0;
                if (!conn.user_version(current, err)) {
                    return false;
                }
                if (current != 0) {
                    return true;
                }
                if (!create_tables(conn, err)) {
                    migration_failed = true;
                    return false;
                }
                if (!legacy_dir.empty() && !import_legacy_cache(conn, legacy_dir, err)) {
                    err.message = "legacy cache import failed: " + err.message;
                    migration_failed = true;
                    return false;
                }
                return true;
            },
            error);
        if (!created) {
            if (migration_failed) {
                failure = UpgradeFailure::INITIAL_MIGRATION;
            }
            return false;
        }
        if (!conn.user_version(version, error)) {
            return false;
        }
    }

    if (version > kSchemaVersion) {
        return common::fail(error, common::ErrorCode::SQL,
                            "database schema version " + std::to_string(version) + " is newer than supported (" +
                                std::to_string(kSchemaVersion) + ")");
    }

    for (const auto &step : upgrade_steps()) {
        if (step.from_version < version) {
            continue;
        }
        LOG_INFO("[Schema] Upgrading v" << step.from_version << " -> v" << (step.from_version + 1) << ": "
                                        << step.description);
        bool ok = with_transaction(
            conn,
            [&](common::Error &err) {
                int current = 0;
                if (!conn.user_version(current, err)) {
                    return false;
                }
                if (current != step.from_version) {
                    return true;
                }
                return step.apply(conn, err) && conn.set_user_version(step.from_version + 1, err);
            },
            error);
        if (!ok) {
            return false;
        }
        version = step.from_version + 1;
    }

    failure = UpgradeFailure::NONE;
    return true;
}

}  // namespace cache
}  // namespace envkeeper
