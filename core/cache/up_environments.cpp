#include "up_environments.hpp"

#include <algorithm>
#include <cstdio>

#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

using common::Error;
using common::ErrorCode;
using nlohmann::json;

namespace {

const char *kNow = "strftime('%Y-%m-%dT%H:%M:%fZ', 'now')";

uint64_t fnv1a(const std::string &data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool bind_optional(Statement &stmt, int index, const std::optional<std::string> &value) {
    return value ? stmt.bind_text(index, *value) : stmt.bind_null(index);
}

}  // namespace

void to_json(json &j, const UpVersion &v) {
    j = json{{"tool", v.tool}, {"version", v.version}};
    if (v.tool_real_name) {
        j["tool_real_name"] = *v.tool_real_name;
    }
    if (!v.dir.empty()) {
        j["dir"] = v.dir;
    }
    if (v.data_path) {
        j["data_path"] = *v.data_path;
    }
}

void from_json(const json &j, UpVersion &v) {
    v.tool = j.at("tool").get<std::string>();
    v.version = j.at("version").get<std::string>();
    v.tool_real_name.reset();
    if (j.contains("tool_real_name") && !j["tool_real_name"].is_null()) {
        v.tool_real_name = j["tool_real_name"].get<std::string>();
    }
    v.dir = j.value("dir", std::string());
    v.data_path.reset();
    if (j.contains("data_path") && !j["data_path"].is_null()) {
        v.data_path = j["data_path"].get<std::string>();
    }
}

void to_json(json &j, const UpEnvVar &v) {
    j = json::object();
    if (!v.name.empty()) {
        j["n"] = v.name;
    }
    if (v.value) {
        j["v"] = *v.value;
    }
    if (v.operation != "set") {
        j["o"] = v.operation;
    }
}

void from_json(const json &j, UpEnvVar &v) {
    auto pick = [&j](const char *key, const char *alias) -> const json * {
        if (j.contains(key)) {
            return &j[key];
        }
        if (j.contains(alias)) {
            return &j[alias];
        }
        return nullptr;
    };

    const json *name = pick("n", "name");
    v.name = name != nullptr ? name->get<std::string>() : std::string();

    const json *value = pick("v", "value");
    v.value.reset();
    if (value != nullptr && !value->is_null()) {
        v.value = value->get<std::string>();
    }

    const json *operation = pick("o", "operation");
    v.operation = operation != nullptr ? operation->get<std::string>() : std::string("set");
}

void UpEnvironment::add_version(const std::string &tool, const std::optional<std::string> &tool_real_name,
                                const std::string &version, const std::string &dir) {
    for (const auto &existing : versions) {
        if (existing.tool == tool && existing.dir == dir && existing.version == version) {
            return;
        }
    }
    UpVersion entry;
    entry.tool = tool;
    entry.tool_real_name = tool_real_name;
    entry.version = version;
    entry.dir = dir;
    versions.push_back(entry);
}

bool UpEnvironment::add_path(const std::string &path) {
    if (std::find(paths.begin(), paths.end(), path) != paths.end()) {
        return false;
    }
    paths.push_back(path);
    return true;
}

void UpEnvironment::add_env_var(const std::string &name, const std::string &value, const std::string &operation) {
    UpEnvVar var;
    var.name = name;
    var.value = value;
    var.operation = operation;
    env_vars.push_back(var);
}

std::vector<UpVersion> UpEnvironment::versions_for_dir(const std::string &dir) const {
    std::map<std::string, UpVersion> selected;

    for (const auto &version : versions) {
        bool applies = version.dir.empty() || dir == version.dir ||
                       dir.compare(0, version.dir.size() + 1, version.dir + "/") == 0;
        if (!applies) {
            continue;
        }

        auto it = selected.find(version.tool);
        if (it != selected.end() && it->second.dir.size() > version.dir.size()) {
            continue;
        }
        selected[version.tool] = version;
    }

    std::vector<UpVersion> result;
    result.reserve(selected.size());
    for (const auto &entry : selected) {
        result.push_back(entry.second);
    }
    return result;
}

std::string UpEnvironment::hash_string() const {
    json content = {{"versions", versions},
                    {"paths", paths},
                    {"env_vars", env_vars},
                    {"config_modtimes", config_modtimes},
                    {"config_hash", config_hash}};
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a(content.dump())));
    return std::string(buf);
}

UpEnvironmentsCache::UpEnvironmentsCache(ConnectionPool &pool, const runtime::EnvironmentCacheConfig &config)
    : pool_(pool), config_(config) {}

bool UpEnvironmentsCache::assign_environment(const std::string &workdir_id, const std::optional<std::string> &head_sha,
                                             UpEnvironment &env, bool &new_env, std::string &env_version_id,
                                             Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    std::string version_id = workdir_id + "%" + env.hash_string();
    bool created = false;

    bool ok = with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare("SELECT 1 FROM env_versions WHERE env_version_id = ?1", stmt, err)) {
                return false;
            }
            stmt.bind_text(1, version_id);
            auto step = stmt.step();
            if (step == Statement::StepResult::ERROR) {
                return common::fail(err, ErrorCode::SQL, conn->error_message("env version lookup failed"));
            }
            created = step == Statement::StepResult::DONE;

            Statement upsert;
            std::string sql =
                std::string("INSERT INTO env_versions (env_version_id, versions, paths, env_vars, config_modtimes, "
                            "config_hash, last_assigned_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ") +
                kNow + ") ON CONFLICT (env_version_id) DO UPDATE SET last_assigned_at = " + kNow;
            if (!conn->prepare(sql, upsert, err)) {
                return false;
            }
            upsert.bind_text(1, version_id);
            upsert.bind_text(2, json(env.versions).dump());
            upsert.bind_text(3, json(env.paths).dump());
            upsert.bind_text(4, json(env.env_vars).dump());
            upsert.bind_text(5, json(env.config_modtimes).dump());
            upsert.bind_text(6, env.config_hash);
            if (!conn->run(upsert, err)) {
                return false;
            }

            Statement pointer;
            if (!conn->prepare("INSERT INTO workdir_env (workdir_id, env_version_id) VALUES (?1, ?2) "
                               "ON CONFLICT (workdir_id) DO UPDATE SET env_version_id = excluded.env_version_id",
                               pointer, err)) {
                return false;
            }
            pointer.bind_text(1, workdir_id);
            pointer.bind_text(2, version_id);
            if (!conn->run(pointer, err)) {
                return false;
            }

            if (!add_history(*conn, workdir_id, head_sha, version_id, err)) {
                return false;
            }

            Statement assigned;
            if (!conn->prepare("SELECT last_assigned_at FROM env_versions WHERE env_version_id = ?1", assigned,
                               err)) {
                return false;
            }
            assigned.bind_text(1, version_id);
            if (assigned.step() == Statement::StepResult::ROW) {
                env.last_assigned_at = assigned.column_text(0);
            }

            return cleanup_with(*conn, err);
        },
        error);

    if (!ok) {
        LOG_WARN("[Environments] Failed to assign environment to " << workdir_id << ": " << error.message);
        return false;
    }

    new_env = created;
    env_version_id = version_id;
    LOG_DEBUG("[Environments] " << workdir_id << " -> " << version_id << (created ? " (new)" : " (existing)"));
    return true;
}

bool UpEnvironmentsCache::add_history(Connection &conn, const std::string &workdir_id,
                                      const std::optional<std::string> &head_sha, const std::string &env_version_id,
                                      Error &error) {
    Statement open;
    if (!conn.prepare("SELECT env_history_id, env_version_id, head_sha FROM env_history "
                      "WHERE workdir_id = ?1 AND used_until_date IS NULL "
                      "ORDER BY env_history_id DESC LIMIT 1",
                      open, error)) {
        return false;
    }
    open.bind_text(1, workdir_id);
    auto step = open.step();
    if (step == Statement::StepResult::ERROR) {
        return common::fail(error, ErrorCode::SQL, conn.error_message("history lookup failed"));
    }

    if (step == Statement::StepResult::ROW) {
        std::optional<std::string> open_sha;
        if (!open.column_is_null(2)) {
            open_sha = open.column_text(2);
        }
        if (open.column_text(1) == env_version_id && open_sha == head_sha) {
            return true;
        }
    }

    if (!close_open_history(conn, workdir_id, error)) {
        return false;
    }

    Statement insert;
    std::string sql =
        std::string("INSERT INTO env_history (workdir_id, env_version_id, head_sha, used_from_date) "
                    "VALUES (?1, ?2, ?3, ") +
        kNow + ")";
    if (!conn.prepare(sql, insert, error)) {
        return false;
    }
    insert.bind_text(1, workdir_id);
    insert.bind_text(2, env_version_id);
    bind_optional(insert, 3, head_sha);
    return conn.run(insert, error);
}

bool UpEnvironmentsCache::close_open_history(Connection &conn, const std::string &workdir_id, Error &error) {
    Statement close;
    std::string sql = std::string("UPDATE env_history SET used_until_date = ") + kNow +
                      " WHERE workdir_id = ?1 AND used_until_date IS NULL";
    if (!conn.prepare(sql, close, error)) {
        return false;
    }
    close.bind_text(1, workdir_id);
    return conn.run(close, error);
}

bool UpEnvironmentsCache::cleanup_with(Connection &conn, Error &error) {
    // One open entry per workdir: keep the most recent
    std::string close_duplicates = std::string("UPDATE env_history SET used_until_date = ") + kNow +
                                   " WHERE used_until_date IS NULL AND env_history_id NOT IN ("
                                   "SELECT MAX(env_history_id) FROM env_history WHERE used_until_date IS NULL "
                                   "GROUP BY workdir_id)";
    if (!conn.exec(close_duplicates, error)) {
        return false;
    }

    Statement retention;
    if (!conn.prepare("DELETE FROM env_history WHERE used_until_date IS NOT NULL "
                      "AND CAST(strftime('%s', 'now') AS INTEGER) > "
                      "(CAST(strftime('%s', used_until_date) AS INTEGER) + ?1)",
                      retention, error)) {
        return false;
    }
    retention.bind_int64(1, config_.retention);
    if (!conn.run(retention, error)) {
        return false;
    }

    // Open entries sort first, then most recently closed, then most recently opened
    const char *order = "ORDER BY used_until_date IS NOT NULL, used_until_date DESC, used_from_date DESC, "
                        "env_history_id DESC";

    if (config_.max_per_workdir) {
        Statement per_workdir;
        std::string sql = std::string("DELETE FROM env_history WHERE env_history_id IN ("
                                      "SELECT env_history_id FROM (SELECT env_history_id, used_until_date, "
                                      "ROW_NUMBER() OVER (PARTITION BY workdir_id ") +
                          order + ") AS rn FROM env_history) WHERE rn > ?1 AND used_until_date IS NOT NULL)";
        if (!conn.prepare(sql, per_workdir, error)) {
            return false;
        }
        per_workdir.bind_int64(1, *config_.max_per_workdir);
        if (!conn.run(per_workdir, error)) {
            return false;
        }
    }

    if (config_.max_total) {
        Statement total;
        std::string sql = std::string("DELETE FROM env_history WHERE env_history_id IN ("
                                      "SELECT env_history_id FROM (SELECT env_history_id, used_until_date, "
                                      "ROW_NUMBER() OVER (") +
                          order + ") AS rn FROM env_history) WHERE rn > ?1 AND used_until_date IS NOT NULL)";
        if (!conn.prepare(sql, total, error)) {
            return false;
        }
        total.bind_int64(1, *config_.max_total);
        if (!conn.run(total, error)) {
            return false;
        }
    }

    // Versions neither pointed at nor in the history; cascades to every required_by table
    return conn.exec("DELETE FROM env_versions WHERE env_version_id NOT IN (SELECT env_version_id FROM workdir_env) "
                     "AND env_version_id NOT IN (SELECT env_version_id FROM env_history)",
                     error);
}

std::optional<UpEnvironment> UpEnvironmentsCache::load_version(Connection &conn, const std::string &env_version_id) {
    Error error;
    Statement stmt;
    if (!conn.prepare("SELECT versions, paths, env_vars, config_modtimes, config_hash, last_assigned_at "
                      "FROM env_versions WHERE env_version_id = ?1",
                      stmt, error)) {
        LOG_WARN("[Environments] " << error.message);
        return std::nullopt;
    }
    stmt.bind_text(1, env_version_id);
    auto step = stmt.step();
    if (step != Statement::StepResult::ROW) {
        if (step == Statement::StepResult::ERROR) {
            LOG_WARN("[Environments] " << conn.error_message("env version read failed"));
        }
        return std::nullopt;
    }

    try {
        UpEnvironment env;
        env.versions = json::parse(stmt.column_text(0)).get<std::vector<UpVersion>>();
        env.paths = json::parse(stmt.column_text(1)).get<std::vector<std::string>>();
        env.env_vars = json::parse(stmt.column_text(2)).get<std::vector<UpEnvVar>>();
        env.config_modtimes = json::parse(stmt.column_text(3)).get<std::map<std::string, uint64_t>>();
        env.config_hash = stmt.column_text(4);
        env.last_assigned_at = stmt.column_text(5);
        return env;
    } catch (const json::exception &e) {
        LOG_WARN("[Environments] Malformed env version " << env_version_id << ": " << e.what());
        return std::nullopt;
    }
}

std::optional<UpEnvironment> UpEnvironmentsCache::get_env(const std::string &workdir_id) {
    auto version_id = get_env_version_id(workdir_id);
    if (!version_id) {
        return std::nullopt;
    }
    return get_env_version(*version_id);
}

std::optional<UpEnvironment> UpEnvironmentsCache::get_env_version(const std::string &env_version_id) {
    Error error;
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return std::nullopt;
    }
    return load_version(*conn, env_version_id);
}

std::optional<std::string> UpEnvironmentsCache::get_env_version_id(const std::string &workdir_id) {
    Error error;
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return std::nullopt;
    }

    Statement stmt;
    if (!conn->prepare("SELECT env_version_id FROM workdir_env WHERE workdir_id = ?1", stmt, error)) {
        LOG_WARN("[Environments] " << error.message);
        return std::nullopt;
    }
    stmt.bind_text(1, workdir_id);
    if (stmt.step() != Statement::StepResult::ROW) {
        return std::nullopt;
    }
    return stmt.column_text(0);
}

bool UpEnvironmentsCache::env_version_exists(const std::string &env_version_id, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }
    Statement stmt;
    if (!conn->prepare("SELECT 1 FROM env_versions WHERE env_version_id = ?1", stmt, error)) {
        return false;
    }
    stmt.bind_text(1, env_version_id);
    auto step = stmt.step();
    if (step == Statement::StepResult::ERROR) {
        common::fail(error, ErrorCode::SQL, conn->error_message("env version lookup failed"));
        return false;
    }
    return step == Statement::StepResult::ROW;
}

bool UpEnvironmentsCache::clear(const std::string &workdir_id, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            Statement stmt;
            if (!conn->prepare("DELETE FROM workdir_env WHERE workdir_id = ?1", stmt, err)) {
                return false;
            }
            stmt.bind_text(1, workdir_id);
            return conn->run(stmt, err) && close_open_history(*conn, workdir_id, err) && cleanup_with(*conn, err);
        },
        error);
}

bool UpEnvironmentsCache::close_history(const std::string &workdir_id, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }
    return with_transaction(
        *conn, [&](Error &err) { return close_open_history(*conn, workdir_id, err); }, error);
}

bool UpEnvironmentsCache::list_history(const std::string &workdir_id, std::vector<HistoryEntry> &entries,
                                       Error &error) {
    entries.clear();
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    Statement stmt;
    if (!conn->prepare("SELECT env_history_id, workdir_id, head_sha, env_version_id, used_from_date, "
                       "used_until_date FROM env_history WHERE (?1 = '' OR workdir_id = ?1) "
                       "ORDER BY used_until_date IS NOT NULL, used_until_date DESC, used_from_date DESC, "
                       "env_history_id DESC",
                       stmt, error)) {
        return false;
    }
    stmt.bind_text(1, workdir_id);

    while (true) {
        auto step = stmt.step();
        if (step == Statement::StepResult::DONE) {
            return true;
        }
        if (step == Statement::StepResult::ERROR) {
            return common::fail(error, ErrorCode::SQL, conn->error_message("history read failed"));
        }
        HistoryEntry entry;
        entry.id = stmt.column_int64(0);
        entry.workdir_id = stmt.column_text(1);
        if (!stmt.column_is_null(2)) {
            entry.head_sha = stmt.column_text(2);
        }
        entry.env_version_id = stmt.column_text(3);
        entry.used_from_date = stmt.column_text(4);
        if (!stmt.column_is_null(5)) {
            entry.used_until_date = stmt.column_text(5);
        }
        entries.push_back(entry);
    }
}

bool UpEnvironmentsCache::delete_env_version(const std::string &env_version_id, Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }

    return with_transaction(
        *conn,
        [&](Error &err) {
            for (const char *sql : {"DELETE FROM workdir_env WHERE env_version_id = ?1",
                                    "DELETE FROM env_history WHERE env_version_id = ?1",
                                    "DELETE FROM env_versions WHERE env_version_id = ?1"}) {
                Statement stmt;
                if (!conn->prepare(sql, stmt, err)) {
                    return false;
                }
                stmt.bind_text(1, env_version_id);
                if (!conn->run(stmt, err)) {
                    return false;
                }
            }
            return true;
        },
        error);
}

bool UpEnvironmentsCache::cleanup(Error &error) {
    PooledConnection conn = pool_.get_connection(error);
    if (!conn) {
        return false;
    }
    return with_transaction(
        *conn, [&](Error &err) { return cleanup_with(*conn, err); }, error);
}

}  // namespace cache
}  // namespace envkeeper
