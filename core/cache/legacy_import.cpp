#include "legacy_import.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/backend.hpp"
#include "cache/file_lock.hpp"
#include "cache/up_environments.hpp"
#include "common/timestamp.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

using common::Error;
using common::ErrorCode;
using nlohmann::json;

namespace {

using Value = std::optional<std::string>;

bool legacy_file_present(const std::string &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    auto size = std::filesystem::file_size(path, ec);
    return !ec && size > 0;
}

bool parse_json(const std::string &path, const std::string &contents, json &out, Error &error) {
    try {
        out = json::parse(contents);
    } catch (const json::exception &e) {
        return common::fail(error, ErrorCode::SERIALIZATION, path + ": " + e.what());
    }
    if (!out.is_object()) {
        return common::fail(error, ErrorCode::SERIALIZATION, path + ": expected a JSON object");
    }
    return true;
}

// Reads a legacy file under a shared lock. present is false for a missing or empty file.
bool read_legacy_json(const std::string &path, json &out, bool &present, Error &error) {
    present = legacy_file_present(path);
    if (!present) {
        return true;
    }
    auto lock = FileLock::acquire(path, FileLock::Mode::SHARED, error);
    if (!lock) {
        return false;
    }
    std::string contents;
    if (!lock->read_all(contents, error)) {
        return false;
    }
    return parse_json(path, contents, out, error);
}

std::string string_field(const json &object, const char *key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

Value optional_string_field(const json &object, const char *key) {
    std::string value = string_field(object, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> string_list_field(const json &object, const char *key) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) {
        return values;
    }
    for (const auto &item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

const json &object_field(const json &object, const char *key) {
    static const json empty = json::object();
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

const json &array_field(const json &object, const char *key) {
    static const json empty = json::array();
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) {
        return empty;
    }
    return *it;
}

bool is_constraint_violation(const Connection &conn) { return (conn.last_error_code() & 0xff) == SQLITE_CONSTRAINT; }

// Prepares, binds and runs sql. With ignore_constraint, a constraint
// violation (stale reference in the legacy data) is skipped.
bool insert_row(Connection &conn, const std::string &sql, const std::vector<Value> &values, bool ignore_constraint,
                Error &error) {
    Statement stmt;
    if (!conn.prepare(sql, stmt, error)) {
        return false;
    }
    int index = 1;
    for (const auto &value : values) {
        if (value) {
            stmt.bind_text(index, *value);
        } else {
            stmt.bind_null(index);
        }
        ++index;
    }

    Error run_error;
    if (conn.run(stmt, run_error)) {
        return true;
    }
    if (ignore_constraint && is_constraint_violation(conn)) {
        LOG_DEBUG("[Legacy] Skipping stale row: " << run_error.message);
        return true;
    }
    error = run_error;
    return false;
}

bool insert_required_by(Connection &conn, const BackendTables &tables, const std::string &name,
                        const std::string &version, const std::string &variant, const json &item, Error &error) {
    std::string sql = std::string("INSERT INTO ") + tables.required_by +
                      " (name, version, variant, env_version_id) VALUES (?1, ?2, ?3, ?4) ON CONFLICT DO NOTHING";
    for (const auto &env_version_id : string_list_field(item, "required_by")) {
        if (!insert_row(conn, sql, {name, version, variant, env_version_id}, true, error)) {
            return false;
        }
    }
    return true;
}

bool insert_installed(Connection &conn, const BackendTables &tables, const std::string &name,
                      const std::string &version, const std::string &variant, const std::string &last_required_at,
                      Error &error) {
    std::string sql = std::string("INSERT INTO ") + tables.installed +
                      " (name, version, variant, last_required_at) VALUES (?1, ?2, ?3, ?4) ON CONFLICT DO NOTHING";
    return insert_row(conn, sql, {name, version, variant, common::date_or_epoch(last_required_at)}, false, error);
}

bool insert_versions(Connection &conn, const BackendTables &tables, const std::string &name, const json &versions,
                     const std::string &fetched_at, Error &error) {
    std::string sql = std::string("INSERT INTO ") + tables.versions +
                      " (name, versions, fetched_at) VALUES (?1, ?2, ?3) "
                      "ON CONFLICT (name) DO UPDATE SET versions = excluded.versions, fetched_at = excluded.fetched_at";
    return insert_row(conn, sql, {name, versions.dump(), common::date_or_epoch(fetched_at)}, false, error);
}

bool set_metadata(Connection &conn, const std::string &key, const std::string &value, Error &error) {
    return insert_row(conn, "INSERT OR REPLACE INTO metadata (key, value) VALUES (?1, ?2)", {key, value}, false,
                      error);
}

// Version ids created for pre-versioning environments use the same content
// hash as environments assigned later on
std::string legacy_env_version_id(const std::string &workdir_id, const json &env) {
    UpEnvironment parsed;
    parsed.versions = array_field(env, "versions").get<std::vector<UpVersion>>();
    parsed.paths = string_list_field(env, "paths");
    parsed.env_vars = array_field(env, "env_vars").get<std::vector<UpEnvVar>>();
    parsed.config_modtimes = object_field(env, "config_modtimes").get<std::map<std::string, uint64_t>>();
    parsed.config_hash = string_field(env, "config_hash");
    return workdir_id + "%" + parsed.hash_string();
}

bool rewrite_required_by(const std::string &path, const std::map<std::string, std::string> &workdir_versions,
                         Error &error) {
    if (!legacy_file_present(path)) {
        return true;
    }
    auto lock = FileLock::acquire(path, FileLock::Mode::EXCLUSIVE, error);
    if (!lock) {
        return false;
    }
    std::string contents;
    if (!lock->read_all(contents, error)) {
        return false;
    }

    json cache;
    Error parse_error;
    if (!parse_json(path, contents, cache, parse_error)) {
        LOG_WARN("[Legacy] Not rewriting references in " << path << ": " << parse_error.message);
        return true;
    }

    bool updated = false;
    for (const char *section : {"installed", "tapped"}) {
        auto it = cache.find(section);
        if (it == cache.end() || !it->is_array()) {
            continue;
        }
        for (auto &item : *it) {
            if (!item.is_object()) {
                continue;
            }
            auto required = string_list_field(item, "required_by");
            std::set<std::string> rewritten;
            bool changed = false;
            for (const auto &id : required) {
                auto found = workdir_versions.find(id);
                if (found != workdir_versions.end()) {
                    rewritten.insert(found->second);
                    changed = true;
                } else {
                    rewritten.insert(id);
                }
            }
            if (changed) {
                item["required_by"] = rewritten;
                updated = true;
            }
        }
    }

    if (!updated) {
        return true;
    }
    LOG_INFO("[Legacy] Rewrote environment references in " << path);
    return lock->write_all(cache.dump(), error);
}

bool import_environments(Connection &conn, const json &cache, Error &error) {
    for (const auto &entry : object_field(cache, "versioned_env").items()) {
        const json &env = entry.value();
        if (!insert_row(conn,
                        "INSERT INTO env_versions (env_version_id, versions, paths, env_vars, config_modtimes, "
                        "config_hash, last_assigned_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) ON CONFLICT DO NOTHING",
                        {entry.key(), array_field(env, "versions").dump(), array_field(env, "paths").dump(),
                         array_field(env, "env_vars").dump(), object_field(env, "config_modtimes").dump(),
                         string_field(env, "config_hash"),
                         common::date_or_epoch(string_field(env, "last_assigned_at"))},
                        false, error)) {
            return false;
        }
    }

    for (const auto &entry : object_field(cache, "workdir_env").items()) {
        if (!entry.value().is_string()) {
            continue;
        }
        if (!insert_row(conn, "INSERT INTO workdir_env (workdir_id, env_version_id) VALUES (?1, ?2)",
                        {entry.key(), entry.value().get<std::string>()}, true, error)) {
            return false;
        }
    }

    for (const auto &item : array_field(cache, "history")) {
        if (!item.is_object()) {
            continue;
        }
        if (!insert_row(conn,
                        "INSERT INTO env_history (workdir_id, head_sha, env_version_id, used_from_date, "
                        "used_until_date) VALUES (?1, ?2, ?3, ?4, ?5)",
                        {string_field(item, "wd"), optional_string_field(item, "sha"), string_field(item, "env"),
                         common::date_or_epoch(string_field(item, "from")), optional_string_field(item, "until")},
                        true, error)) {
            return false;
        }
    }
    return true;
}

// asdf plugin names that mise knows under another name
std::string mise_tool_name(const std::string &legacy) {
    if (legacy == "golang") {
        return "go";
    }
    if (legacy == "nodejs") {
        return "node";
    }
    return legacy;
}

bool import_mise(Connection &conn, const json &cache, Error &error) {
    const BackendTables &tables = backend_tables(Backend::MISE);

    for (const auto &item : array_field(cache, "installed")) {
        std::string name = mise_tool_name(string_field(item, "tool"));
        std::string version = string_field(item, "version");
        if (name.empty() || version.empty()) {
            continue;
        }
        if (!insert_installed(conn, tables, name, version, "", string_field(item, "last_required_at"), error) ||
            !insert_required_by(conn, tables, name, version, "", item, error)) {
            return false;
        }
    }

    const json &update_cache = object_field(cache, "update_cache");
    std::string updated_at = string_field(update_cache, "asdf_updated_at");
    if (!updated_at.empty() &&
        !set_metadata(conn, std::string(tables.metadata_prefix) + ".updated_at", updated_at, error)) {
        return false;
    }

    for (const auto &entry : object_field(update_cache, "plugins_versions").items()) {
        if (!insert_versions(conn, tables, mise_tool_name(entry.key()), array_field(entry.value(), "versions"),
                             string_field(entry.value(), "updated_at"), error)) {
            return false;
        }
    }
    return true;
}

bool import_homebrew(Connection &conn, const json &cache, Error &error) {
    const BackendTables &install = backend_tables(Backend::HOMEBREW_INSTALL);
    const BackendTables &tap = backend_tables(Backend::HOMEBREW_TAP);
    const std::string null_version = "__NULL__";

    for (const auto &item : array_field(cache, "installed")) {
        std::string name = string_field(item, "name");
        if (name.empty()) {
            continue;
        }
        std::string version = optional_string_field(item, "version").value_or(null_version);
        std::string variant = item.value("cask", false) ? "cask" : "";
        if (!insert_installed(conn, install, name, version, variant, string_field(item, "last_required_at"),
                              error) ||
            !insert_required_by(conn, install, name, version, variant, item, error)) {
            return false;
        }
    }

    for (const auto &item : array_field(cache, "tapped")) {
        std::string name = string_field(item, "name");
        if (name.empty()) {
            continue;
        }
        if (!insert_installed(conn, tap, name, null_version, "", string_field(item, "last_required_at"), error) ||
            !insert_required_by(conn, tap, name, null_version, "", item, error)) {
            return false;
        }
    }

    const json &update_cache = object_field(cache, "update_cache");
    const json &homebrew = object_field(update_cache, "homebrew");
    std::string updated_at = string_field(homebrew, "updated_at");
    if (!updated_at.empty() &&
        !set_metadata(conn, std::string(install.metadata_prefix) + ".updated_at", updated_at, error)) {
        return false;
    }
    std::string bin_path = string_field(homebrew, "bin_path");
    if (!bin_path.empty() &&
        !set_metadata(conn, std::string(install.metadata_prefix) + ".bin_path", bin_path, error)) {
        return false;
    }

    // Keys look like "formula:name@version" or "cask:name"
    std::string update_bin_paths = std::string("UPDATE ") + install.installed +
                                   " SET bin_paths = ?1 WHERE name = ?2 AND version = ?3 AND variant = ?4";
    for (const auto &entry : object_field(update_cache, "install").items()) {
        const std::string &key = entry.key();
        auto colon = key.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string variant = key.substr(0, colon) == "cask" ? "cask" : "";
        std::string name = key.substr(colon + 1);
        std::string version = null_version;
        auto at = name.find('@');
        if (at != std::string::npos) {
            version = name.substr(at + 1);
            name = name.substr(0, at);
        }

        auto bin_paths = entry.value().find("bin_paths");
        if (bin_paths == entry.value().end() || !bin_paths->is_array()) {
            continue;
        }
        if (!insert_row(conn, update_bin_paths, {bin_paths->dump(), name, version, variant}, false, error)) {
            return false;
        }
    }
    return true;
}

bool import_github_releases(Connection &conn, const json &cache, Error &error) {
    const BackendTables &tables = backend_tables(Backend::GITHUB_RELEASE);

    for (const auto &item : array_field(cache, "installed")) {
        std::string repository = string_field(item, "repository");
        std::string version = string_field(item, "version");
        if (repository.empty() || version.empty()) {
            continue;
        }
        if (!insert_installed(conn, tables, repository, version, "", string_field(item, "last_required_at"),
                              error) ||
            !insert_required_by(conn, tables, repository, version, "", item, error)) {
            return false;
        }
    }

    for (const auto &entry : object_field(cache, "releases").items()) {
        if (!insert_versions(conn, tables, entry.key(), array_field(entry.value(), "releases"),
                             string_field(entry.value(), "fetched_at"), error)) {
            return false;
        }
    }
    return true;
}

using Importer = bool (*)(Connection &, const json &, Error &);

}  // namespace

bool normalize_legacy_cache(const std::string &dir, Error &error) {
    std::string path = dir + "/" + kLegacyEnvironmentsFile;
    if (!legacy_file_present(path)) {
        return true;
    }

    auto lock = FileLock::acquire(path, FileLock::Mode::EXCLUSIVE, error);
    if (!lock) {
        return false;
    }
    std::string contents;
    if (!lock->read_all(contents, error)) {
        return false;
    }
    json cache;
    if (!parse_json(path, contents, cache, error)) {
        return false;
    }

    auto env = cache.find("env");
    if (env == cache.end() || !env->is_object() || cache.contains("workdir_env")) {
        return true;
    }

    LOG_INFO("[Legacy] Converting " << path << " to versioned environments");

    std::string used_from = common::date_or_epoch(string_field(cache, "updated_at"));
    json converted = {{"workdir_env", json::object()}, {"versioned_env", json::object()}, {"history", json::array()}};
    std::map<std::string, std::string> workdir_versions;

    try {
        for (const auto &entry : env->items()) {
            std::string version_id = legacy_env_version_id(entry.key(), entry.value());
            workdir_versions[entry.key()] = version_id;
            converted["workdir_env"][entry.key()] = version_id;
            converted["versioned_env"][version_id] = entry.value();
            converted["history"].push_back({{"wd", entry.key()}, {"env", version_id}, {"from", used_from}});
        }
    } catch (const json::exception &e) {
        return common::fail(error, ErrorCode::SERIALIZATION, path + ": " + e.what());
    }

    if (!lock->write_all(converted.dump(), error)) {
        return false;
    }
    lock.reset();

    for (const char *file : {kLegacyMiseFile, kLegacyHomebrewFile, kLegacyGithubReleaseFile}) {
        if (!rewrite_required_by(dir + "/" + file, workdir_versions, error)) {
            return false;
        }
    }
    return true;
}

bool import_legacy_cache(Connection &conn, const std::string &dir, Error &error) {
    const std::vector<std::pair<const char *, Importer>> importers = {
        {kLegacyEnvironmentsFile, import_environments},
        {kLegacyMiseFile, import_mise},
        {kLegacyHomebrewFile, import_homebrew},
        {kLegacyGithubReleaseFile, import_github_releases},
    };

    for (const auto &importer : importers) {
        std::string path = dir + "/" + importer.first;
        json cache;
        bool present = false;
        if (!read_legacy_json(path, cache, present, error)) {
            return false;
        }
        if (!present) {
            continue;
        }

        LOG_INFO("[Legacy] Importing " << path);
        try {
            if (!importer.second(conn, cache, error)) {
                error.message = path + ": " + error.message;
                return false;
            }
        } catch (const json::exception &e) {
            return common::fail(error, ErrorCode::SERIALIZATION, path + ": " + e.what());
        }
    }
    return true;
}

}  // namespace cache
}  // namespace envkeeper
