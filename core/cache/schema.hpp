#pragma once

#include <string>

#include "cache/database.hpp"
#include "common/errors.hpp"

namespace envkeeper {
namespace cache {

// Version stored in PRAGMA user_version once every upgrade step has run
constexpr int kSchemaVersion = 2;

// Creates every table and index (idempotent) and sets user_version to 1
bool create_tables(Connection &conn, common::Error &error);

// Stage of upgrade_database that failed
enum class UpgradeFailure {
    NONE,
    INITIAL_MIGRATION,  // Table creation or legacy import on a version 0 database
    OTHER               // Lock/busy errors, newer schema, step upgrades, legacy normalization
};

// Brings the database to kSchemaVersion.
//
// A database at version 0 is new: the legacy JSON tree in legacy_dir (if any)
// is normalized, the tables are created and the JSON is imported, all before
// any other connection can see the schema. Later versions only run the
// remaining step upgrades. Returns false on any failure; callers treat that
// as fatal. Only an INITIAL_MIGRATION failure leaves a file that holds no
// cached data and may be discarded.
bool upgrade_database(Connection &conn, const std::string &legacy_dir, UpgradeFailure &failure,
                      common::Error &error);

bool upgrade_database(Connection &conn, const std::string &legacy_dir, common::Error &error);

}  // namespace cache
}  // namespace envkeeper
