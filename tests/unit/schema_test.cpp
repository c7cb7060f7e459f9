#include "cache/schema.hpp"

#include <gtest/gtest.h>

#include "cache/backend.hpp"
#include "test_context.hpp"

using namespace envkeeper;
using namespace envkeeper::cache;

class SchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Error error;
        uri_ = "file:envkeeper-" + tests::unique_test_id() + "?mode=memory&cache=shared";
        ASSERT_TRUE(conn_.open(uri_, 1000, error)) << error.message;
    }

    int count(const std::string &table) {
        common::Error error;
        Statement stmt;
        if (!conn_.prepare("SELECT COUNT(*) FROM " + table, stmt, error) ||
            stmt.step() != Statement::StepResult::ROW) {
            return -1;
        }
        return static_cast<int>(stmt.column_int64(0));
    }

    std::string uri_;
    Connection conn_;
};

TEST_F(SchemaTest, CreatesEveryBackendTable) {
    common::Error error;
    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;

    for (Backend backend : all_backends()) {
        const BackendTables &tables = backend_tables(backend);
        EXPECT_EQ(count(tables.installed), 0) << tables.installed;
        EXPECT_EQ(count(tables.required_by), 0) << tables.required_by;
        EXPECT_EQ(count(tables.versions), 0) << tables.versions;
    }

    int version = 0;
    ASSERT_TRUE(conn_.user_version(version, error));
    EXPECT_EQ(version, kSchemaVersion);
}

TEST_F(SchemaTest, UpgradeIsIdempotent) {
    common::Error error;
    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;
    ASSERT_TRUE(conn_.exec("INSERT INTO mise_versions (name, versions, fetched_at) "
                           "VALUES ('node', '[\"20.0.0\"]', '2024-01-01T00:00:00Z')",
                           error))
        << error.message;

    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;
    EXPECT_EQ(count("mise_versions"), 1);
}

TEST_F(SchemaTest, VersionOneUpgradeClearsGithubReleases) {
    common::Error error;
    ASSERT_TRUE(create_tables(conn_, error)) << error.message;
    ASSERT_TRUE(conn_.exec("INSERT INTO github_releases (name, versions, fetched_at) "
                           "VALUES ('cli/cli', '[]', '2024-01-01T00:00:00Z');"
                           "INSERT INTO cargo_versions (name, versions, fetched_at) "
                           "VALUES ('ripgrep', '[]', '2024-01-01T00:00:00Z');",
                           error))
        << error.message;

    int version = 0;
    ASSERT_TRUE(conn_.user_version(version, error));
    ASSERT_EQ(version, 1);

    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;
    ASSERT_TRUE(conn_.user_version(version, error));
    EXPECT_EQ(version, 2);
    EXPECT_EQ(count("github_releases"), 0);
    EXPECT_EQ(count("cargo_versions"), 1);
}

TEST_F(SchemaTest, RequiredByCascadesFromEnvVersions) {
    common::Error error;
    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;
    ASSERT_TRUE(conn_.exec("INSERT INTO env_versions (env_version_id, versions, paths, env_vars, config_modtimes, "
                           "config_hash) VALUES ('wd%1', '[]', '[]', '[]', '{}', '');"
                           "INSERT INTO go_installed (name, version) VALUES ('gopls', '0.14.0');"
                           "INSERT INTO go_install_required_by (name, version, env_version_id) "
                           "VALUES ('gopls', '0.14.0', 'wd%1');",
                           error))
        << error.message;
    EXPECT_EQ(count("go_install_required_by"), 1);

    ASSERT_TRUE(conn_.exec("DELETE FROM env_versions WHERE env_version_id = 'wd%1'", error)) << error.message;
    EXPECT_EQ(count("go_install_required_by"), 0);
    EXPECT_EQ(count("go_installed"), 1);
}

TEST_F(SchemaTest, RequiredByRejectsUnknownArtifact) {
    common::Error error;
    ASSERT_TRUE(upgrade_database(conn_, "", error)) << error.message;
    ASSERT_TRUE(conn_.exec("INSERT INTO env_versions (env_version_id, versions, paths, env_vars, config_modtimes, "
                           "config_hash) VALUES ('wd%1', '[]', '[]', '[]', '{}', '')",
                           error));

    EXPECT_FALSE(conn_.exec("INSERT INTO mise_required_by (name, version, env_version_id) "
                            "VALUES ('python', '3.12', 'wd%1')",
                            error));
    EXPECT_EQ(error.code, common::ErrorCode::SQL);
    EXPECT_EQ(conn_.last_error_code() & 0xff, SQLITE_CONSTRAINT);
}

TEST_F(SchemaTest, NewerSchemaFailsWithoutMigrationStage) {
    common::Error error;
    ASSERT_TRUE(create_tables(conn_, error)) << error.message;
    ASSERT_TRUE(conn_.set_user_version(kSchemaVersion + 1, error)) << error.message;

    UpgradeFailure failure = UpgradeFailure::NONE;
    EXPECT_FALSE(upgrade_database(conn_, "", failure, error));
    EXPECT_EQ(failure, UpgradeFailure::OTHER);
    EXPECT_NE(error.message.find("newer than supported"), std::string::npos);
}

TEST_F(SchemaTest, FailedStepUpgradeIsNotInitialMigration) {
    common::Error error;
    ASSERT_TRUE(create_tables(conn_, error)) << error.message;
    ASSERT_TRUE(conn_.exec("DROP TABLE github_releases;", error)) << error.message;

    UpgradeFailure failure = UpgradeFailure::NONE;
    EXPECT_FALSE(upgrade_database(conn_, "", failure, error));
    EXPECT_EQ(failure, UpgradeFailure::OTHER);

    int version = 0;
    ASSERT_TRUE(conn_.user_version(version, error));
    EXPECT_EQ(version, 1);
}

TEST_F(SchemaTest, FailedTableCreationIsInitialMigration) {
    common::Error error;
    // Occupies the name of one of the schema's indexes
    ASSERT_TRUE(conn_.exec("CREATE TABLE idx_env_history_workdir (x TEXT);", error)) << error.message;

    UpgradeFailure failure = UpgradeFailure::NONE;
    EXPECT_FALSE(upgrade_database(conn_, "", failure, error));
    EXPECT_EQ(failure, UpgradeFailure::INITIAL_MIGRATION);
    EXPECT_EQ(error.code, common::ErrorCode::SQL);

    // Rolled back: still a version 0 database
    int version = -1;
    ASSERT_TRUE(conn_.user_version(version, error));
    EXPECT_EQ(version, 0);
}

TEST_F(SchemaTest, SuccessfulUpgradeReportsNoFailure) {
    common::Error error;
    UpgradeFailure failure = UpgradeFailure::OTHER;
    ASSERT_TRUE(upgrade_database(conn_, "", failure, error)) << error.message;
    EXPECT_EQ(failure, UpgradeFailure::NONE);
}
