/**
 * connection_pool_test.cpp - ConnectionPool unit tests
 *
 * Tests:
 * - In-memory pools are isolated per test id
 * - Connections are reused and bounded by max_size
 * - A borrower blocks until a connection is returned
 * - File-backed pools create the cache directory and the schema
 */

#include "cache/connection_pool.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

#include "cache/schema.hpp"
#include "test_context.hpp"

using namespace envkeeper;
using namespace envkeeper::cache;

namespace {

int count_rows(Connection &conn, const std::string &table) {
    common::Error error;
    Statement stmt;
    if (!conn.prepare("SELECT COUNT(*) FROM " + table, stmt, error)) {
        return -1;
    }
    if (stmt.step() != Statement::StepResult::ROW) {
        return -1;
    }
    return static_cast<int>(stmt.column_int64(0));
}

}  // namespace

TEST(ConnectionPoolTest, MemoryPoolHasCurrentSchema) {
    common::Error error;
    auto pool = ConnectionPool::open_memory(tests::unique_test_id(), ConnectionPool::kTestSize, "", error);
    ASSERT_NE(pool, nullptr) << error.message;

    PooledConnection conn = pool->get_connection(error);
    ASSERT_TRUE(conn);
    int version = 0;
    ASSERT_TRUE(conn->user_version(version, error));
    EXPECT_EQ(version, kSchemaVersion);
    EXPECT_EQ(count_rows(*conn, "mise_installed"), 0);
    EXPECT_EQ(count_rows(*conn, "env_history"), 0);
}

TEST(ConnectionPoolTest, MemoryPoolsAreIsolated) {
    common::Error error;
    auto first = ConnectionPool::open_memory(tests::unique_test_id(), 2, "", error);
    auto second = ConnectionPool::open_memory(tests::unique_test_id(), 2, "", error);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    {
        PooledConnection conn = first->get_connection(error);
        ASSERT_TRUE(conn);
        ASSERT_TRUE(conn->exec("INSERT INTO metadata (key, value) VALUES ('marker', 'x')", error)) << error.message;
    }

    PooledConnection a = first->get_connection(error);
    PooledConnection b = second->get_connection(error);
    EXPECT_EQ(count_rows(*a, "metadata"), 1);
    EXPECT_EQ(count_rows(*b, "metadata"), 0);
}

TEST(ConnectionPoolTest, ConnectionsAreReused) {
    common::Error error;
    auto pool = ConnectionPool::open_memory(tests::unique_test_id(), 3, "", error);
    ASSERT_NE(pool, nullptr);

    for (int i = 0; i < 5; ++i) {
        PooledConnection conn = pool->get_connection(error);
        ASSERT_TRUE(conn);
    }
    EXPECT_EQ(pool->open_count(), 1u);
    EXPECT_EQ(pool->idle_count(), 1u);

    {
        PooledConnection a = pool->get_connection(error);
        PooledConnection b = pool->get_connection(error);
        EXPECT_EQ(pool->open_count(), 2u);
        EXPECT_EQ(pool->idle_count(), 0u);
    }
    EXPECT_EQ(pool->idle_count(), 2u);
}

TEST(ConnectionPoolTest, BorrowerWaitsForReturnedConnection) {
    common::Error error;
    auto pool = ConnectionPool::open_memory(tests::unique_test_id(), 1, "", error);
    ASSERT_NE(pool, nullptr);

    PooledConnection held = pool->get_connection(error);
    ASSERT_TRUE(held);

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        common::Error thread_error;
        PooledConnection conn = pool->get_connection(thread_error);
        acquired = static_cast<bool>(conn);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());

    held = PooledConnection();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(pool->open_count(), 1u);
}

TEST(ConnectionPoolTest, FilePoolCreatesDirectoryAndDatabase) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("envkeeper_pool_test_" + std::to_string(::getpid())) / "nested";
    fs::remove_all(dir.parent_path());

    common::Error error;
    {
        auto pool = ConnectionPool::open_file(dir.string(), ConnectionPool::kDefaultSize, 1000, error);
        ASSERT_NE(pool, nullptr) << error.message;
        EXPECT_EQ(pool->location(), (dir / "cache.db").string());
    }
    EXPECT_TRUE(fs::exists(dir / "cache.db"));

    // Reopening an up-to-date database is a no-op upgrade
    {
        auto pool = ConnectionPool::open_file(dir.string(), 2, 1000, error);
        ASSERT_NE(pool, nullptr) << error.message;
        PooledConnection conn = pool->get_connection(error);
        int version = 0;
        ASSERT_TRUE(conn->user_version(version, error));
        EXPECT_EQ(version, kSchemaVersion);
    }

    fs::remove_all(dir.parent_path());
}

TEST(ConnectionPoolTest, NewerSchemaIsRejected) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("envkeeper_pool_newer_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    common::Error error;
    {
        Connection conn;
        ASSERT_TRUE(conn.open((dir / "cache.db").string(), 1000, error)) << error.message;
        ASSERT_TRUE(create_tables(conn, error)) << error.message;
        ASSERT_TRUE(conn.exec("CREATE TABLE precious (v TEXT); INSERT INTO precious VALUES ('keep');", error))
            << error.message;
        ASSERT_TRUE(conn.set_user_version(kSchemaVersion + 1, error));
    }

    auto pool = ConnectionPool::open_file(dir.string(), 2, 1000, error);
    EXPECT_EQ(pool, nullptr);
    EXPECT_EQ(error.code, common::ErrorCode::SQL);
    EXPECT_NE(error.message.find("newer"), std::string::npos);

    // The newer build's data is left alone
    ASSERT_TRUE(fs::exists(dir / "cache.db"));
    {
        Connection conn;
        common::Error check_error;
        ASSERT_TRUE(conn.open((dir / "cache.db").string(), 1000, check_error)) << check_error.message;
        EXPECT_EQ(count_rows(conn, "precious"), 1);
        int version = 0;
        ASSERT_TRUE(conn.user_version(version, check_error));
        EXPECT_EQ(version, kSchemaVersion + 1);
    }

    fs::remove_all(dir);
}

TEST(ConnectionPoolTest, FailedStepUpgradeKeepsDatabase) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("envkeeper_pool_step_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    common::Error error;
    {
        Connection conn;
        ASSERT_TRUE(conn.open((dir / "cache.db").string(), 1000, error)) << error.message;
        ASSERT_TRUE(create_tables(conn, error)) << error.message;
        ASSERT_TRUE(conn.exec("INSERT INTO mise_installed (name, version) VALUES ('node', '20.0.0');"
                              "DROP TABLE github_releases;",
                              error))
            << error.message;
    }

    auto pool = ConnectionPool::open_file(dir.string(), 2, 1000, error);
    EXPECT_EQ(pool, nullptr);
    EXPECT_FALSE(error.ok());

    ASSERT_TRUE(fs::exists(dir / "cache.db"));
    {
        Connection conn;
        common::Error check_error;
        ASSERT_TRUE(conn.open((dir / "cache.db").string(), 1000, check_error)) << check_error.message;
        EXPECT_EQ(count_rows(conn, "mise_installed"), 1);
    }

    fs::remove_all(dir);
}

TEST(ConnectionPoolTest, FailedInitialMigrationRemovesDatabase) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("envkeeper_pool_initial_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);

    common::Error error;
    {
        Connection conn;
        ASSERT_TRUE(conn.open((dir / "cache.db").string(), 1000, error)) << error.message;
        ASSERT_TRUE(conn.exec("CREATE TABLE idx_env_history_workdir (x TEXT);", error)) << error.message;
    }

    auto pool = ConnectionPool::open_file(dir.string(), 2, 1000, error);
    EXPECT_EQ(pool, nullptr);
    EXPECT_EQ(error.code, common::ErrorCode::SQL);

    // Nothing was cached yet; the next run starts from scratch
    EXPECT_FALSE(fs::exists(dir / "cache.db"));

    fs::remove_all(dir);
}
