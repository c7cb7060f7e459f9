#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cache/database.hpp"
#include "common/errors.hpp"

namespace envkeeper {
namespace cache {

class ConnectionPool;

// Connection borrowed from a pool; goes back to the pool when destroyed.
// The pool must outlive every handle it gave out.
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool *pool, std::unique_ptr<Connection> conn);
    ~PooledConnection();

    PooledConnection(const PooledConnection &) = delete;
    PooledConnection &operator=(const PooledConnection &) = delete;
    PooledConnection(PooledConnection &&other) noexcept;
    PooledConnection &operator=(PooledConnection &&other) noexcept;

    Connection *operator->() { return conn_.get(); }
    Connection &operator*() { return *conn_; }
    explicit operator bool() const { return conn_ != nullptr; }

private:
    void release();

    ConnectionPool *pool_ = nullptr;
    std::unique_ptr<Connection> conn_;
};

// Bounded pool of connections to one cache database.
//
// Connections are opened lazily up to max_size. get_connection() blocks while
// every connection is borrowed. The schema upgrade (including the one-time
// legacy JSON import) runs on the first connection when the pool opens; if it
// fails the pool is not created. A file-backed database is deleted only when
// creating the tables or importing into a new (version 0) database failed, so
// the next run starts over. Newer, locked or partially upgraded files are kept.
class ConnectionPool {
public:
    static constexpr size_t kDefaultSize = 10;
    static constexpr size_t kTestSize = 3;

    // <cache_dir>/cache.db, creating cache_dir if needed. Legacy JSON files are
    // read from cache_dir.
    static std::unique_ptr<ConnectionPool> open_file(const std::string &cache_dir, size_t max_size,
                                                     int busy_timeout_ms, common::Error &error);

    // Private in-memory database named after test_id. legacy_dir may be empty.
    static std::unique_ptr<ConnectionPool> open_memory(const std::string &test_id, size_t max_size,
                                                       const std::string &legacy_dir, common::Error &error);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    // Blocks until a connection is available. Returns an empty handle (and sets
    // error) only when opening a new connection fails.
    PooledConnection get_connection(common::Error &error);

    size_t max_size() const { return max_size_; }
    size_t open_count() const;
    size_t idle_count() const;

    // Database location: file path, or the memory URI
    const std::string &location() const { return location_; }

private:
    ConnectionPool(const std::string &location, size_t max_size, int busy_timeout_ms);

    friend class PooledConnection;
    void give_back(std::unique_ptr<Connection> conn);

    bool initialize(const std::string &legacy_dir, bool remove_on_failure, common::Error &error);

    std::string location_;
    size_t max_size_;
    int busy_timeout_ms_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Connection>> idle_;
    size_t open_count_ = 0;
};

}  // namespace cache
}  // namespace envkeeper
