#include "connection_pool.hpp"

#include <filesystem>
#include <system_error>

#include "cache/schema.hpp"
#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

namespace fs = std::filesystem;

PooledConnection::PooledConnection(ConnectionPool *pool, std::unique_ptr<Connection> conn)
    : pool_(pool), conn_(std::move(conn)) {}

PooledConnection::~PooledConnection() { release(); }

PooledConnection::PooledConnection(PooledConnection &&other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

PooledConnection &PooledConnection::operator=(PooledConnection &&other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ != nullptr && conn_ != nullptr) {
        pool_->give_back(std::move(conn_));
    }
    pool_ = nullptr;
}

ConnectionPool::ConnectionPool(const std::string &location, size_t max_size, int busy_timeout_ms)
    : location_(location), max_size_(max_size == 0 ? 1 : max_size), busy_timeout_ms_(busy_timeout_ms) {}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() != open_count_) {
        LOG_WARN("[Pool] Destroyed with " << (open_count_ - idle_.size()) << " connection(s) still borrowed");
    }
    idle_.clear();
}

std::unique_ptr<ConnectionPool> ConnectionPool::open_file(const std::string &cache_dir, size_t max_size,
                                                          int busy_timeout_ms, common::Error &error) {
    std::error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        common::fail(error, common::ErrorCode::IO,
                     "failed to create cache directory " + cache_dir + ": " + ec.message());
        return nullptr;
    }

    std::string db_path = (fs::path(cache_dir) / "cache.db").string();
    std::unique_ptr<ConnectionPool> pool(new ConnectionPool(db_path, max_size, busy_timeout_ms));
    if (!pool->initialize(cache_dir, true, error)) {
        return nullptr;
    }

    LOG_DEBUG("[Pool] Opened " << db_path << " (max " << pool->max_size() << " connections)");
    return pool;
}

std::unique_ptr<ConnectionPool> ConnectionPool::open_memory(const std::string &test_id, size_t max_size,
                                                            const std::string &legacy_dir, common::Error &error) {
    std::string uri = "file:envkeeper-" + test_id + "?mode=memory&cache=shared";
    std::unique_ptr<ConnectionPool> pool(new ConnectionPool(uri, max_size, 5000));
    if (!pool->initialize(legacy_dir, false, error)) {
        return nullptr;
    }
    return pool;
}

bool ConnectionPool::initialize(const std::string &legacy_dir, bool remove_on_failure, common::Error &error) {
    bool upgraded = false;
    UpgradeFailure failure = UpgradeFailure::NONE;
    {
        PooledConnection conn = get_connection(error);
        if (!conn) {
            return false;
        }
        upgraded = upgrade_database(*conn, legacy_dir, failure, error);
    }

    if (upgraded) {
        return true;
    }

    LOG_ERROR("[Pool] Schema upgrade failed for " << location_ << ": " << error.message);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.clear();
        open_count_ = 0;
    }

    // A newer, locked or partially upgraded database still holds the user's cache
    if (remove_on_failure && failure == UpgradeFailure::INITIAL_MIGRATION) {
        LOG_WARN("[Pool] Removing " << location_ << " so the next run retries the migration");
        std::error_code ec;
        for (const char *suffix : {"", "-journal", "-wal", "-shm"}) {
            fs::remove(location_ + suffix, ec);
            if (ec) {
                LOG_WARN("[Pool] Failed to remove " << location_ << suffix << ": " << ec.message());
            }
        }
    }
    return false;
}

PooledConnection ConnectionPool::get_connection(common::Error &error) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return !idle_.empty() || open_count_ < max_size_; });

    if (!idle_.empty()) {
        std::unique_ptr<Connection> conn = std::move(idle_.back());
        idle_.pop_back();
        return PooledConnection(this, std::move(conn));
    }

    // Reserve the slot, then open outside the lock
    ++open_count_;
    lock.unlock();

    auto conn = std::make_unique<Connection>();
    if (!conn->open(location_, busy_timeout_ms_, error)) {
        lock.lock();
        --open_count_;
        lock.unlock();
        available_.notify_one();
        LOG_ERROR("[Pool] " << error.message);
        return PooledConnection();
    }

    return PooledConnection(this, std::move(conn));
}

void ConnectionPool::give_back(std::unique_ptr<Connection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

size_t ConnectionPool::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

}  // namespace cache
}  // namespace envkeeper
