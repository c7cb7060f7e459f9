#pragma once

#include <memory>
#include <string>

#include "cache/cache_store.hpp"
#include "cache/connection_pool.hpp"
#include "common/errors.hpp"
#include "config.hpp"

namespace envkeeper {
namespace runtime {

/**
 * @brief Everything one invocation needs, passed explicitly
 *
 * Owns the configuration, the connection pool and the cache store built on
 * it. Tests create one Context per test case with an isolated in-memory
 * database, so nothing is shared between them.
 */
class Context {
public:
    // File-backed pool at <cache.path>/cache.db. Fails (and the caller is
    // expected to exit) when the database cannot be opened or upgraded.
    static std::unique_ptr<Context> create(const CoreConfig &config, common::Error &error);

    // In-memory pool named after test_id, kTestSize connections. Legacy JSON
    // files are imported from legacy_dir when it is not empty.
    static std::unique_ptr<Context> create_for_test(const std::string &test_id, common::Error &error,
                                                    const CoreConfig &config = CoreConfig(),
                                                    const std::string &legacy_dir = "");

    ~Context();

    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;

    const CoreConfig &config() const { return config_; }
    cache::ConnectionPool &pool() { return *pool_; }
    cache::CacheStore &cache() { return *cache_; }

private:
    Context(const CoreConfig &config, std::unique_ptr<cache::ConnectionPool> pool);

    CoreConfig config_;
    std::unique_ptr<cache::ConnectionPool> pool_;
    std::unique_ptr<cache::CacheStore> cache_;
};

}  // namespace runtime
}  // namespace envkeeper
