#include "context.hpp"

#include "logging/logger.hpp"

namespace envkeeper {
namespace runtime {

Context::Context(const CoreConfig &config, std::unique_ptr<cache::ConnectionPool> pool)
    : config_(config), pool_(std::move(pool)) {
    cache_ = std::make_unique<cache::CacheStore>(*pool_, config_.cache);
}

// The cache store holds a reference to the pool
Context::~Context() {
    cache_.reset();
    pool_.reset();
}

std::unique_ptr<Context> Context::create(const CoreConfig &config, common::Error &error) {
    LOG_DEBUG("[Context] Opening cache at " << config.cache.path);

    auto pool = cache::ConnectionPool::open_file(config.cache.path, static_cast<size_t>(config.cache.pool_size),
                                                 config.cache.busy_timeout_ms, error);
    if (!pool) {
        return nullptr;
    }
    return std::unique_ptr<Context>(new Context(config, std::move(pool)));
}

std::unique_ptr<Context> Context::create_for_test(const std::string &test_id, common::Error &error,
                                                  const CoreConfig &config, const std::string &legacy_dir) {
    auto pool = cache::ConnectionPool::open_memory(test_id, cache::ConnectionPool::kTestSize, legacy_dir, error);
    if (!pool) {
        return nullptr;
    }
    return std::unique_ptr<Context>(new Context(config, std::move(pool)));
}

}  // namespace runtime
}  // namespace envkeeper
