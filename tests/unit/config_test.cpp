#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/logger.hpp"

namespace fs = std::filesystem;
using namespace envkeeper::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("envkeeper_config_test_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    CoreConfig config = default_config();

    EXPECT_FALSE(config.cache.path.empty());
    EXPECT_EQ(config.cache.pool_size, 10);
    EXPECT_EQ(config.cache.mise.versions_expire, 3600);
    EXPECT_EQ(config.cache.cargo_install.versions_expire, 86400);
    EXPECT_EQ(config.cache.homebrew.cleanup_after, 604800);
    EXPECT_EQ(config.cache.homebrew.install_check_expire, 43200);
    EXPECT_EQ(config.cache.github_release.versions_retention, 7776000);
    EXPECT_EQ(config.cache.environment.retention, 7776000);
    EXPECT_FALSE(config.cache.environment.max_per_workdir.has_value());
    EXPECT_FALSE(config.cache.environment.max_total.has_value());
    EXPECT_TRUE(config.askpass.enabled);

    std::string error;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
logging:
  level: debug

cache:
  path: /var/tmp/envkeeper-test
  pool_size: 4
  busy_timeout_ms: 250
  environment:
    retention: 3600
    max_per_workdir: 5
    max_total: 50
  mise:
    cleanup_after: 10
    versions_expire: 20
  homebrew:
    update_expire: 30
    install_check_expire: 40
  github_release:
    versions_retention: 50

askpass:
  enabled: false
  prefer_gui: true
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    CoreConfig config = default_config();
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.cache.path, "/var/tmp/envkeeper-test");
    EXPECT_EQ(config.cache.pool_size, 4);
    EXPECT_EQ(config.cache.busy_timeout_ms, 250);
    EXPECT_EQ(config.cache.environment.retention, 3600);
    EXPECT_EQ(config.cache.environment.max_per_workdir.value_or(0), 5);
    EXPECT_EQ(config.cache.environment.max_total.value_or(0), 50);
    EXPECT_EQ(config.cache.mise.cleanup_after, 10);
    EXPECT_EQ(config.cache.mise.versions_expire, 20);
    EXPECT_EQ(config.cache.homebrew.update_expire, 30);
    EXPECT_EQ(config.cache.homebrew.install_check_expire, 40);
    EXPECT_EQ(config.cache.github_release.versions_retention, 50);
    EXPECT_FALSE(config.askpass.enabled);
    EXPECT_TRUE(config.askpass.prefer_gui);

    // Untouched sections keep their defaults
    EXPECT_EQ(config.cache.go_install.cleanup_after, 604800);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
logging:
  level: INVALID_LEVEL
)";

    std::string config_path = create_config_file("invalid_log.yaml", config_content);
    CoreConfig config = default_config();
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
    EXPECT_NE(error.find("log level"), std::string::npos);
}

TEST_F(ConfigTest, NegativeRetentionRejected) {
    std::string config_content = R"(
cache:
  cargo_install:
    cleanup_after: -1
)";

    std::string config_path = create_config_file("negative.yaml", config_content);
    CoreConfig config = default_config();
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("cache.cargo_install.cleanup_after"), std::string::npos);
}

TEST_F(ConfigTest, HistoryLimitsMustBePositive) {
    CoreConfig config = default_config();
    config.cache.environment.max_per_workdir = 0;
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("max_per_workdir"), std::string::npos);
}

TEST_F(ConfigTest, PoolSizeMustBePositive) {
    CoreConfig config = default_config();
    config.cache.pool_size = 0;
    std::string error;

    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("pool_size"), std::string::npos);
}

TEST_F(ConfigTest, UnknownKeysDoNotFailLoad) {
    // Unknown keys should generate warnings but not prevent loading
    std::string config_content = R"(
logging:
  level: info

cache:
  mise:
    cleanup_after: 100
    not_a_setting: 1

unknown_top_level_key: some_value
)";

    std::string config_path = create_config_file("unknown_keys.yaml", config_content);
    CoreConfig config = default_config();
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.cache.mise.cleanup_after, 100);
}

TEST_F(ConfigTest, InstallCheckExpireOnlyKnownForHomebrew) {
    std::string config_content = R"(
cache:
  homebrew:
    install_check_expire: 60
  cargo_install:
    install_check_expire: 70
)";

    std::string config_path = create_config_file("install_check.yaml", config_content);
    CoreConfig config = default_config();
    std::string error;

    std::stringstream log;
    envkeeper::logging::Level saved = envkeeper::logging::Logger::level();
    envkeeper::logging::Logger::set_level(envkeeper::logging::Level::LVL_WARN);
    envkeeper::logging::Logger::set_stream(&log);
    bool loaded = load_config(config_path, config, error);
    envkeeper::logging::Logger::set_stream(nullptr);
    envkeeper::logging::Logger::set_level(saved);

    ASSERT_TRUE(loaded) << "Error: " << error;
    EXPECT_EQ(config.cache.homebrew.install_check_expire, 60);
    EXPECT_NE(log.str().find("Unknown key 'cache.cargo_install.install_check_expire'"), std::string::npos);
    EXPECT_EQ(log.str().find("cache.homebrew.install_check_expire"), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    CoreConfig config = default_config();
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "does_not_exist.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("malformed.yaml", "cache: [unterminated\n");
    CoreConfig config = default_config();
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, CachePathExpandsHome) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME is not set";
    }

    std::string config_path = create_config_file("home.yaml", "cache:\n  path: ~/envkeeper-cache\n");
    CoreConfig config = default_config();
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.cache.path, std::string(home) + "/envkeeper-cache");
}
