#include <cortex/config/config_helpers.h>
#include <spdlog/spdlog.h>
#include <cortex/config/engine_config.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

using namespace cortex;
using namespace cortex::config;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CORTEX_DB_PATH");
        unsetenv("CORTEX_LOG_LEVEL");
        unsetenv("CORTEX_EMBED_TIMEOUT_MS");
        dir_ = tests::make_temp_dir("cortex_config_");
    }

    void TearDown() override {
        unsetenv("CORTEX_DB_PATH");
        unsetenv("CORTEX_LOG_LEVEL");
        unsetenv("CORTEX_EMBED_TIMEOUT_MS");
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(EngineConfigTest, MissingFileYieldsDefaults) {
    auto config = loadEngineConfig(dir_ / "absent.toml");
    ASSERT_TRUE(config) << config.error().message;

    EXPECT_EQ(config.value().embeddings.dimension, 384u);
    EXPECT_EQ(config.value().embeddings.backend, "hashing");
    EXPECT_EQ(config.value().embeddings.timeout.count(), 350);
    EXPECT_FLOAT_EQ(config.value().search.default_semantic_weight, 0.7f);
    EXPECT_EQ(config.value().search.default_limit, 50);
    EXPECT_EQ(config.value().search.max_limit, 100);
    EXPECT_EQ(config.value().storage.backend, StorageSettings::Backend::Memory);
    EXPECT_EQ(config.value().mutation.max_conflict_retries, 3u);
    EXPECT_EQ(config.value().logging.level, "info");
}

TEST_F(EngineConfigTest, ReadsSectionsAndIgnoresComments) {
    auto path = tests::write_file(dir_ / "config.toml", R"(
# engine settings
[embeddings]
dimension = 8
timeout_ms = 120   # tight deadline
backend = "hashing"

[search]
default_semantic_weight = 0.25
default_limit = 20
max_limit = 40

[storage]
backend = "sqlite"
database_path = '/tmp/cortex-test.db'

[mutation]
max_conflict_retries = 5

[logging]
level = debug
)");

    auto config = loadEngineConfig(path);
    ASSERT_TRUE(config) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.embeddings.dimension, 8u);
    EXPECT_EQ(c.embeddings.timeout.count(), 120);
    EXPECT_FLOAT_EQ(c.search.default_semantic_weight, 0.25f);
    EXPECT_EQ(c.search.default_limit, 20);
    EXPECT_EQ(c.search.max_limit, 40);
    EXPECT_EQ(c.storage.backend, StorageSettings::Backend::Sqlite);
    EXPECT_EQ(c.storage.database_path, "/tmp/cortex-test.db");
    EXPECT_EQ(c.mutation.max_conflict_retries, 5u);
    EXPECT_EQ(c.logging.level, "debug");
}

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    auto path = tests::write_file(dir_ / "config.toml", "[logging]\nlevel = warn\n");
    setenv("CORTEX_LOG_LEVEL", "trace", 1);
    setenv("CORTEX_DB_PATH", "/var/tmp/override.db", 1);
    setenv("CORTEX_EMBED_TIMEOUT_MS", "75", 1);

    auto config = loadEngineConfig(path);
    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().logging.level, "trace");
    EXPECT_EQ(config.value().storage.database_path, "/var/tmp/override.db");
    EXPECT_EQ(config.value().embeddings.timeout.count(), 75);
}

TEST_F(EngineConfigTest, RejectsMalformedValues) {
    auto path = tests::write_file(dir_ / "bad.toml", "[embeddings]\ndimension = lots\n");
    auto config = loadEngineConfig(path);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);

    path = tests::write_file(dir_ / "bad_backend.toml", "[storage]\nbackend = redis\n");
    config = loadEngineConfig(path);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, ValidateRejectsOutOfRangeSettings) {
    EngineConfig config;
    EXPECT_TRUE(config.validate());

    config.search.default_semantic_weight = 1.5f;
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);

    config = EngineConfig{};
    config.embeddings.dimension = 0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.search.default_limit = 500;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.search.max_limit = 0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig{};
    config.embeddings.timeout = std::chrono::milliseconds(0);
    EXPECT_EQ(config.validate().error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, ZeroEmbedTimeoutIsRejected) {
    auto path = tests::write_file(dir_ / "zero.toml", "[embeddings]\ntimeout_ms = 0\n");
    auto config = loadEngineConfig(path);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, ApplyLoggingSetsGlobalLevel) {
    const auto previous = spdlog::get_level();

    EngineConfig config;
    config.logging.level = "warn";
    applyLogging(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

    config.logging.level = "chatty";
    applyLogging(config);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);

    spdlog::set_level(previous);
}

TEST(ConfigHelpersTest, ParsesQuotedAndSectionScopedValues) {
    auto dir = tests::make_temp_dir("cortex_helpers_");
    auto path = tests::write_file(dir / "c.toml", "[a]\nkey = \"one # not a comment\"\n"
                                                  "[b]\nkey = two # trailing\n");

    EXPECT_EQ(parse_config_value(path, "a", "key"), "one # not a comment");
    EXPECT_EQ(parse_config_value(path, "b", "key"), "two");
    EXPECT_EQ(parse_config_value(path, "c", "key"), "");
    std::filesystem::remove_all(dir);
}

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  padded\t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote(" 'single' "), "single");
    EXPECT_EQ(unquote("\"double\""), "double");
    EXPECT_EQ(parse_ms("250").count(), 250);
    EXPECT_EQ(parse_ms("soon").count(), 0);
}

TEST(ConfigHelpersTest, ConfigPathPrefersOverrideThenXdg) {
    EXPECT_EQ(get_config_path("/etc/cortex.toml"), std::filesystem::path("/etc/cortex.toml"));

    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";
    setenv("XDG_CONFIG_HOME", "/xdg", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/cortex/config.toml"));
    if (previous) {
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}
