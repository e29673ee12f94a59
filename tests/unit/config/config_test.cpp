// Config file parsing and environment override tests
#include <gtest/gtest.h>
#include <kbase/config/config_helpers.h>
#include <kbase/config/kbase_config.h>

#include "common/test_helpers.h"

#include <cstdlib>
#include <filesystem>

namespace kbase::config {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("kbase_config_test_");
        ::unsetenv("KBASE_DATA_DIR");
        ::unsetenv("KBASE_LOG_LEVEL");
    }

    void TearDown() override {
        ::unsetenv("KBASE_DATA_DIR");
        ::unsetenv("KBASE_LOG_LEVEL");
        ::unsetenv("KBASE_TEST_API_KEY");
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path writeConfig(const std::string& body) {
        return tests::write_file(dir_ / "config.toml", body);
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto cfg = loadConfig(dir_ / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().logLevel, "info");
    EXPECT_EQ(cfg.value().embedding.cacheCapacity, 100u);
    EXPECT_EQ(cfg.value().embedding.cachePolicy, core::EvictionPolicy::FIFO);
    EXPECT_EQ(cfg.value().knowledge.documentCount, 5u);
    EXPECT_EQ(cfg.value().knowledge.chunkSize, 1000u);
    EXPECT_EQ(cfg.value().knowledge.chunkOverlap, 200u);
    EXPECT_DOUBLE_EQ(cfg.value().knowledge.threshold, 0.7);
    EXPECT_EQ(cfg.value().retrieval.maxCandidates, 50u);
    EXPECT_DOUBLE_EQ(cfg.value().retrieval.diversityThreshold, 0.8);
    EXPECT_TRUE(cfg.value().models.empty());
}

TEST_F(ConfigTest, ReadsAllSections) {
    auto path = writeConfig(R"(
# kbase settings
[core]
data_dir = "/var/lib/kbase"
log_level = "debug"   # inline comment

[embedding]
cache_capacity = 250
cache_policy = "lru"
request_timeout_ms = 5000
native_providers = ["gemini", "vertex"]

[knowledge]
document_count = 8
chunk_size = 512
chunk_overlap = 64
threshold = 0.55

[retrieval]
query_expansion = false
hybrid_search = true
diversity_filter = off
rerank = no
max_candidates = 30
diversity_threshold = 0.9
)");
    auto cfg = loadConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.dataDir, std::filesystem::path("/var/lib/kbase"));
    EXPECT_EQ(c.databasePath(), std::filesystem::path("/var/lib/kbase/kbase.db"));
    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_EQ(c.embedding.cacheCapacity, 250u);
    EXPECT_EQ(c.embedding.cachePolicy, core::EvictionPolicy::LRU);
    EXPECT_EQ(c.embedding.requestTimeout.count(), 5000);
    ASSERT_EQ(c.embedding.nativeProviders.size(), 2u);
    EXPECT_EQ(c.embedding.nativeProviders[1], "vertex");
    EXPECT_EQ(c.knowledge.documentCount, 8u);
    EXPECT_EQ(c.knowledge.chunkSize, 512u);
    EXPECT_EQ(c.knowledge.chunkOverlap, 64u);
    EXPECT_DOUBLE_EQ(c.knowledge.threshold, 0.55);
    EXPECT_FALSE(c.retrieval.enableQueryExpansion);
    EXPECT_TRUE(c.retrieval.enableHybridSearch);
    EXPECT_FALSE(c.retrieval.enableDiversityFilter);
    EXPECT_FALSE(c.retrieval.enableRerank);
    EXPECT_EQ(c.retrieval.maxCandidates, 30u);
    EXPECT_DOUBLE_EQ(c.retrieval.diversityThreshold, 0.9);
}

TEST_F(ConfigTest, ReadsModelSections) {
    ::setenv("KBASE_TEST_API_KEY", "from-env", 1);
    auto path = writeConfig(R"(
[models.text-embedding-3-small]
provider = "openai"
api_key = "sk-abc"
base_url = "https://api.openai.com/v1"
dimensions = 1536

[models.text-embedding-004]
provider = "gemini"
api_key_env = "KBASE_TEST_API_KEY"
)");
    auto cfg = loadConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& models = cfg.value().models;
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0].id, "text-embedding-3-small");
    EXPECT_EQ(models[0].provider, "openai");
    EXPECT_EQ(models[0].apiKey, "sk-abc");
    EXPECT_EQ(models[0].baseUrl, "https://api.openai.com/v1");
    EXPECT_EQ(models[0].dimensions, 1536u);
    EXPECT_EQ(models[1].id, "text-embedding-004");
    EXPECT_EQ(models[1].apiKey, "from-env");
    EXPECT_EQ(models[1].dimensions, 0u);
}

TEST_F(ConfigTest, MalformedNumberIsInvalidConfig) {
    auto path = writeConfig("[knowledge]\ndocument_count = lots\n");
    auto cfg = loadConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
    EXPECT_NE(cfg.error().message.find("document_count"), std::string::npos);
}

TEST_F(ConfigTest, OverlapNotSmallerThanChunkSizeIsInvalidConfig) {
    auto path = writeConfig("[knowledge]\nchunk_size = 100\nchunk_overlap = 100\n");
    auto cfg = loadConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, UnknownCachePolicyIsInvalidConfig) {
    auto path = writeConfig("[embedding]\ncache_policy = \"random\"\n");
    auto cfg = loadConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, ModelWithoutProviderIsInvalidConfig) {
    auto path = writeConfig("[models.orphan]\napi_key = \"x\"\n");
    auto cfg = loadConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[core]\ndata_dir = \"/from/file\"\nlog_level = \"info\"\n");
    auto cfg = loadConfig(path);
    ASSERT_TRUE(cfg);
    ::setenv("KBASE_DATA_DIR", "/from/env", 1);
    ::setenv("KBASE_LOG_LEVEL", "trace", 1);
    auto c = cfg.value();
    applyEnvironmentOverrides(c);
    EXPECT_EQ(c.dataDir, std::filesystem::path("/from/env"));
    EXPECT_EQ(c.logLevel, "trace");
}

TEST_F(ConfigTest, HelperParsersRejectGarbage) {
    EXPECT_EQ(parse_bool("YES").value(), true);
    EXPECT_EQ(parse_bool("off").value(), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
    EXPECT_EQ(parse_int(" 42 ").value(), 42);
    EXPECT_FALSE(parse_int("4x2").has_value());
    EXPECT_DOUBLE_EQ(parse_double("0.25").value(), 0.25);
    EXPECT_FALSE(parse_double("0.25abc").has_value());
    auto list = parse_list("a, 'b' ,\"c\"");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[1], "b");
}

TEST_F(ConfigTest, FirstOccurrenceOfKeyWins) {
    auto path = writeConfig("[core]\nlog_level = warn\nlog_level = debug\n");
    EXPECT_EQ(parse_config_value(path, "core", "log_level"), "warn");
    EXPECT_EQ(parse_config_section(path, "core").at("log_level"), "warn");
}

TEST_F(ConfigTest, ConfigPathHonoursOverride) {
    EXPECT_EQ(get_config_path("/tmp/custom.toml"), std::filesystem::path("/tmp/custom.toml"));
    ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
    EXPECT_EQ(get_config_path(""), std::filesystem::path("/xdg/kbase/config.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}

} // namespace kbase::config
