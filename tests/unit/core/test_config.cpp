#include <gtest/gtest.h>
#include "ckg/core/config.hpp"
#include <algorithm>
#include <fstream>
#include <filesystem>

using namespace ckg;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "ckg_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_test_file(const std::string& filename, const std::string& content) const {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path.string();
    }

    fs::path temp_dir;
};

TEST_F(ConfigTest, DefaultConfig) {
    const auto config = EngineConfig::default_config();

    EXPECT_EQ(config.vectorizer.dimensions, 100u);
    EXPECT_EQ(config.vectorizer.min_token_length, 3u);
    EXPECT_TRUE(config.vectorizer.cache_enabled);

    EXPECT_EQ(config.relationships.similarity_threshold, 0.7);
    EXPECT_EQ(config.relationships.part_of_weight, 0.9);
    EXPECT_EQ(config.relationships.depends_on_weight, 0.8);
    EXPECT_EQ(config.relationships.calls_weight, 0.6);
    EXPECT_EQ(config.relationships.inheritance_weight, 0.7);
    EXPECT_EQ(config.relationships.default_confidence, 0.8);

    EXPECT_EQ(config.query.min_similarity, 0.3);
    EXPECT_EQ(config.query.max_results, 20u);
    EXPECT_EQ(config.query.max_suggestions, 5u);

    EXPECT_EQ(config.insights.hub_connection_threshold, 5u);
    EXPECT_EQ(config.patterns.god_object_line_threshold, 500u);
    EXPECT_EQ(config.logging.level, "info");

    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, DefaultExcludes) {
    const auto config = EngineConfig::default_config();
    const auto& excluded = config.discovery.exclude_dirs;

    EXPECT_NE(std::find(excluded.begin(), excluded.end(), "node_modules"), excluded.end());
    EXPECT_NE(std::find(excluded.begin(), excluded.end(), ".git"), excluded.end());
}

TEST_F(ConfigTest, LoadFromStringOverridesOnlyGivenKeys) {
    const std::string toml = R"(
[query]
max_results = 50
min_similarity = 0.5

[logging]
level = "DEBUG"
)";

    auto result = EngineConfig::load_from_string(toml);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& config = result.value();
    EXPECT_EQ(config.query.max_results, 50u);
    EXPECT_EQ(config.query.min_similarity, 0.5);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.vectorizer.dimensions, 100u);
}

TEST_F(ConfigTest, LoadFromStringReplacesLists) {
    auto result = EngineConfig::load_from_string(R"(
[discovery]
extensions = [".py"]
exclude_dirs = ["vendor"]
)");
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().discovery.extensions, std::vector<std::string>{".py"});
    EXPECT_EQ(result.value().discovery.exclude_dirs, std::vector<std::string>{"vendor"});
}

TEST_F(ConfigTest, InvalidTomlIsParseError) {
    auto result = EngineConfig::load_from_string("[query\nmax_results = ");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(ConfigTest, NegativeIntegerIsConfigError) {
    auto result = EngineConfig::load_from_string("[query]\nmax_results = -1\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, ValidationRejectsOutOfRangeThreshold) {
    auto config = EngineConfig::default_config();
    config.relationships.similarity_threshold = 1.5;

    auto result = config.validate();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_NE(result.error().message().find("similarity_threshold"), std::string::npos);
}

TEST_F(ConfigTest, ValidationRejectsZeroDimensions) {
    auto config = EngineConfig::default_config();
    config.vectorizer.dimensions = 0;

    EXPECT_TRUE(config.validate().is_err());
}

TEST_F(ConfigTest, ExtractionAndCacheLimits) {
    const auto defaults = EngineConfig::default_config();
    EXPECT_EQ(defaults.discovery.max_line_length, 4096u);
    EXPECT_EQ(defaults.vectorizer.max_cache_entries, 10000u);

    auto result = EngineConfig::load_from_string(R"(
[discovery]
max_line_length = 800

[vectorizer]
max_cache_entries = 64
)");
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().discovery.max_line_length, 800u);
    EXPECT_EQ(result.value().vectorizer.max_cache_entries, 64u);

    auto reloaded = EngineConfig::load_from_string(result.value().to_string());
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().discovery.max_line_length, 800u);
    EXPECT_EQ(reloaded.value().vectorizer.max_cache_entries, 64u);
}

TEST_F(ConfigTest, ValidationRejectsZeroLineLength) {
    auto config = EngineConfig::default_config();
    config.discovery.max_line_length = 0;

    auto result = config.validate();
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().message().find("max_line_length"), std::string::npos);
}

TEST_F(ConfigTest, ValidationRejectsUnknownLogLevel) {
    auto config = EngineConfig::default_config();
    config.logging.level = "verbose";

    EXPECT_TRUE(config.validate().is_err());
}

TEST_F(ConfigTest, ValidationRejectsExtensionWithoutDot) {
    auto config = EngineConfig::default_config();
    config.discovery.extensions = {"ts"};

    EXPECT_TRUE(config.validate().is_err());
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = create_test_file("ckg.toml", "[insights]\nmax_cycles = 3\n");

    auto result = EngineConfig::load_from_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().insights.max_cycles, 3u);
}

TEST_F(ConfigTest, LoadFromMissingFile) {
    auto result = EngineConfig::load_from_file((temp_dir / "missing.toml").string());

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(ConfigTest, ToStringRoundTrips) {
    auto config = EngineConfig::default_config();
    config.query.max_results = 7;
    config.discovery.exclude_dirs = {"third_party"};
    config.relationships.discover_similarities = false;

    auto reloaded = EngineConfig::load_from_string(config.to_string());
    ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();

    EXPECT_EQ(reloaded.value().query.max_results, 7u);
    EXPECT_EQ(reloaded.value().discovery.exclude_dirs, std::vector<std::string>{"third_party"});
    EXPECT_FALSE(reloaded.value().relationships.discover_similarities);
    EXPECT_EQ(reloaded.value().logging.pattern, config.logging.pattern);
}
