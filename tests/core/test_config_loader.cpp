#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "folio/core/config_loader.hpp"

using namespace folio;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "folio_config_loader_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        std::filesystem::path path = test_dir / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoaderTest, LoadsShippedDefaults) {
    auto result = ConfigLoader::load(std::filesystem::path(FOLIO_TEST_DATA_DIR) / "defaults.json");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const AppConfig& config = result.value();
    EXPECT_EQ(config.pricing.max_attempts, 3);
    EXPECT_EQ(config.metrics.volatility_window, 20u);
    EXPECT_DOUBLE_EQ(config.metrics.medium_threshold, 0.20);
    EXPECT_DOUBLE_EQ(config.metrics.high_threshold, 0.45);
    EXPECT_EQ(config.report.risk_order, RiskOrder::HIGH_TO_LOW);
    EXPECT_EQ(config.symbols.quote_suffix, "-USD");
}

TEST_F(ConfigLoaderTest, OverridesDeepMerge) {
    auto defaults = write("defaults.json", R"({
        "pricing": {"max_attempts": 3, "provider": {"base_url": "https://a", "timeout_seconds": 10}},
        "report": {"order": "HtoLrisk", "best_count": 3}
    })");
    auto overrides = write("overrides.json", R"({
        "pricing": {"provider": {"timeout_seconds": 2}},
        "report": {"order": "LtoHrisk"},
        "symbols": {"overrides": {"bitcoin": "BTC-USD"}}
    })");

    auto result = ConfigLoader::load(defaults, overrides);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const AppConfig& config = result.value();
    EXPECT_EQ(config.pricing.max_attempts, 3);
    EXPECT_EQ(config.pricing.provider.base_url, "https://a");
    EXPECT_EQ(config.pricing.provider.timeout_seconds, 2);
    EXPECT_EQ(config.report.risk_order, RiskOrder::LOW_TO_HIGH);
    EXPECT_EQ(config.report.best_count, 3u);
    EXPECT_EQ(config.symbols.overrides.at("bitcoin"), "BTC-USD");
}

TEST_F(ConfigLoaderTest, MissingOverridesUsesDefaults) {
    auto defaults = write("defaults.json", R"({"metrics": {"volatility_window": 10}})");

    auto result = ConfigLoader::load(defaults, test_dir / "absent.json");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().metrics.volatility_window, 10u);
}

TEST_F(ConfigLoaderTest, MergeReplacesNonObjectValues) {
    nlohmann::json target = {{"list", nlohmann::json::array({1, 2, 3})}, {"nested", {{"a", 1}, {"b", 2}}}};
    nlohmann::json source = {{"list", nlohmann::json::array({9})}, {"nested", {{"b", 5}}}};

    ConfigLoader::merge_json(target, source);

    EXPECT_EQ(target["list"], nlohmann::json::array({9}));
    EXPECT_EQ(target["nested"]["a"], 1);
    EXPECT_EQ(target["nested"]["b"], 5);
}

TEST_F(ConfigLoaderTest, RejectsInvalidValues) {
    auto path = write("bad.json", R"({"metrics": {"medium_threshold": 0.9, "high_threshold": 0.1}})");

    auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigLoaderTest, ReportsParseAndMissingFiles) {
    auto missing = ConfigLoader::load(test_dir / "nope.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);

    auto broken = ConfigLoader::load(write("broken.json", "{ not json"));
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigLoaderTest, SerializedConfigLoadsBack) {
    AppConfig config;
    config.pricing.cache_ttl_seconds = 42;
    config.report.best_count = 5;

    auto result = ConfigLoader::from_json(config.to_json());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().pricing.cache_ttl_seconds, 42);
    EXPECT_EQ(result.value().report.best_count, 5u);
}
