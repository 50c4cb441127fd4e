#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "folio/core/config_base.hpp"
#include "folio/market/pricing_config.hpp"
#include "folio/market/symbol_normalizer.hpp"

using namespace folio;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "folio_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    PricingConfig config;
    config.max_attempts = 5;
    config.cache_ttl_seconds = 60;
    config.provider.base_url = "http://localhost:8080";

    std::filesystem::path file_path = test_dir / "pricing.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();

    PricingConfig loaded;
    auto load_result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();

    EXPECT_EQ(loaded.max_attempts, 5);
    EXPECT_EQ(loaded.cache_ttl_seconds, 60);
    EXPECT_EQ(loaded.provider.base_url, "http://localhost:8080");
    EXPECT_EQ(loaded.initial_backoff_ms, config.initial_backoff_ms);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "pricing.json.tmp"));
}

TEST_F(ConfigBaseTest, SaveReplacesExistingFile) {
    SymbolConfig config;
    std::filesystem::path file_path = test_dir / "symbols.json";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    config.overrides["bitcoin"] = "BTC-USD";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    SymbolConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(file_path.string()).is_ok());
    EXPECT_EQ(loaded.overrides.at("bitcoin"), "BTC-USD");
}

TEST_F(ConfigBaseTest, LoadMissingFile) {
    PricingConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, LoadMalformedJson) {
    std::filesystem::path file_path = test_dir / "broken.json";
    {
        std::ofstream file(file_path);
        file << "{ \"max_attempts\": ";
    }

    PricingConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, LoadWrongFieldType) {
    std::filesystem::path file_path = test_dir / "wrong_type.json";
    {
        std::ofstream file(file_path);
        file << "{ \"max_attempts\": \"three\" }";
    }

    PricingConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigBaseTest, SaveToUnwritablePath) {
    PricingConfig config;
    auto result = config.save_to_file((test_dir / "no_such_dir" / "pricing.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
