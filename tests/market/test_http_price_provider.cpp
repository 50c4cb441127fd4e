#include <gtest/gtest.h>
#include "folio/market/http_price_provider.hpp"

using namespace folio;

namespace {

const char* kChartBody = R"({
  "chart": {
    "result": [{
      "meta": {"symbol": "AAPL", "regularMarketPrice": 191.5, "regularMarketTime": 1700003600},
      "timestamp": [1699833600, 1699920000, 1700006400, 1700092800],
      "indicators": {"quote": [{"close": [185.0, null, 188.25, 190.0]}]}
    }],
    "error": null
  }
})";

}  // namespace

TEST(HttpPriceProviderTest, ParseHistorySkipsNulls) {
    auto result = HttpPriceProvider::parse_history(kChartBody);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& points = result.value();
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].price, 185.0);
    EXPECT_DOUBLE_EQ(points[1].price, 188.25);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(points[1].timestamp), 1700006400);
}

TEST(HttpPriceProviderTest, ParseLatestPrefersMarketPrice) {
    auto result = HttpPriceProvider::parse_latest(kChartBody);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().price, 191.5);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(result.value().timestamp), 1700003600);
}

TEST(HttpPriceProviderTest, ParseLatestFallsBackToLastClose) {
    const char* body = R"({"chart": {"result": [{
        "meta": {"symbol": "XYZ"},
        "timestamp": [1, 2],
        "indicators": {"quote": [{"close": [10.0, 12.5]}]}
    }], "error": null}})";

    auto result = HttpPriceProvider::parse_latest(body);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().price, 12.5);
}

TEST(HttpPriceProviderTest, ProviderErrorIsReported) {
    const char* body =
        R"({"chart": {"result": null, "error": {"code": "Not Found", "description": "No data found, symbol may be delisted"}}})";

    auto result = HttpPriceProvider::parse_latest(body);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::API_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("delisted"), std::string::npos);
}

TEST(HttpPriceProviderTest, MalformedBody) {
    auto garbage = HttpPriceProvider::parse_history("<html>rate limited</html>");
    ASSERT_TRUE(garbage.is_error());
    EXPECT_EQ(garbage.error()->code(), ErrorCode::API_ERROR);

    auto empty = HttpPriceProvider::parse_history(R"({"chart": {"result": [], "error": null}})");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST(HttpPriceProviderTest, AllNullClosesIsNotFound) {
    const char* body = R"({"chart": {"result": [{
        "timestamp": [1, 2],
        "indicators": {"quote": [{"close": [null, null]}]}
    }], "error": null}})";

    auto result = HttpPriceProvider::parse_history(body);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
}
