#include <gtest/gtest.h>
#include <cmath>
#include "folio/statistics/return_statistics.hpp"

using namespace folio;
using namespace folio::statistics;

TEST(ReturnStatisticsTest, PercentChanges) {
    auto changes = percent_changes({100.0, 110.0, 99.0});
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_NEAR(changes[0], 0.10, 1e-12);
    EXPECT_NEAR(changes[1], -0.10, 1e-12);

    EXPECT_TRUE(percent_changes({100.0}).empty());
    EXPECT_TRUE(percent_changes({}).empty());
}

TEST(ReturnStatisticsTest, PercentChangesSkipNonPositiveBase) {
    auto changes = percent_changes({0.0, 10.0, 11.0});
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_NEAR(changes[0], 0.10, 1e-12);
}

TEST(ReturnStatisticsTest, MeanAndPopulationDeviation) {
    EXPECT_FALSE(mean({}).has_value());
    EXPECT_DOUBLE_EQ(*mean({1.0, 2.0, 3.0, 4.0}), 2.5);

    auto sd = standard_deviation({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    ASSERT_TRUE(sd.has_value());
    EXPECT_DOUBLE_EQ(*sd, 2.0);
}

TEST(ReturnStatisticsTest, ConstantSeriesHasZeroVolatility) {
    auto vol = rolling_volatility({50.0, 50.0, 50.0, 50.0, 50.0}, 20);
    ASSERT_TRUE(vol.has_value());
    EXPECT_DOUBLE_EQ(*vol, 0.0);
}

TEST(ReturnStatisticsTest, TooFewPointsIsUndefined) {
    EXPECT_FALSE(rolling_volatility({}, 20).has_value());
    EXPECT_FALSE(rolling_volatility({42.0}, 20).has_value());
    EXPECT_FALSE(rolling_volatility({1.0, 2.0, 3.0}, 1).has_value());
}

TEST(ReturnStatisticsTest, TwoPointsGiveZero) {
    auto vol = rolling_volatility({100.0, 120.0}, 20);
    ASSERT_TRUE(vol.has_value());
    EXPECT_DOUBLE_EQ(*vol, 0.0);
}

TEST(ReturnStatisticsTest, WindowUsesTrailingPrices) {
    // Early turbulence falls outside a 3-price window
    std::vector<Price> prices = {100.0, 200.0, 50.0, 100.0, 110.0, 121.0};
    auto vol = rolling_volatility(prices, 3);
    ASSERT_TRUE(vol.has_value());
    EXPECT_NEAR(*vol, 0.0, 1e-12);

    auto wide = rolling_volatility(prices, 6);
    ASSERT_TRUE(wide.has_value());
    EXPECT_GT(*wide, 0.5);
}

TEST(ReturnStatisticsTest, Annualization) {
    std::vector<Price> prices = {100.0, 101.0, 100.0, 101.0};
    auto daily = rolling_volatility(prices, 20);
    auto annual = rolling_volatility(prices, 20, 252.0);
    ASSERT_TRUE(daily.has_value());
    ASSERT_TRUE(annual.has_value());
    EXPECT_NEAR(*annual, *daily * std::sqrt(252.0), 1e-12);
}
