#include <gtest/gtest.h>
#include <thread>
#include "folio/core/clock.hpp"
#include "folio/core/time_utils.hpp"

using namespace folio;

TEST(TimeUtilsTest, MakeUtcTimestampMatchesEpoch) {
    auto epoch = core::make_utc_timestamp(1970, 1, 1);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(epoch), 0);

    // 2024-02-29 12:30:15 UTC
    auto leap_day = core::make_utc_timestamp(2024, 2, 29, 12, 30, 15);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(leap_day), 1709209815);
}

TEST(TimeUtilsTest, FormatAndMonthKey) {
    auto ts = core::make_utc_timestamp(2023, 12, 31, 23, 59, 59);
    EXPECT_EQ(core::format_utc(ts), "2023-12-31 23:59:59");
    EXPECT_EQ(core::month_key(ts), "2023-12");
    EXPECT_EQ(core::month_key(ts + std::chrono::seconds(1)), "2024-01");
}

TEST(CancellationTokenTest, CancelAndReset) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());

    std::thread canceller([&token]() { token.cancel(); });
    canceller.join();
    EXPECT_TRUE(token.is_cancelled());

    token.reset();
    EXPECT_FALSE(token.is_cancelled());
}

TEST(ClockTest, SystemClockAdvances) {
    SystemClock clock;
    auto first = clock.now();
    auto second = clock.now();
    EXPECT_LE(first, second);
}

TEST(ClockTest, ThreadSleeperWaits) {
    Sleeper sleeper = make_thread_sleeper();
    auto start = std::chrono::steady_clock::now();
    sleeper(std::chrono::milliseconds(5));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(5));
}
