#include <gtest/gtest.h>
#include "folio/analytics/portfolio_report.hpp"
#include "folio/core/time_utils.hpp"

using namespace folio;

namespace {

HoldingMetrics holding(const std::string& symbol, std::optional<double> ret,
                       std::optional<double> pnl, std::optional<RiskLabel> risk) {
    HoldingMetrics h;
    h.position = Position(symbol, 1, 100.0);
    h.percent_return = ret;
    h.unrealized_pnl = pnl;
    h.risk = risk;
    if (pnl) {
        h.quote = PriceQuote(symbol, 100.0 + *pnl, Timestamp(), QuoteSource::LIVE);
        h.market_value = 100.0 + *pnl;
    }
    return h;
}

std::vector<std::string> symbols(const std::vector<HoldingMetrics>& holdings) {
    std::vector<std::string> out;
    for (const auto& h : holdings) {
        out.push_back(h.symbol());
    }
    return out;
}

}  // namespace

class PortfolioReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        snapshot.holdings = {
            holding("AAPL", 0.10, 10.0, RiskLabel::MEDIUM),
            holding("BTC-USD", 0.50, 50.0, RiskLabel::HIGH),
            holding("GONE", std::nullopt, std::nullopt, std::nullopt),
            holding("KO", -0.05, -5.0, RiskLabel::LOW),
            holding("FREE", std::nullopt, 7.0, RiskLabel::LOW),
        };
        snapshot.totals.total_unrealized_pnl = 62.0;
    }

    PortfolioSnapshot snapshot;
};

TEST_F(PortfolioReportTest, RankByReturnPutsUndefinedLast) {
    PortfolioReporter reporter;
    EXPECT_EQ(symbols(reporter.rank_by_return(snapshot)),
              (std::vector<std::string>{"BTC-USD", "AAPL", "KO", "GONE", "FREE"}));
}

TEST_F(PortfolioReportTest, RankByPnl) {
    PortfolioReporter reporter;
    EXPECT_EQ(symbols(reporter.rank_by_pnl(snapshot)),
              (std::vector<std::string>{"BTC-USD", "AAPL", "FREE", "KO", "GONE"}));
}

TEST_F(PortfolioReportTest, RankByRiskHonoursOrder) {
    PortfolioReporter high_first;
    EXPECT_EQ(symbols(high_first.rank_by_risk(snapshot)),
              (std::vector<std::string>{"BTC-USD", "AAPL", "GONE", "KO", "FREE"}));

    ReportConfig config;
    config.risk_order = RiskOrder::LOW_TO_HIGH;
    PortfolioReporter low_first(config);
    EXPECT_EQ(symbols(low_first.rank_by_risk(snapshot)),
              (std::vector<std::string>{"KO", "FREE", "AAPL", "GONE", "BTC-USD"}));
}

TEST_F(PortfolioReportTest, SummaryBestAndWorst) {
    ReportConfig config;
    config.best_count = 2;
    PortfolioReporter reporter(config);

    auto summary = reporter.summarize(snapshot);
    EXPECT_EQ(symbols(summary.best), (std::vector<std::string>{"BTC-USD", "AAPL"}));
    ASSERT_TRUE(summary.worst.has_value());
    EXPECT_EQ(summary.worst->symbol(), "KO");
    EXPECT_EQ(summary.by_return.size(), snapshot.holdings.size());
}

TEST_F(PortfolioReportTest, SummaryOfEmptySnapshot) {
    PortfolioReporter reporter;
    auto summary = reporter.summarize(PortfolioSnapshot());
    EXPECT_TRUE(summary.best.empty());
    EXPECT_FALSE(summary.worst.has_value());
}

TEST_F(PortfolioReportTest, AllocationStance) {
    PortfolioReporter reporter;
    EXPECT_EQ(reporter.allocation_stance({"BTC-USD", "BTC-USD", "KO"}, snapshot),
              AllocationStance::DARING);
    EXPECT_EQ(reporter.allocation_stance({"KO", "FREE", "BTC-USD"}, snapshot),
              AllocationStance::CONSERVATIVE);
    EXPECT_EQ(reporter.allocation_stance({"AAPL", "GONE", "UNKNOWN"}, snapshot),
              AllocationStance::BALANCED);
    EXPECT_EQ(allocation_stance_to_string(AllocationStance::DARING), "daring");
}

TEST_F(PortfolioReportTest, MonthlyRecapUsesLatestBuyMonth) {
    std::vector<Transaction> log = {
        Transaction("KO", Side::BUY, 1, 100.0, core::make_utc_timestamp(2024, 4, 20)),
        Transaction("BTC-USD", Side::BUY, 1, 100.0, core::make_utc_timestamp(2024, 5, 2)),
        Transaction("AAPL", Side::BUY, 1, 100.0, core::make_utc_timestamp(2024, 5, 28)),
        Transaction("KO", Side::SELL, 1, 100.0, core::make_utc_timestamp(2024, 6, 1)),
    };

    PortfolioReporter reporter;
    auto recap = reporter.monthly_recap(log, snapshot);
    ASSERT_TRUE(recap.is_ok()) << recap.error()->what();

    EXPECT_EQ(recap.value().month, "2024-05");
    ASSERT_EQ(recap.value().ventures.size(), 2u);
    EXPECT_EQ(recap.value().ventures[0].symbol, "BTC-USD");
    EXPECT_DOUBLE_EQ(recap.value().total_growth, 62.0);
    ASSERT_TRUE(recap.value().average_return.has_value());
    EXPECT_NEAR(*recap.value().average_return, (0.10 + 0.50 - 0.05) / 3.0, 1e-12);
    EXPECT_EQ(recap.value().stance, AllocationStance::DARING);
}

TEST_F(PortfolioReportTest, MonthlyRecapNeedsBuys) {
    PortfolioReporter reporter;
    auto recap = reporter.monthly_recap({}, snapshot);
    ASSERT_TRUE(recap.is_error());
    EXPECT_EQ(recap.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(PortfolioReportTest, ConfigJson) {
    ReportConfig config;
    config.risk_order = RiskOrder::LOW_TO_HIGH;
    config.best_count = 7;

    auto j = config.to_json();
    EXPECT_EQ(j["order"], "LtoHrisk");

    ReportConfig copy;
    copy.from_json(j);
    EXPECT_EQ(copy.risk_order, RiskOrder::LOW_TO_HIGH);
    EXPECT_EQ(copy.best_count, 7u);
}
