// include/folio/analytics/portfolio_report.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "folio/analytics/portfolio_snapshot.hpp"
#include "folio/core/config_base.hpp"
#include "folio/core/error.hpp"
#include "folio/portfolio/transaction.hpp"

namespace folio {

enum class RiskOrder {
    HIGH_TO_LOW,
    LOW_TO_HIGH
};

/**
 * @brief Overall character of a set of recent buys
 */
enum class AllocationStance {
    DARING,        // More High-risk than Low-risk buys
    CONSERVATIVE,  // More Low-risk than High-risk buys
    BALANCED
};

std::string allocation_stance_to_string(AllocationStance stance);

/**
 * @brief Presentation preferences for portfolio reports
 */
struct ReportConfig : public ConfigBase {
    RiskOrder risk_order{RiskOrder::HIGH_TO_LOW};
    size_t best_count{3};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct PerformanceSummary {
    std::vector<HoldingMetrics> by_return;
    std::vector<HoldingMetrics> by_pnl;
    std::vector<HoldingMetrics> by_risk;
    std::vector<HoldingMetrics> best;
    std::optional<HoldingMetrics> worst;
};

struct MonthlyRecap {
    std::string month;                  // YYYY-MM (UTC) of the latest buy
    std::vector<Transaction> ventures;  // Buys made in that month
    double total_growth{0.0};           // Total unrealized P&L
    std::optional<double> average_return;
    AllocationStance stance{AllocationStance::BALANCED};
};

/**
 * @brief Rankings and summaries derived from a PortfolioSnapshot
 */
class PortfolioReporter {
public:
    explicit PortfolioReporter(ReportConfig config = ReportConfig());

    /**
     * @brief Holdings by percent return, best first; N/A returns last
     */
    std::vector<HoldingMetrics> rank_by_return(const PortfolioSnapshot& snapshot) const;

    /**
     * @brief Holdings by unrealized P&L, largest first; gaps last
     */
    std::vector<HoldingMetrics> rank_by_pnl(const PortfolioSnapshot& snapshot) const;

    /**
     * @brief Holdings by risk in the configured order; unknown risk ranks as Medium
     */
    std::vector<HoldingMetrics> rank_by_risk(const PortfolioSnapshot& snapshot) const;

    PerformanceSummary summarize(const PortfolioSnapshot& snapshot) const;

    /**
     * @brief Compare High-risk and Low-risk counts among the given buys
     * @param venture_symbols One entry per buy; repeats count again
     */
    AllocationStance allocation_stance(const std::vector<std::string>& venture_symbols,
                                       const PortfolioSnapshot& snapshot) const;

    /**
     * @brief Summary of the most recent month with buys
     * @return MonthlyRecap, or DATA_NOT_FOUND when there are no buys
     */
    Result<MonthlyRecap> monthly_recap(const std::vector<Transaction>& transactions,
                                       const PortfolioSnapshot& snapshot) const;

private:
    static int risk_weight(const HoldingMetrics& holding);

    ReportConfig config_;
};

}  // namespace folio
