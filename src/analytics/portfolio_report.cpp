#include "folio/analytics/portfolio_report.hpp"

#include <algorithm>
#include "folio/core/logger.hpp"
#include "folio/core/time_utils.hpp"
#include "folio/statistics/return_statistics.hpp"

namespace folio {

std::string allocation_stance_to_string(AllocationStance stance) {
    switch (stance) {
        case AllocationStance::DARING:
            return "daring";
        case AllocationStance::CONSERVATIVE:
            return "conservative";
        default:
            return "balanced";
    }
}

nlohmann::json ReportConfig::to_json() const {
    nlohmann::json j;
    j["order"] = risk_order == RiskOrder::HIGH_TO_LOW ? "HtoLrisk" : "LtoHrisk";
    j["best_count"] = best_count;
    return j;
}

void ReportConfig::from_json(const nlohmann::json& j) {
    if (j.contains("order")) {
        risk_order = j.at("order").get<std::string>() == "LtoHrisk" ? RiskOrder::LOW_TO_HIGH
                                                                    : RiskOrder::HIGH_TO_LOW;
    }
    if (j.contains("best_count"))
        best_count = j.at("best_count").get<size_t>();
}

PortfolioReporter::PortfolioReporter(ReportConfig config) : config_(std::move(config)) {}

int PortfolioReporter::risk_weight(const HoldingMetrics& holding) {
    if (!holding.risk) {
        return 2;
    }
    switch (*holding.risk) {
        case RiskLabel::LOW:
            return 1;
        case RiskLabel::HIGH:
            return 3;
        default:
            return 2;
    }
}

std::vector<HoldingMetrics> PortfolioReporter::rank_by_return(
    const PortfolioSnapshot& snapshot) const {
    std::vector<HoldingMetrics> ranked = snapshot.holdings;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const HoldingMetrics& a, const HoldingMetrics& b) {
                         if (a.percent_return && b.percent_return) {
                             return *a.percent_return > *b.percent_return;
                         }
                         return a.percent_return.has_value() && !b.percent_return.has_value();
                     });
    return ranked;
}

std::vector<HoldingMetrics> PortfolioReporter::rank_by_pnl(const PortfolioSnapshot& snapshot) const {
    std::vector<HoldingMetrics> ranked = snapshot.holdings;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const HoldingMetrics& a, const HoldingMetrics& b) {
                         if (a.unrealized_pnl && b.unrealized_pnl) {
                             return *a.unrealized_pnl > *b.unrealized_pnl;
                         }
                         return a.unrealized_pnl.has_value() && !b.unrealized_pnl.has_value();
                     });
    return ranked;
}

std::vector<HoldingMetrics> PortfolioReporter::rank_by_risk(
    const PortfolioSnapshot& snapshot) const {
    std::vector<HoldingMetrics> ranked = snapshot.holdings;
    const bool high_first = config_.risk_order == RiskOrder::HIGH_TO_LOW;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [high_first](const HoldingMetrics& a, const HoldingMetrics& b) {
                         return high_first ? risk_weight(a) > risk_weight(b)
                                           : risk_weight(a) < risk_weight(b);
                     });
    return ranked;
}

PerformanceSummary PortfolioReporter::summarize(const PortfolioSnapshot& snapshot) const {
    PerformanceSummary summary;
    summary.by_return = rank_by_return(snapshot);
    summary.by_pnl = rank_by_pnl(snapshot);
    summary.by_risk = rank_by_risk(snapshot);

    // Best and worst only consider holdings with a defined return
    std::vector<HoldingMetrics> ranked;
    for (const auto& holding : summary.by_return) {
        if (holding.percent_return) {
            ranked.push_back(holding);
        }
    }

    const size_t best_n = std::min(config_.best_count, ranked.size());
    summary.best.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(best_n));
    if (!ranked.empty()) {
        summary.worst = ranked.back();
    }
    return summary;
}

AllocationStance PortfolioReporter::allocation_stance(
    const std::vector<std::string>& venture_symbols, const PortfolioSnapshot& snapshot) const {
    int high_count = 0;
    int low_count = 0;

    for (const auto& symbol : venture_symbols) {
        const HoldingMetrics* holding = snapshot.find(symbol);
        if (!holding || !holding->risk) {
            continue;
        }
        if (*holding->risk == RiskLabel::HIGH) {
            ++high_count;
        } else if (*holding->risk == RiskLabel::LOW) {
            ++low_count;
        }
    }

    if (high_count > low_count) {
        return AllocationStance::DARING;
    }
    if (high_count < low_count) {
        return AllocationStance::CONSERVATIVE;
    }
    return AllocationStance::BALANCED;
}

Result<MonthlyRecap> PortfolioReporter::monthly_recap(const std::vector<Transaction>& transactions,
                                                      const PortfolioSnapshot& snapshot) const {
    const Transaction* latest = nullptr;
    for (const auto& tx : transactions) {
        if (tx.side == Side::BUY && (!latest || tx.timestamp > latest->timestamp)) {
            latest = &tx;
        }
    }

    if (!latest) {
        return make_error<MonthlyRecap>(ErrorCode::DATA_NOT_FOUND, "No buy transactions yet",
                                        "PortfolioReporter");
    }

    MonthlyRecap recap;
    recap.month = core::month_key(latest->timestamp);

    std::vector<std::string> venture_symbols;
    for (const auto& tx : transactions) {
        if (tx.side == Side::BUY && core::month_key(tx.timestamp) == recap.month) {
            recap.ventures.push_back(tx);
            venture_symbols.push_back(tx.symbol);
        }
    }

    recap.total_growth = snapshot.totals.total_unrealized_pnl;

    std::vector<double> returns;
    for (const auto& holding : snapshot.holdings) {
        if (holding.percent_return) {
            returns.push_back(*holding.percent_return);
        }
    }
    recap.average_return = statistics::mean(returns);
    recap.stance = allocation_stance(venture_symbols, snapshot);

    DEBUG("Monthly recap " << recap.month << ": " << recap.ventures.size() << " venture(s), "
                           << allocation_stance_to_string(recap.stance));
    return recap;
}

}  // namespace folio
