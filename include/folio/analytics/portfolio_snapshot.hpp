// include/folio/analytics/portfolio_snapshot.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "folio/analytics/metrics_config.hpp"
#include "folio/core/types.hpp"
#include "folio/market/quote_provider.hpp"
#include "folio/portfolio/holdings_ledger.hpp"

namespace folio {

enum class HoldingStatus {
    PROFIT,
    LOSS
};

inline std::string holding_status_to_string(HoldingStatus status) {
    return status == HoldingStatus::PROFIT ? "profit" : "loss";
}

/**
 * @brief Derived metrics for one open position
 *
 * Optional fields are N/A: no quote (a gap), no prior cost, or not enough
 * history for volatility.
 */
struct HoldingMetrics {
    Position position;
    std::optional<PriceQuote> quote;
    std::optional<double> market_value;
    std::optional<double> unrealized_pnl;
    std::optional<double> percent_return;  // Fraction, 0.25 == +25%
    std::optional<double> volatility;
    std::optional<RiskLabel> risk;

    const std::string& symbol() const {
        return position.symbol;
    }

    bool is_gap() const {
        return !quote.has_value();
    }

    std::optional<HoldingStatus> status() const {
        if (!percent_return) {
            return std::nullopt;
        }
        return *percent_return > 0.0 ? HoldingStatus::PROFIT : HoldingStatus::LOSS;
    }
};

/**
 * @brief Aggregates over holdings with a resolvable quote only
 */
struct PortfolioTotals {
    double total_market_value{0.0};
    double total_unrealized_pnl{0.0};
    double total_cost_basis{0.0};
    std::optional<double> percent_return;
    std::optional<double> volatility;  // Market-value weighted
    std::optional<RiskLabel> risk;
    size_t priced_holdings{0};
};

/**
 * @brief Point-in-time computed view of the portfolio, never persisted
 */
struct PortfolioSnapshot {
    Timestamp as_of;
    std::vector<HoldingMetrics> holdings;
    std::vector<PriceGap> gaps;
    PortfolioTotals totals;

    const HoldingMetrics* find(const std::string& symbol) const {
        for (const auto& holding : holdings) {
            if (holding.symbol() == symbol) {
                return &holding;
            }
        }
        return nullptr;
    }

    bool has_gap(const std::string& symbol) const {
        for (const auto& gap : gaps) {
            if (gap.symbol == symbol) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace folio
