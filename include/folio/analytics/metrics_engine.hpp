// include/folio/analytics/metrics_engine.hpp

#pragma once

#include <memory>
#include <optional>
#include "folio/analytics/metrics_config.hpp"
#include "folio/analytics/portfolio_snapshot.hpp"
#include "folio/core/clock.hpp"
#include "folio/market/price_series.hpp"
#include "folio/market/quote_provider.hpp"
#include "folio/portfolio/holdings_ledger.hpp"

namespace folio {

/**
 * @brief Turns positions and quotes into a PortfolioSnapshot
 *
 * Pricing failures never abort a computation: a symbol without a quote is
 * listed as a gap, keeps its position data, and is left out of the totals.
 */
class MetricsEngine {
public:
    explicit MetricsEngine(MetricsConfig config,
                           std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    /**
     * @brief Compute a fresh snapshot
     * @param positions Positions to value; closed positions are skipped
     * @param quotes Quote and history source for this pass
     */
    PortfolioSnapshot compute(const PositionMap& positions, QuoteProvider& quotes) const;

    /**
     * @brief Volatility of the trailing window of a history
     * @return nullopt when the series has fewer than two points
     */
    std::optional<double> volatility(const PriceSeries& history) const;

    RiskLabel classify(double volatility) const {
        return classify_risk(volatility, config_);
    }

    const MetricsConfig& config() const {
        return config_;
    }

    static double market_value(const Position& position, Price price) {
        return position.net_quantity * price;
    }

    static double unrealized_pnl(const Position& position, Price price) {
        return (price - position.average_cost) * position.net_quantity;
    }

    /**
     * @brief (price - average cost) / average cost, N/A without a cost basis
     */
    static std::optional<double> percent_return(const Position& position, Price price);

private:
    HoldingMetrics compute_holding(const Position& position, QuoteProvider& quotes,
                                   std::vector<PriceGap>& gaps) const;

    void compute_totals(PortfolioSnapshot& snapshot) const;

    MetricsConfig config_;
    std::shared_ptr<const Clock> clock_;
};

}  // namespace folio
