#include "folio/analytics/metrics_engine.hpp"

#include <cmath>
#include "folio/core/logger.hpp"
#include "folio/statistics/return_statistics.hpp"

namespace folio {

MetricsEngine::MetricsEngine(MetricsConfig config, std::shared_ptr<const Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw *valid.error();
    }
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
}

std::optional<double> MetricsEngine::percent_return(const Position& position, Price price) {
    if (position.average_cost == 0.0) {
        return std::nullopt;
    }
    return (price - position.average_cost) / position.average_cost;
}

std::optional<double> MetricsEngine::volatility(const PriceSeries& history) const {
    const double periods = config_.annualize ? config_.periods_per_year : 0.0;
    return statistics::rolling_volatility(history.tail(config_.volatility_window).prices(),
                                          config_.volatility_window, periods);
}

HoldingMetrics MetricsEngine::compute_holding(const Position& position, QuoteProvider& quotes,
                                              std::vector<PriceGap>& gaps) const {
    HoldingMetrics holding;
    holding.position = position;

    auto quote = quotes.get_quote(position.symbol);
    if (quote.is_ok()) {
        const Price price = quote.value().price;
        holding.quote = quote.value();
        holding.market_value = market_value(position, price);
        holding.unrealized_pnl = unrealized_pnl(position, price);
        holding.percent_return = percent_return(position, price);
        auto status = holding.status();
        DEBUG(position.symbol << " priced at " << price << " ("
                              << quote_source_to_string(quote.value().source) << "), "
                              << (status ? holding_status_to_string(*status) : "no return"));
    } else {
        WARN("No price for " << position.symbol << ", reporting as gap: "
                             << quote.error()->what());
        gaps.emplace_back(position.symbol, quote.error()->code(), quote.error()->what());
    }

    auto history = quotes.get_history(position.symbol);
    if (history.is_ok()) {
        if (!history.value().empty()) {
            DEBUG(position.symbol << " history: " << history.value().size()
                                  << " point(s), last close " << history.value().back().price);
        }
        holding.volatility = volatility(history.value());
        if (holding.volatility) {
            holding.risk = classify(*holding.volatility);
        }
    } else {
        DEBUG("No history for " << position.symbol << ": " << history.error()->what());
    }

    return holding;
}

void MetricsEngine::compute_totals(PortfolioSnapshot& snapshot) const {
    PortfolioTotals& totals = snapshot.totals;
    double weighted_vol = 0.0;
    double vol_weight = 0.0;

    for (const auto& holding : snapshot.holdings) {
        if (holding.is_gap()) {
            continue;
        }

        ++totals.priced_holdings;
        totals.total_market_value += *holding.market_value;
        totals.total_unrealized_pnl += *holding.unrealized_pnl;
        totals.total_cost_basis += holding.position.cost_basis();

        if (holding.volatility) {
            weighted_vol += *holding.market_value * *holding.volatility;
            vol_weight += *holding.market_value;
        }
    }

    if (totals.total_cost_basis > 0.0) {
        totals.percent_return = totals.total_unrealized_pnl / totals.total_cost_basis;
    }
    if (vol_weight > 0.0) {
        totals.volatility = weighted_vol / vol_weight;
        totals.risk = classify(*totals.volatility);
    }
}

PortfolioSnapshot MetricsEngine::compute(const PositionMap& positions,
                                         QuoteProvider& quotes) const {
    PortfolioSnapshot snapshot;
    snapshot.as_of = clock_->now();

    for (const auto& [symbol, position] : positions) {
        if (!position.is_open()) {
            continue;
        }
        Position keyed = position;
        if (keyed.symbol.empty()) {
            keyed.symbol = symbol;
        }
        snapshot.holdings.push_back(compute_holding(keyed, quotes, snapshot.gaps));
    }

    compute_totals(snapshot);

    INFO("Snapshot: " << snapshot.holdings.size() << " holding(s), "
                      << snapshot.totals.priced_holdings << " priced, " << snapshot.gaps.size()
                      << " gap(s), market value " << snapshot.totals.total_market_value
                      << ", unrealized P&L " << snapshot.totals.total_unrealized_pnl);
    return snapshot;
}

}  // namespace folio
