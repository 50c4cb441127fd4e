// include/folio/statistics/return_statistics.hpp

#pragma once

#include <optional>
#include <vector>
#include "folio/core/types.hpp"

namespace folio {
namespace statistics {

/**
 * @brief Day-over-day fractional changes p[i]/p[i-1] - 1
 *
 * Pairs whose earlier price is not positive are skipped.
 */
std::vector<double> percent_changes(const std::vector<Price>& prices);

/**
 * @brief Arithmetic mean, nullopt for an empty sample
 */
std::optional<double> mean(const std::vector<double>& values);

/**
 * @brief Population standard deviation, nullopt for an empty sample
 */
std::optional<double> standard_deviation(const std::vector<double>& values);

/**
 * @brief Volatility of the trailing window of a price series
 *
 * Standard deviation of the percent changes between the last `window`
 * prices, scaled by sqrt(periods_per_year) when periods_per_year > 0.
 *
 * @return nullopt when fewer than two prices are available
 */
std::optional<double> rolling_volatility(const std::vector<Price>& prices, size_t window,
                                         double periods_per_year = 0.0);

}  // namespace statistics
}  // namespace folio
