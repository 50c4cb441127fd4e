#include "folio/statistics/return_statistics.hpp"

#include <cmath>
#include <numeric>

namespace folio {
namespace statistics {

std::vector<double> percent_changes(const std::vector<Price>& prices) {
    std::vector<double> changes;
    if (prices.size() < 2) {
        return changes;
    }

    changes.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] <= 0.0) {
            continue;
        }
        changes.push_back(prices[i] / prices[i - 1] - 1.0);
    }
    return changes;
}

std::optional<double> mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

std::optional<double> standard_deviation(const std::vector<double>& values) {
    auto avg = mean(values);
    if (!avg) {
        return std::nullopt;
    }

    double sum_sq = 0.0;
    for (double v : values) {
        const double d = v - *avg;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

std::optional<double> rolling_volatility(const std::vector<Price>& prices, size_t window,
                                         double periods_per_year) {
    if (window < 2 || prices.size() < 2) {
        return std::nullopt;
    }

    const size_t start = prices.size() > window ? prices.size() - window : 0;
    std::vector<Price> trailing(prices.begin() + static_cast<std::ptrdiff_t>(start), prices.end());

    auto sigma = standard_deviation(percent_changes(trailing));
    if (!sigma) {
        return std::nullopt;
    }

    if (periods_per_year > 0.0) {
        return *sigma * std::sqrt(periods_per_year);
    }
    return sigma;
}

}  // namespace statistics
}  // namespace folio
