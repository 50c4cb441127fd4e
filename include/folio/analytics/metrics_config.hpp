// include/folio/analytics/metrics_config.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "folio/core/config_base.hpp"

namespace folio {

/**
 * @brief Risk classification of a volatility value
 */
enum class RiskLabel {
    LOW,
    MEDIUM,
    HIGH
};

std::string risk_label_to_string(RiskLabel label);

/**
 * @brief Parameters of the derived-metrics computation
 *
 * Thresholds are compared against annualized volatility when annualize is
 * set: above high_threshold is HIGH, above medium_threshold is MEDIUM,
 * anything else LOW.
 */
struct MetricsConfig : public ConfigBase {
    size_t volatility_window{20};  // Trailing price points used for volatility
    bool annualize{true};
    double periods_per_year{252.0};
    double medium_threshold{0.20};
    double high_threshold{0.45};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    Result<void> validate() const;
};

/**
 * @brief Map a volatility value onto a RiskLabel using the configured thresholds
 */
RiskLabel classify_risk(double volatility, const MetricsConfig& config);

}  // namespace folio
