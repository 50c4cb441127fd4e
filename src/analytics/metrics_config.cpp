#include "folio/analytics/metrics_config.hpp"

#include <cmath>

namespace folio {

std::string risk_label_to_string(RiskLabel label) {
    switch (label) {
        case RiskLabel::LOW:
            return "Low";
        case RiskLabel::MEDIUM:
            return "Medium";
        case RiskLabel::HIGH:
            return "High";
        default:
            return "Unknown";
    }
}

nlohmann::json MetricsConfig::to_json() const {
    nlohmann::json j;
    j["volatility_window"] = volatility_window;
    j["annualize"] = annualize;
    j["periods_per_year"] = periods_per_year;
    j["medium_threshold"] = medium_threshold;
    j["high_threshold"] = high_threshold;
    return j;
}

void MetricsConfig::from_json(const nlohmann::json& j) {
    if (j.contains("volatility_window"))
        volatility_window = j.at("volatility_window").get<size_t>();
    if (j.contains("annualize"))
        annualize = j.at("annualize").get<bool>();
    if (j.contains("periods_per_year"))
        periods_per_year = j.at("periods_per_year").get<double>();
    if (j.contains("medium_threshold"))
        medium_threshold = j.at("medium_threshold").get<double>();
    if (j.contains("high_threshold"))
        high_threshold = j.at("high_threshold").get<double>();
}

Result<void> MetricsConfig::validate() const {
    if (volatility_window < 2) {
        return make_error<void>(ErrorCode::INVALID_DATA, "volatility_window must be at least 2",
                                "MetricsConfig");
    }
    if (annualize && !(periods_per_year > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "periods_per_year must be positive when annualizing",
                                "MetricsConfig");
    }
    if (!std::isfinite(medium_threshold) || !std::isfinite(high_threshold) ||
        medium_threshold < 0.0 || medium_threshold > high_threshold) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "risk thresholds must satisfy 0 <= medium <= high",
                                "MetricsConfig");
    }
    return Result<void>();
}

RiskLabel classify_risk(double volatility, const MetricsConfig& config) {
    if (volatility > config.high_threshold) {
        return RiskLabel::HIGH;
    }
    if (volatility > config.medium_threshold) {
        return RiskLabel::MEDIUM;
    }
    return RiskLabel::LOW;
}

}  // namespace folio
