// include/folio/market/pricing_config.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "folio/core/config_base.hpp"

namespace folio {

/**
 * @brief Settings for the HTTP market data provider
 */
struct ProviderConfig : public ConfigBase {
    std::string base_url{"https://query1.finance.yahoo.com"};
    long timeout_seconds{10};
    std::string user_agent{"folio/1.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Retry, fallback and caching policy for price acquisition
 */
struct PricingConfig : public ConfigBase {
    int max_attempts{3};             // Provider calls per fetch, first try included
    long initial_backoff_ms{200};    // Wait after the first failed attempt
    double backoff_multiplier{2.0};  // Growth of the wait per further attempt
    long max_backoff_ms{2000};       // Upper bound on a single wait
    long max_staleness_seconds{3600};  // Oldest quote usable as a stale fallback
    long cache_ttl_seconds{300};       // Lifetime of a cache entry within a pass
    int history_lookback_days{60};     // Calendar days requested for volatility history

    ProviderConfig provider;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    Result<void> validate() const;
};

}  // namespace folio
