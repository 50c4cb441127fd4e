#include "folio/market/pricing_config.hpp"

namespace folio {

nlohmann::json ProviderConfig::to_json() const {
    nlohmann::json j;
    j["base_url"] = base_url;
    j["timeout_seconds"] = timeout_seconds;
    j["user_agent"] = user_agent;
    return j;
}

void ProviderConfig::from_json(const nlohmann::json& j) {
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("timeout_seconds"))
        timeout_seconds = j.at("timeout_seconds").get<long>();
    if (j.contains("user_agent"))
        user_agent = j.at("user_agent").get<std::string>();
}

nlohmann::json PricingConfig::to_json() const {
    nlohmann::json j;
    j["max_attempts"] = max_attempts;
    j["initial_backoff_ms"] = initial_backoff_ms;
    j["backoff_multiplier"] = backoff_multiplier;
    j["max_backoff_ms"] = max_backoff_ms;
    j["max_staleness_seconds"] = max_staleness_seconds;
    j["cache_ttl_seconds"] = cache_ttl_seconds;
    j["history_lookback_days"] = history_lookback_days;
    j["provider"] = provider.to_json();
    return j;
}

void PricingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("max_attempts"))
        max_attempts = j.at("max_attempts").get<int>();
    if (j.contains("initial_backoff_ms"))
        initial_backoff_ms = j.at("initial_backoff_ms").get<long>();
    if (j.contains("backoff_multiplier"))
        backoff_multiplier = j.at("backoff_multiplier").get<double>();
    if (j.contains("max_backoff_ms"))
        max_backoff_ms = j.at("max_backoff_ms").get<long>();
    if (j.contains("max_staleness_seconds"))
        max_staleness_seconds = j.at("max_staleness_seconds").get<long>();
    if (j.contains("cache_ttl_seconds"))
        cache_ttl_seconds = j.at("cache_ttl_seconds").get<long>();
    if (j.contains("history_lookback_days"))
        history_lookback_days = j.at("history_lookback_days").get<int>();
    if (j.contains("provider"))
        provider.from_json(j.at("provider"));
}

Result<void> PricingConfig::validate() const {
    if (max_attempts < 1) {
        return make_error<void>(ErrorCode::INVALID_DATA, "max_attempts must be at least 1",
                                "PricingConfig");
    }
    if (initial_backoff_ms < 0 || max_backoff_ms < 0 || backoff_multiplier < 1.0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "backoff must be non-negative with a multiplier >= 1",
                                "PricingConfig");
    }
    if (max_staleness_seconds < 0 || cache_ttl_seconds < 0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "staleness and cache TTL must be non-negative", "PricingConfig");
    }
    if (history_lookback_days < 2) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "history_lookback_days must be at least 2", "PricingConfig");
    }
    if (provider.base_url.empty() || provider.timeout_seconds <= 0) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "provider needs a base_url and a positive timeout",
                                "PricingConfig");
    }
    return Result<void>();
}

}  // namespace folio
