// include/folio/market/price_source_adapter.hpp

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "folio/core/clock.hpp"
#include "folio/core/error.hpp"
#include "folio/core/types.hpp"
#include "folio/market/price_provider.hpp"
#include "folio/market/price_series.hpp"
#include "folio/market/pricing_config.hpp"
#include "folio/market/quote_provider.hpp"

namespace folio {

/**
 * @brief Bookkeeping for one retried provider call
 */
struct RetryState {
    int attempt{0};                           // Attempts made so far
    std::chrono::milliseconds next_backoff{0};  // Wait before the next attempt
    ErrorCode last_code{ErrorCode::NONE};
    std::string last_reason;
};

/**
 * @brief Fetches quotes and history from a PriceProvider with retry and fallback
 *
 * Transient provider failures (connection, timeout, empty result, thrown
 * exceptions) are retried up to PricingConfig::max_attempts with
 * exponential backoff. When every attempt fails, fetch_quote() falls back to
 * the last live quote seen for the symbol if it was fetched within
 * max_staleness_seconds, tagged STALE_FALLBACK. Otherwise the call fails
 * with PRICE_UNAVAILABLE.
 */
class PriceSourceAdapter : public QuoteProvider {
public:
    /**
     * @param provider External price source
     * @param config Retry, staleness and lookback policy
     * @param clock Time source for staleness and history windows
     * @param sleeper Blocking wait used for backoff
     */
    PriceSourceAdapter(std::shared_ptr<PriceProvider> provider, PricingConfig config,
                       std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                       Sleeper sleeper = make_thread_sleeper());

    /**
     * @brief Current quote for a normalized symbol
     * @param symbol Normalized symbol
     * @param token Optional abort flag, checked before each attempt
     * @return LIVE or STALE_FALLBACK quote, PRICE_UNAVAILABLE, or OPERATION_CANCELLED
     */
    Result<PriceQuote> fetch_quote(const std::string& symbol,
                                   const CancellationToken* token = nullptr);

    /**
     * @brief Daily history over the trailing lookback_days
     * @return Ascending series, PRICE_UNAVAILABLE, or OPERATION_CANCELLED
     */
    Result<PriceSeries> fetch_history(const std::string& symbol, int lookback_days,
                                      const CancellationToken* token = nullptr);

    Result<PriceQuote> get_quote(const std::string& symbol) override {
        return fetch_quote(symbol);
    }

    Result<PriceSeries> get_history(const std::string& symbol) override {
        return fetch_history(symbol, config_.history_lookback_days);
    }

    /**
     * @brief Record a live quote as the fallback candidate for its symbol
     */
    void remember(const PriceQuote& quote);

    /**
     * @brief Last live quote for a symbol, if still inside the staleness window
     */
    std::optional<PriceQuote> stale_fallback(const std::string& symbol) const;

    const PricingConfig& config() const {
        return config_;
    }

    const Clock& clock() const {
        return *clock_;
    }

private:
    struct KnownQuote {
        PriceQuote quote;
        Timestamp fetched_at;
    };

    template <typename T, typename Fetch>
    Result<T> with_retry(const std::string& symbol, const char* what,
                         const CancellationToken* token, Fetch&& fetch);

    static bool is_transient(ErrorCode code);

    std::shared_ptr<PriceProvider> provider_;
    PricingConfig config_;
    std::shared_ptr<const Clock> clock_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, KnownQuote> last_known_;
};

}  // namespace folio
