// include/folio/market/price_cache.hpp

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "folio/core/clock.hpp"
#include "folio/core/error.hpp"
#include "folio/market/price_source_adapter.hpp"
#include "folio/market/quote_provider.hpp"

namespace folio {

/**
 * @brief Outcome of a user-initiated price refresh
 */
struct RefreshReport {
    std::vector<std::string> refreshed;  // Live quotes now cached
    std::vector<std::string> stale;      // Served by stale fallback, not cached
    std::vector<PriceGap> failures;      // No price at all
};

/**
 * @brief Short-lived per-symbol quote store in front of the PriceSourceAdapter
 *
 * One entry per symbol, valid for the configured TTL. Only live quotes are
 * stored; stale fallbacks pass through with their tag so they are never
 * re-labelled as cached. The cache is owned by the caller of an analytics
 * pass and is not shared between snapshots.
 */
class PriceCache : public QuoteProvider {
public:
    PriceCache(std::shared_ptr<PriceSourceAdapter> adapter, std::chrono::seconds ttl);

    /**
     * @brief Cached quote if fresh, otherwise fetch through the adapter
     */
    Result<PriceQuote> get_or_fetch(const std::string& symbol);

    Result<PriceQuote> get_quote(const std::string& symbol) override {
        return get_or_fetch(symbol);
    }

    /**
     * @brief History over the adapter's lookback window, cached like quotes
     */
    Result<PriceSeries> get_history(const std::string& symbol) override;

    /**
     * @brief Replace the cache contents with freshly fetched quotes
     *
     * Quotes are staged and swapped in only once every symbol has been
     * attempted. If the token is cancelled before that, the refresh fails
     * with OPERATION_CANCELLED and the existing entries are left as they were.
     */
    Result<RefreshReport> refresh(const std::vector<std::string>& symbols,
                                  const CancellationToken& token);

    void clear();

    size_t size() const;

    /**
     * @brief Inspect an entry without fetching or checking expiry
     */
    std::optional<PriceQuote> peek(const std::string& symbol) const;

private:
    struct Entry {
        PriceQuote quote;
        Timestamp fetched_at;
    };

    struct HistoryEntry {
        PriceSeries series;
        Timestamp fetched_at;
    };

    bool is_fresh(const Timestamp& fetched_at) const;

    std::shared_ptr<PriceSourceAdapter> adapter_;
    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> quotes_;
    std::unordered_map<std::string, HistoryEntry> histories_;
};

}  // namespace folio
