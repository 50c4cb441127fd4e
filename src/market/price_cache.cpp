#include "folio/market/price_cache.hpp"

#include <set>
#include "folio/core/logger.hpp"

namespace folio {

namespace {
const char* kComponent = "PriceCache";
}

PriceCache::PriceCache(std::shared_ptr<PriceSourceAdapter> adapter, std::chrono::seconds ttl)
    : adapter_(std::move(adapter)), ttl_(ttl) {
    if (!adapter_) {
        throw std::invalid_argument("PriceCache requires a PriceSourceAdapter");
    }
}

bool PriceCache::is_fresh(const Timestamp& fetched_at) const {
    return adapter_->clock().now() - fetched_at < ttl_;
}

Result<PriceQuote> PriceCache::get_or_fetch(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = quotes_.find(symbol);
        if (it != quotes_.end()) {
            if (is_fresh(it->second.fetched_at)) {
                DEBUG("Cache hit for " << symbol);
                PriceQuote quote = it->second.quote;
                quote.source = QuoteSource::CACHED;
                return quote;
            }
            DEBUG("Cache entry expired for " << symbol);
        }
    }

    DEBUG("Cache miss for " << symbol);
    auto fetched = adapter_->fetch_quote(symbol);
    if (fetched.is_error()) {
        return make_error<PriceQuote>(fetched.error()->code(), fetched.error()->what(),
                                      kComponent);
    }

    const PriceQuote& quote = fetched.value();
    if (quote.source == QuoteSource::LIVE) {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_[symbol] = Entry{quote, adapter_->clock().now()};
    }
    return quote;
}

Result<PriceSeries> PriceCache::get_history(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = histories_.find(symbol);
        if (it != histories_.end() && is_fresh(it->second.fetched_at)) {
            return it->second.series;
        }
    }

    auto fetched = adapter_->get_history(symbol);
    if (fetched.is_error()) {
        return make_error<PriceSeries>(fetched.error()->code(), fetched.error()->what(),
                                       kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    histories_[symbol] = HistoryEntry{fetched.value(), adapter_->clock().now()};
    return fetched.value();
}

Result<RefreshReport> PriceCache::refresh(const std::vector<std::string>& symbols,
                                          const CancellationToken& token) {
    RefreshReport report;
    std::unordered_map<std::string, Entry> staged;
    std::set<std::string> seen;

    INFO("Refreshing prices for " << symbols.size() << " symbol(s)");

    for (const auto& symbol : symbols) {
        if (!seen.insert(symbol).second) {
            continue;
        }

        if (token.is_cancelled()) {
            WARN("Price refresh cancelled; keeping previous cache contents");
            return make_error<RefreshReport>(ErrorCode::OPERATION_CANCELLED,
                                             "Refresh cancelled before " + symbol, kComponent);
        }

        auto fetched = adapter_->fetch_quote(symbol, &token);
        if (fetched.is_error()) {
            if (fetched.error()->code() == ErrorCode::OPERATION_CANCELLED) {
                WARN("Price refresh cancelled; keeping previous cache contents");
                return make_error<RefreshReport>(ErrorCode::OPERATION_CANCELLED,
                                                 fetched.error()->what(), kComponent);
            }
            report.failures.emplace_back(symbol, fetched.error()->code(), fetched.error()->what());
            continue;
        }

        const PriceQuote& quote = fetched.value();
        if (quote.source == QuoteSource::LIVE) {
            staged[symbol] = Entry{quote, adapter_->clock().now()};
            report.refreshed.push_back(symbol);
        } else {
            report.stale.push_back(symbol);
        }
    }

    if (token.is_cancelled()) {
        WARN("Price refresh cancelled; keeping previous cache contents");
        return make_error<RefreshReport>(ErrorCode::OPERATION_CANCELLED,
                                         "Refresh cancelled before commit", kComponent);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_.swap(staged);
        histories_.clear();
    }

    INFO("Price refresh complete: " << report.refreshed.size() << " live, "
                                    << report.stale.size() << " stale, "
                                    << report.failures.size() << " unavailable");
    return report;
}

void PriceCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    quotes_.clear();
    histories_.clear();
}

size_t PriceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.size();
}

std::optional<PriceQuote> PriceCache::peek(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(symbol);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second.quote;
}

}  // namespace folio
