#include "folio/market/price_source_adapter.hpp"

#include <algorithm>
#include <cmath>
#include <vector>
#include "folio/core/logger.hpp"

namespace folio {

namespace {

const char* kComponent = "PriceSourceAdapter";

bool is_usable_price(double price) {
    return std::isfinite(price) && price > 0.0;
}

}  // namespace

PriceSourceAdapter::PriceSourceAdapter(std::shared_ptr<PriceProvider> provider,
                                       PricingConfig config,
                                       std::shared_ptr<const Clock> clock, Sleeper sleeper)
    : provider_(std::move(provider)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
    if (!provider_) {
        throw std::invalid_argument("PriceSourceAdapter requires a provider");
    }
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
    if (!sleeper_) {
        sleeper_ = make_thread_sleeper();
    }
    if (config_.max_attempts < 1) {
        config_.max_attempts = 1;
    }
}

bool PriceSourceAdapter::is_transient(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_ERROR:
        case ErrorCode::TIMEOUT_ERROR:
        case ErrorCode::DATA_NOT_FOUND:
        case ErrorCode::PROVIDER_TRANSIENT_ERROR:
            return true;
        default:
            return false;
    }
}

template <typename T, typename Fetch>
Result<T> PriceSourceAdapter::with_retry(const std::string& symbol, const char* what,
                                         const CancellationToken* token, Fetch&& fetch) {
    RetryState state;
    state.next_backoff = std::chrono::milliseconds(config_.initial_backoff_ms);

    while (state.attempt < config_.max_attempts) {
        if (token && token->is_cancelled()) {
            return make_error<T>(ErrorCode::OPERATION_CANCELLED,
                                 std::string("Cancelled while fetching ") + what + " for " + symbol,
                                 kComponent);
        }

        ++state.attempt;

        try {
            Result<T> result = fetch();
            if (result.is_ok()) {
                if (state.attempt > 1) {
                    INFO("Fetched " << what << " for " << symbol << " on attempt "
                                    << state.attempt);
                }
                return result;
            }
            state.last_code = result.error()->code();
            state.last_reason = result.error()->what();
        } catch (const std::exception& e) {
            state.last_code = ErrorCode::PROVIDER_TRANSIENT_ERROR;
            state.last_reason = std::string("provider threw: ") + e.what();
        }

        if (!is_transient(state.last_code)) {
            WARN("Provider rejected " << what << " request for " << symbol << ": "
                                      << state.last_reason << " ("
                                      << error_code_to_string(state.last_code) << ")");
            break;
        }

        if (state.attempt < config_.max_attempts) {
            WARN("Attempt " << state.attempt << "/" << config_.max_attempts << " for " << what
                            << " of " << symbol << " failed: " << state.last_reason
                            << "; retrying in " << state.next_backoff.count() << "ms");
            sleeper_(state.next_backoff);

            auto grown = static_cast<long>(static_cast<double>(state.next_backoff.count()) *
                                           config_.backoff_multiplier);
            state.next_backoff = std::chrono::milliseconds(std::min(grown, config_.max_backoff_ms));
        }
    }

    return make_error<T>(state.last_code,
                         std::string(what) + " for " + symbol + " failed after " +
                             std::to_string(state.attempt) + " attempt(s): " + state.last_reason,
                         kComponent);
}

Result<PriceQuote> PriceSourceAdapter::fetch_quote(const std::string& symbol,
                                                   const CancellationToken* token) {
    if (symbol.empty()) {
        return make_error<PriceQuote>(ErrorCode::PRICE_UNAVAILABLE, "Empty symbol", kComponent);
    }

    auto point = with_retry<PricePoint>(symbol, "quote", token, [&]() -> Result<PricePoint> {
        auto latest = provider_->fetch_latest(symbol);
        if (latest.is_ok() && !is_usable_price(latest.value().price)) {
            return make_error<PricePoint>(ErrorCode::DATA_NOT_FOUND,
                                          "Provider returned an unusable price", kComponent);
        }
        return latest;
    });

    if (point.is_ok()) {
        PriceQuote quote(symbol, point.value().price, point.value().timestamp, QuoteSource::LIVE);
        remember(quote);
        return quote;
    }

    if (point.error()->code() == ErrorCode::OPERATION_CANCELLED) {
        return make_error<PriceQuote>(ErrorCode::OPERATION_CANCELLED, point.error()->what(),
                                      kComponent);
    }

    auto fallback = stale_fallback(symbol);
    if (fallback) {
        WARN("Serving stale quote for " << symbol << " at " << fallback->price << ": "
                                        << point.error()->what());
        return *fallback;
    }

    return make_error<PriceQuote>(ErrorCode::PRICE_UNAVAILABLE, point.error()->what(),
                                  kComponent);
}

Result<PriceSeries> PriceSourceAdapter::fetch_history(const std::string& symbol,
                                                      int lookback_days,
                                                      const CancellationToken* token) {
    if (symbol.empty() || lookback_days <= 0) {
        return make_error<PriceSeries>(ErrorCode::PRICE_UNAVAILABLE,
                                       "History needs a symbol and a positive window", kComponent);
    }

    const Timestamp to = clock_->now();
    const Timestamp from = to - std::chrono::hours(24 * lookback_days);

    auto points = with_retry<std::vector<PricePoint>>(
        symbol, "history", token, [&]() -> Result<std::vector<PricePoint>> {
            auto raw = provider_->fetch_history(symbol, from, to);
            if (raw.is_error()) {
                return raw;
            }

            std::vector<PricePoint> usable;
            usable.reserve(raw.value().size());
            for (const auto& p : raw.value()) {
                if (is_usable_price(p.price)) {
                    usable.push_back(p);
                }
            }
            if (usable.empty()) {
                return make_error<std::vector<PricePoint>>(ErrorCode::DATA_NOT_FOUND,
                                                           "Provider returned no usable history",
                                                           kComponent);
            }
            return usable;
        });

    if (points.is_error()) {
        ErrorCode code = points.error()->code() == ErrorCode::OPERATION_CANCELLED
                             ? ErrorCode::OPERATION_CANCELLED
                             : ErrorCode::PRICE_UNAVAILABLE;
        return make_error<PriceSeries>(code, points.error()->what(), kComponent);
    }

    return PriceSeries(symbol, points.value());
}

void PriceSourceAdapter::remember(const PriceQuote& quote) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_known_[quote.symbol] = KnownQuote{quote, clock_->now()};
}

std::optional<PriceQuote> PriceSourceAdapter::stale_fallback(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_known_.find(symbol);
    if (it == last_known_.end()) {
        return std::nullopt;
    }

    auto age = clock_->now() - it->second.fetched_at;
    if (age > std::chrono::seconds(config_.max_staleness_seconds)) {
        return std::nullopt;
    }

    PriceQuote quote = it->second.quote;
    quote.source = QuoteSource::STALE_FALLBACK;
    return quote;
}

}  // namespace folio
