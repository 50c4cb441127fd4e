// include/folio/core/types.hpp

#pragma once

#include <chrono>
#include <string>

namespace folio {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for holdings
 * Double to support fractional quantities (crypto, fractional shares)
 */
using Quantity = double;

/**
 * @brief Transaction side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "buy";
        case Side::SELL:
            return "sell";
        default:
            return "none";
    }
}

/**
 * @brief Where a quote came from
 */
enum class QuoteSource {
    LIVE,           // Fetched from the provider during this call
    CACHED,         // Served from the price cache within its TTL
    STALE_FALLBACK  // Provider failed, last known quote within the staleness window
};

inline std::string quote_source_to_string(QuoteSource source) {
    switch (source) {
        case QuoteSource::LIVE:
            return "live";
        case QuoteSource::CACHED:
            return "cached";
        case QuoteSource::STALE_FALLBACK:
            return "stale-fallback";
        default:
            return "unknown";
    }
}

/**
 * @brief Single price observation
 */
struct PricePoint {
    Timestamp timestamp;
    Price price{0.0};

    PricePoint() = default;
    PricePoint(Timestamp ts, Price p) : timestamp(ts), price(p) {}
};

/**
 * @brief Normalized quote handed out by the pricing layer
 */
struct PriceQuote {
    std::string symbol;
    Price price{0.0};
    Timestamp as_of;
    QuoteSource source{QuoteSource::LIVE};

    PriceQuote() = default;
    PriceQuote(std::string sym, Price p, Timestamp ts, QuoteSource src)
        : symbol(std::move(sym)), price(p), as_of(ts), source(src) {}
};

}  // namespace folio
