// include/folio/market/quote_provider.hpp

#pragma once

#include <string>
#include "folio/core/error.hpp"
#include "folio/core/types.hpp"
#include "folio/market/price_series.hpp"

namespace folio {

/**
 * @brief A symbol whose price could not be resolved
 */
struct PriceGap {
    std::string symbol;
    ErrorCode code{ErrorCode::PRICE_UNAVAILABLE};
    std::string reason;

    PriceGap() = default;
    PriceGap(std::string sym, ErrorCode c, std::string why)
        : symbol(std::move(sym)), code(c), reason(std::move(why)) {}
};

/**
 * @brief Normalized quote and history access consumed by the metrics layer
 *
 * Failures carry PRICE_UNAVAILABLE (or OPERATION_CANCELLED); provider
 * specific error shapes never cross this interface.
 */
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    virtual Result<PriceQuote> get_quote(const std::string& symbol) = 0;

    /**
     * @brief Recent history over the configured lookback window
     */
    virtual Result<PriceSeries> get_history(const std::string& symbol) = 0;
};

}  // namespace folio
