// include/folio/market/price_provider.hpp

#pragma once

#include <string>
#include <vector>
#include "folio/core/error.hpp"
#include "folio/core/types.hpp"

namespace folio {

/**
 * @brief External market data source
 *
 * Implementations report failures through Result with a transport-level
 * ErrorCode (CONNECTION_ERROR, TIMEOUT_ERROR, DATA_NOT_FOUND, API_ERROR).
 * Callers outside the pricing layer never see these codes; the
 * PriceSourceAdapter folds them into PRICE_UNAVAILABLE.
 */
class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    /**
     * @brief Most recent price for a provider-resolvable symbol
     */
    virtual Result<PricePoint> fetch_latest(const std::string& symbol) = 0;

    /**
     * @brief Price points between from and to, in any order
     */
    virtual Result<std::vector<PricePoint>> fetch_history(const std::string& symbol,
                                                          const Timestamp& from,
                                                          const Timestamp& to) = 0;
};

}  // namespace folio
