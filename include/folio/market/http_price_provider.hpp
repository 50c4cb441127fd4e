// include/folio/market/http_price_provider.hpp

#pragma once

#include <string>
#include <vector>
#include "folio/market/price_provider.hpp"
#include "folio/market/pricing_config.hpp"

namespace folio {

/**
 * @brief PriceProvider backed by a Yahoo-chart-compatible REST endpoint
 *
 * Requests GET {base_url}/v8/finance/chart/{symbol} through libcurl and
 * reads the JSON body with nlohmann::json.
 */
class HttpPriceProvider : public PriceProvider {
public:
    /**
     * @brief Constructs the provider and initializes libcurl globally
     * @param config Endpoint, timeout and user agent
     */
    explicit HttpPriceProvider(ProviderConfig config);

    /**
     * @brief Releases libcurl global state
     */
    ~HttpPriceProvider() override;

    HttpPriceProvider(const HttpPriceProvider&) = delete;
    HttpPriceProvider& operator=(const HttpPriceProvider&) = delete;

    Result<PricePoint> fetch_latest(const std::string& symbol) override;

    Result<std::vector<PricePoint>> fetch_history(const std::string& symbol, const Timestamp& from,
                                                  const Timestamp& to) override;

    /**
     * @brief Extract the latest price from a chart response body
     *
     * Uses meta.regularMarketPrice when present, otherwise the last non-null
     * close of the series.
     */
    static Result<PricePoint> parse_latest(const std::string& body);

    /**
     * @brief Extract (timestamp, close) pairs from a chart response body
     *
     * Null closes and non-positive prices are dropped.
     */
    static Result<std::vector<PricePoint>> parse_history(const std::string& body);

private:
    /**
     * @brief Perform a GET against the chart endpoint
     * @param symbol Symbol, URL-escaped before use
     * @param query Query string without the leading '?'
     * @return Response body, or a transport error code
     */
    Result<std::string> get_chart(const std::string& symbol, const std::string& query);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* body);

    ProviderConfig config_;
};

}  // namespace folio
