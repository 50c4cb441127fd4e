#include "folio/market/http_price_provider.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include "folio/core/logger.hpp"

namespace folio {

namespace {

const char* kComponent = "HttpPriceProvider";

bool is_usable_price(double price) {
    return std::isfinite(price) && price > 0.0;
}

/**
 * @brief Locate chart.result[0], or report the provider's own error
 */
Result<nlohmann::json> chart_result(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::API_ERROR,
                                          std::string("Malformed chart response: ") + e.what(),
                                          kComponent);
    }

    if (!j.contains("chart") || !j["chart"].is_object()) {
        return make_error<nlohmann::json>(ErrorCode::API_ERROR, "Response has no chart object",
                                          kComponent);
    }

    const auto& chart = j["chart"];
    if (chart.contains("error") && !chart["error"].is_null()) {
        std::string description = "unknown provider error";
        if (chart["error"].is_object()) {
            description = chart["error"].value("description", description);
        }
        return make_error<nlohmann::json>(ErrorCode::API_ERROR, description, kComponent);
    }

    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        return make_error<nlohmann::json>(ErrorCode::DATA_NOT_FOUND, "Chart result is empty",
                                          kComponent);
    }

    return nlohmann::json(chart["result"][0]);
}

}  // namespace

HttpPriceProvider::HttpPriceProvider(ProviderConfig config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpPriceProvider::~HttpPriceProvider() {
    curl_global_cleanup();
}

size_t HttpPriceProvider::write_callback(void* contents, size_t size, size_t nmemb,
                                         std::string* body) {
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<std::string> HttpPriceProvider::get_chart(const std::string& symbol,
                                                 const std::string& query) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                       kComponent);
    }

    char* escaped = curl_easy_escape(curl, symbol.c_str(), static_cast<int>(symbol.size()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Failed to escape symbol " + symbol, kComponent);
    }
    std::string url = config_.base_url + "/v8/finance/chart/" + escaped + "?" + query;
    curl_free(escaped);

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, HttpPriceProvider::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<std::string>(ErrorCode::TIMEOUT_ERROR,
                                       "Request timed out for " + symbol, kComponent);
    }
    if (res != CURLE_OK) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR,
                                       "CURL error: " + std::string(curl_easy_strerror(res)),
                                       kComponent);
    }

    DEBUG("GET " << url << " -> HTTP " << status << " (" << body.size() << " bytes)");

    if (status == 429 || status >= 500) {
        return make_error<std::string>(ErrorCode::PROVIDER_TRANSIENT_ERROR,
                                       "Provider returned HTTP " + std::to_string(status),
                                       kComponent);
    }
    if (status >= 400) {
        // Chart errors come with a JSON description worth surfacing
        auto described = chart_result(body);
        std::string reason = described.is_error() ? described.error()->what()
                                                  : "HTTP " + std::to_string(status);
        return make_error<std::string>(ErrorCode::API_ERROR, reason, kComponent);
    }

    return body;
}

Result<PricePoint> HttpPriceProvider::fetch_latest(const std::string& symbol) {
    auto body = get_chart(symbol, "range=5d&interval=1d");
    if (body.is_error()) {
        return make_error<PricePoint>(body.error()->code(), body.error()->what(), kComponent);
    }
    return parse_latest(body.value());
}

Result<std::vector<PricePoint>> HttpPriceProvider::fetch_history(const std::string& symbol,
                                                                 const Timestamp& from,
                                                                 const Timestamp& to) {
    auto period1 = std::chrono::duration_cast<std::chrono::seconds>(from.time_since_epoch()).count();
    auto period2 = std::chrono::duration_cast<std::chrono::seconds>(to.time_since_epoch()).count();

    auto body = get_chart(symbol, "period1=" + std::to_string(period1) +
                                      "&period2=" + std::to_string(period2) + "&interval=1d");
    if (body.is_error()) {
        return make_error<std::vector<PricePoint>>(body.error()->code(), body.error()->what(),
                                                   kComponent);
    }
    return parse_history(body.value());
}

Result<PricePoint> HttpPriceProvider::parse_latest(const std::string& body) {
    auto result = chart_result(body);
    if (result.is_error()) {
        return make_error<PricePoint>(result.error()->code(), result.error()->what(), kComponent);
    }

    const auto& chart = result.value();
    if (chart.contains("meta") && chart["meta"].is_object()) {
        const auto& meta = chart["meta"];
        if (meta.contains("regularMarketPrice") && meta["regularMarketPrice"].is_number() &&
            meta.contains("regularMarketTime") && meta["regularMarketTime"].is_number()) {
            double price = meta["regularMarketPrice"].get<double>();
            if (is_usable_price(price)) {
                Timestamp ts{std::chrono::seconds(meta["regularMarketTime"].get<long long>())};
                return PricePoint(ts, price);
            }
        }
    }

    auto history = parse_history(body);
    if (history.is_error()) {
        return make_error<PricePoint>(history.error()->code(), history.error()->what(),
                                      kComponent);
    }
    return history.value().back();
}

Result<std::vector<PricePoint>> HttpPriceProvider::parse_history(const std::string& body) {
    auto result = chart_result(body);
    if (result.is_error()) {
        return make_error<std::vector<PricePoint>>(result.error()->code(), result.error()->what(),
                                                   kComponent);
    }

    const auto& chart = result.value();
    std::vector<PricePoint> points;

    try {
        if (!chart.contains("timestamp") || !chart.contains("indicators")) {
            return make_error<std::vector<PricePoint>>(ErrorCode::DATA_NOT_FOUND,
                                                       "Chart has no price series", kComponent);
        }

        const auto& timestamps = chart.at("timestamp");
        const auto& closes = chart.at("indicators").at("quote").at(0).at("close");
        size_t n = std::min(timestamps.size(), closes.size());
        points.reserve(n);

        for (size_t i = 0; i < n; ++i) {
            if (!closes[i].is_number() || !timestamps[i].is_number()) {
                continue;
            }
            double price = closes[i].get<double>();
            if (!is_usable_price(price)) {
                continue;
            }
            points.emplace_back(Timestamp{std::chrono::seconds(timestamps[i].get<long long>())},
                                price);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::vector<PricePoint>>(
            ErrorCode::API_ERROR, std::string("Unexpected chart layout: ") + e.what(), kComponent);
    }

    if (points.empty()) {
        return make_error<std::vector<PricePoint>>(ErrorCode::DATA_NOT_FOUND,
                                                   "Chart contains no usable prices", kComponent);
    }
    return points;
}

}  // namespace folio
