// include/folio/market/symbol_normalizer.hpp

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "folio/core/config_base.hpp"

namespace folio {

/**
 * @brief Alias table consulted by the SymbolNormalizer
 *
 * Crypto roots are quoted against a fiat market by appending quote_suffix
 * (BTC -> BTC-USD). User overrides take precedence over the crypto table and
 * are the only part of this config that is user state.
 */
struct SymbolConfig : public ConfigBase {
    std::string quote_suffix{"-USD"};
    std::vector<std::string> crypto_roots{"BTC", "ETH", "XRP", "LTC", "ADA", "SOL", "DOGE", "SHIB"};
    std::map<std::string, std::string> overrides;  // alias -> canonical symbol

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Maps user-entered tickers to provider-resolvable symbols
 *
 * normalize() is total and deterministic: input is trimmed and uppercased,
 * then looked up in the override table, then the crypto table; anything
 * unknown passes through in its trimmed uppercase form.
 */
class SymbolNormalizer {
public:
    SymbolNormalizer();
    explicit SymbolNormalizer(const SymbolConfig& config);

    std::string normalize(const std::string& raw) const;

    /**
     * @brief Whether normalize() would rewrite the cleaned ticker
     */
    bool is_aliased(const std::string& raw) const;

    const SymbolConfig& config() const {
        return config_;
    }

private:
    static std::string clean(const std::string& raw);

    // Crypto-suffix rule on an already cleaned ticker
    std::string resolve(const std::string& ticker) const;

    SymbolConfig config_;
    std::map<std::string, std::string> overrides_;  // cleaned keys, resolved values
    std::set<std::string> crypto_roots_;
};

}  // namespace folio
