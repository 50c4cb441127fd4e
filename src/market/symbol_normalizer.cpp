#include "folio/market/symbol_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace folio {

nlohmann::json SymbolConfig::to_json() const {
    nlohmann::json j;
    j["quote_suffix"] = quote_suffix;
    j["crypto_roots"] = crypto_roots;
    j["overrides"] = overrides;
    return j;
}

void SymbolConfig::from_json(const nlohmann::json& j) {
    if (j.contains("quote_suffix"))
        quote_suffix = j.at("quote_suffix").get<std::string>();
    if (j.contains("crypto_roots"))
        crypto_roots = j.at("crypto_roots").get<std::vector<std::string>>();
    if (j.contains("overrides"))
        overrides = j.at("overrides").get<std::map<std::string, std::string>>();
}

SymbolNormalizer::SymbolNormalizer() : SymbolNormalizer(SymbolConfig()) {}

SymbolNormalizer::SymbolNormalizer(const SymbolConfig& config) : config_(config) {
    for (const auto& root : config_.crypto_roots) {
        std::string key = clean(root);
        if (!key.empty()) {
            crypto_roots_.insert(key);
        }
    }

    for (const auto& [alias, canonical] : config_.overrides) {
        std::string key = clean(alias);
        std::string value = clean(canonical);
        if (!key.empty() && !value.empty()) {
            overrides_[key] = resolve(value);
        }
    }
}

std::string SymbolNormalizer::clean(const std::string& raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto first = std::find_if_not(raw.begin(), raw.end(), is_space);
    auto last = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
    if (first >= last) {
        return "";
    }

    std::string out(first, last);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string SymbolNormalizer::resolve(const std::string& ticker) const {
    if (crypto_roots_.count(ticker) > 0) {
        return ticker + clean(config_.quote_suffix);
    }
    return ticker;
}

std::string SymbolNormalizer::normalize(const std::string& raw) const {
    std::string ticker = clean(raw);

    auto override_it = overrides_.find(ticker);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    return resolve(ticker);
}

bool SymbolNormalizer::is_aliased(const std::string& raw) const {
    std::string ticker = clean(raw);
    return normalize(ticker) != ticker;
}

}  // namespace folio
