// include/folio/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "folio/analytics/metrics_config.hpp"
#include "folio/analytics/portfolio_report.hpp"
#include "folio/core/error.hpp"
#include "folio/core/logger.hpp"
#include "folio/market/pricing_config.hpp"
#include "folio/market/symbol_normalizer.hpp"

namespace folio {

/**
 * @brief Complete application configuration, one member per JSON section
 */
struct AppConfig {
    LoggerConfig logger;
    SymbolConfig symbols;
    PricingConfig pricing;
    MetricsConfig metrics;
    ReportConfig report;

    nlohmann::json to_json() const;
};

/**
 * @brief Loads layered JSON configuration
 *
 * A defaults file is deep-merged with an optional overrides file: nested
 * objects merge key by key, any other value in the overrides replaces the
 * default. Sections that are absent keep their compiled-in defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Load a single configuration file
     */
    static Result<AppConfig> load(const std::filesystem::path& config_path);

    /**
     * @brief Load defaults, then deep-merge overrides on top
     * @param overrides_path May name a missing file, in which case only defaults apply
     */
    static Result<AppConfig> load(const std::filesystem::path& defaults_path,
                                  const std::filesystem::path& overrides_path);

    /**
     * @brief Build a config from an already merged JSON document
     */
    static Result<AppConfig> from_json(const nlohmann::json& merged);

    /**
     * @brief Recursively merge source into target
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static Result<AppConfig> extract_config(const nlohmann::json& merged);
    static Result<void> validate_config(const AppConfig& config);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace folio
