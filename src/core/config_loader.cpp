// src/core/config_loader.cpp

#include "folio/core/config_loader.hpp"

#include <fstream>

namespace folio {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["logging"] = logger.to_json();
    j["symbols"] = symbols.to_json();
    j["pricing"] = pricing.to_json();
    j["metrics"] = metrics.to_json();
    j["report"] = report.to_json();
    return j;
}

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            return make_error<nlohmann::json>(
                ErrorCode::INVALID_DATA,
                "Config file " + file_path.string() + " must contain a JSON object",
                "ConfigLoader");
        }
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    try {
        AppConfig config;

        if (merged.contains("logging")) {
            config.logger.from_json(merged.at("logging"));
        }
        if (merged.contains("symbols")) {
            config.symbols.from_json(merged.at("symbols"));
        }
        if (merged.contains("pricing")) {
            config.pricing.from_json(merged.at("pricing"));
        }
        if (merged.contains("metrics")) {
            config.metrics.from_json(merged.at("metrics"));
        }
        if (merged.contains("report")) {
            config.report.from_json(merged.at("report"));
        }

        return config;

    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    auto pricing_result = config.pricing.validate();
    if (pricing_result.is_error()) {
        return pricing_result;
    }

    auto metrics_result = config.metrics.validate();
    if (metrics_result.is_error()) {
        return metrics_result;
    }

    if (config.report.best_count == 0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "report.best_count must be positive",
                                "ConfigLoader");
    }
    if (config.logger.max_files == 0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "logging.max_files must be positive",
                                "ConfigLoader");
    }
    return Result<void>();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    INFO("Configuration loaded: provider=" << config.pricing.provider.base_url
                                           << ", attempts=" << config.pricing.max_attempts
                                           << ", cache_ttl=" << config.pricing.cache_ttl_seconds
                                           << "s, window=" << config.metrics.volatility_window
                                           << ", aliases=" << config.symbols.overrides.size());
}

Result<AppConfig> ConfigLoader::from_json(const nlohmann::json& merged) {
    auto config_result = extract_config(merged);
    if (config_result.is_error()) {
        return config_result;
    }

    auto validation = validate_config(config_result.value());
    if (validation.is_error()) {
        return make_error<AppConfig>(validation.error()->code(), validation.error()->what(),
                                     "ConfigLoader");
    }
    return config_result;
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_path) {
    auto json_result = load_json_file(config_path);
    if (json_result.is_error()) {
        return make_error<AppConfig>(json_result.error()->code(), json_result.error()->what(),
                                     "ConfigLoader");
    }

    auto config_result = from_json(json_result.value());
    if (config_result.is_ok()) {
        log_config_summary(config_result.value());
    }
    return config_result;
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& defaults_path,
                                     const std::filesystem::path& overrides_path) {
    auto defaults_result = load_json_file(defaults_path);
    if (defaults_result.is_error()) {
        return make_error<AppConfig>(defaults_result.error()->code(),
                                     defaults_result.error()->what(), "ConfigLoader");
    }

    nlohmann::json merged = defaults_result.value();

    if (std::filesystem::exists(overrides_path)) {
        auto overrides_result = load_json_file(overrides_path);
        if (overrides_result.is_error()) {
            return make_error<AppConfig>(overrides_result.error()->code(),
                                         overrides_result.error()->what(), "ConfigLoader");
        }
        merge_json(merged, overrides_result.value());
    } else {
        DEBUG("No overrides at " << overrides_path.string() << ", using defaults only");
    }

    auto config_result = from_json(merged);
    if (config_result.is_ok()) {
        log_config_summary(config_result.value());
    }
    return config_result;
}

}  // namespace folio
