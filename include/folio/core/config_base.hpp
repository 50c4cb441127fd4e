// include/folio/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "folio/core/error.hpp"

namespace folio {

/**
 * @brief Base class for all configuration sections
 * Provides common JSON file round-tripping
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file, replacing it atomically
     * @param filepath Path to save the file
     * @return Result indicating success, or FILE_IO_ERROR
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or INVALID_DATA on failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace folio
