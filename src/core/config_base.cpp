#include "folio/core/config_base.hpp"

#include <filesystem>
#include <iomanip>

namespace folio {

namespace {
const char* kComponent = "ConfigBase";
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    // Staged next to the target and renamed into place; a failed save leaves
    // the previous file intact
    const std::filesystem::path target(filepath);
    std::filesystem::path staging = target;
    staging += ".tmp";

    try {
        nlohmann::json j = to_json();
        {
            std::ofstream file(staging);
            if (!file.is_open()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open file for writing: " + staging.string(),
                                        kComponent);
            }
            file << std::setw(4) << j << std::endl;
            if (!file) {
                std::error_code ec;
                std::filesystem::remove(staging, ec);
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to write config: " + staging.string(), kComponent);
            }
        }

        std::error_code ec;
        std::filesystem::rename(staging, target, ec);
        if (ec) {
            std::filesystem::remove(staging, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to replace " + filepath + ": " + ec.message(),
                                    kComponent);
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving config: ") + e.what(), kComponent);
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, kComponent);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Error parsing " + filepath + ": " + e.what(), kComponent);
    }

    if (!j.is_object()) {
        return make_error<void>(ErrorCode::INVALID_DATA, filepath + " must contain a JSON object",
                                kComponent);
    }

    try {
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Invalid value in " + filepath + ": " + e.what(), kComponent);
    }
    return Result<void>();
}

}  // namespace folio
