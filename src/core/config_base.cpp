// src/core/config_base.cpp
#include "hedge_ngin/core/config_base.hpp"
#include <iomanip>

namespace hedge_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot write settings to " + filepath, "ConfigBase");
        }
        file << std::setw(4) << to_json() << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Saving settings to " + filepath + " failed: " + e.what(),
                                "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "No settings file at " + filepath,
                                "ConfigBase");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid JSON in " + filepath + ": " + e.what(), "ConfigBase");
    }

    // from_json implementations look keys up with contains(), which is silently false on
    // arrays and scalars
    if (!j.is_object()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Settings file " + filepath + " must hold a JSON object",
                                "ConfigBase");
    }

    try {
        from_json(j);
        return Result<void>();
    } catch (const nlohmann::json::type_error& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Mistyped setting in " + filepath + ": " + e.what(),
                                "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Loading settings from " + filepath + " failed: " + e.what(),
                                "ConfigBase");
    }
}

}  // namespace hedge_ngin
