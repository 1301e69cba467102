// include/hedge_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "hedge_ngin/core/error.hpp"

namespace hedge_ngin {

/**
 * @brief JSON-backed settings section
 *
 * Engine, risk, aggregator, stream and session settings all derive from this. A section's
 * from_json reads only the keys present, so a partial file keeps the defaults of every
 * other field.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to a file, indented
     * @return FILE_IO_ERROR if the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a JSON object from a file and apply it through from_json()
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR for malformed text, or INVALID_ARGUMENT
     * when the document is not an object or a known key holds the wrong type
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Apply the keys present in `j`
     * @throws nlohmann::json::type_error on a mistyped value
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace hedge_ngin
