// include/divcap/core/config_base.hpp
#pragma once

#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>
#include "divcap/core/error.hpp"

namespace divcap {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file
     *
     * Parse errors map to JSON_PARSE_ERROR, schema violations raised by
     * from_json keep their own code (INVALID_CONFIG).
     *
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from
     * @throws BacktestError on schema violations
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

namespace config {

/**
 * @brief Check that a JSON section is an object holding exactly the given keys
 *
 * @param j Section to check
 * @param section Dotted section name used in error messages
 * @param keys Required keys; any other key is rejected
 * @throws BacktestError with INVALID_CONFIG on the first violation
 */
void require_exact_keys(const nlohmann::json& j, const std::string& section,
                        std::initializer_list<const char*> keys);

/**
 * @brief Read a typed field, converting type errors to INVALID_CONFIG
 */
template <typename T>
T get_field(const nlohmann::json& j, const std::string& section, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw BacktestError(ErrorCode::INVALID_CONFIG,
                            "Invalid value for '" + section + "." + key + "': " + e.what(),
                            "ConfigBase");
    }
}

}  // namespace config

}  // namespace divcap
