// src/core/config_base.cpp
#include "divcap/core/config_base.hpp"
#include <filesystem>
#include <iomanip>
#include <set>

namespace divcap {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    try {
        nlohmann::json j = to_json();
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + filepath, "ConfigBase");
        }
        file << std::setw(4) << j << std::endl;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error saving config: ") + e.what(), "ConfigBase");
    }
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for reading: " + filepath, "ConfigBase");
        }
        nlohmann::json j;
        file >> j;
        from_json(j);
        return Result<void>();
    } catch (const BacktestError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error parsing config: ") + e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
}

namespace config {

void require_exact_keys(const nlohmann::json& j, const std::string& section,
                        std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        throw BacktestError(ErrorCode::INVALID_CONFIG,
                            "Section '" + section + "' must be a JSON object", "ConfigBase");
    }

    std::set<std::string> allowed;
    for (const char* key : keys) {
        allowed.insert(key);
        if (!j.contains(key)) {
            throw BacktestError(ErrorCode::INVALID_CONFIG,
                                "Missing field '" + section + "." + key + "'", "ConfigBase");
        }
    }

    for (const auto& [key, value] : j.items()) {
        if (allowed.count(key) == 0) {
            throw BacktestError(ErrorCode::INVALID_CONFIG,
                                "Unknown field '" + section + "." + key + "'", "ConfigBase");
        }
    }
}

}  // namespace config

}  // namespace divcap
