// include/divcap/core/holiday_checker.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "divcap/core/error.hpp"
#include "divcap/core/logger.hpp"
#include "divcap/core/types.hpp"

namespace divcap {

/**
 * @brief Holiday information structure
 */
struct HolidayInfo {
    std::string date;
    std::string name;
    std::string type;
    std::string note;
};

/**
 * @brief Exchange holiday list loaded from JSON
 *
 * Supplements the rule-based national holidays with exchange closures that
 * no rule can derive. The file maps years to arrays of
 * {"date": "YYYY-MM-DD", "name": ..., "type": ..., "note": ...}.
 */
class HolidayChecker {
public:
    explicit HolidayChecker(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Load holidays from a JSON file, replacing any previously loaded set
     * @param json_path Path to the holidays file
     * @return Result indicating success or failure
     */
    Result<void> load(const std::string& json_path);

    /**
     * @brief Check if a date is a listed holiday
     * @param date Date string in format "YYYY-MM-DD"
     */
    bool is_holiday(const std::string& date) const {
        return holidays_.find(date) != holidays_.end();
    }

    std::optional<HolidayInfo> get_holiday_info(const std::string& date) const;

    size_t size() const {
        return holidays_.size();
    }

    /**
     * @brief All listed holidays as trading dates, ascending
     */
    std::vector<Timestamp> holiday_dates() const;

private:
    std::shared_ptr<Logger> logger_;
    std::map<std::string, HolidayInfo> holidays_;
};

}  // namespace divcap
