// src/core/holiday_checker.cpp
#include "divcap/core/holiday_checker.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include "divcap/core/time_utils.hpp"

namespace divcap {

HolidayChecker::HolidayChecker(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

Result<void> HolidayChecker::load(const std::string& json_path) {
    std::ifstream file(json_path);
    if (!file.is_open()) {
        ERROR(logger_, "Could not open holidays file: " << json_path);
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Could not open holidays file: " + json_path, "HolidayChecker");
    }

    std::map<std::string, HolidayInfo> loaded;
    try {
        nlohmann::json j;
        file >> j;

        for (auto& [year, holidays_array] : j.items()) {
            for (auto& holiday : holidays_array) {
                HolidayInfo info;
                info.date = holiday.at("date").get<std::string>();
                info.name = holiday.at("name").get<std::string>();
                info.type = holiday.value("type", std::string("exchange"));
                info.note = holiday.value("note", std::string());

                if (!core::parse_date(info.date)) {
                    return make_error<void>(ErrorCode::INVALID_DATA,
                                            "Invalid holiday date '" + info.date + "' in year " +
                                                year,
                                            "HolidayChecker");
                }
                loaded[info.date] = info;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        ERROR(logger_, "Exception loading holidays: " << e.what());
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error parsing holidays file: ") + e.what(),
                                "HolidayChecker");
    }

    holidays_ = std::move(loaded);
    INFO(logger_, "Loaded " << holidays_.size() << " holidays from " << json_path);
    return Result<void>();
}

std::optional<HolidayInfo> HolidayChecker::get_holiday_info(const std::string& date) const {
    auto it = holidays_.find(date);
    if (it != holidays_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<Timestamp> HolidayChecker::holiday_dates() const {
    std::vector<Timestamp> dates;
    dates.reserve(holidays_.size());
    // keys are ISO dates, so map order is chronological
    for (const auto& [date, info] : holidays_) {
        auto parsed = core::parse_date(date);
        if (parsed) {
            dates.push_back(*parsed);
        }
    }
    return dates;
}

}  // namespace divcap
