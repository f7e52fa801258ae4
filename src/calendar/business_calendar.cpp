// src/calendar/business_calendar.cpp
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/calendar/japanese_holidays.hpp"
#include <utility>
#include "divcap/core/time_utils.hpp"

namespace divcap {

BusinessCalendar::BusinessCalendar(const std::vector<Timestamp>& additional_holidays) {
    for (const auto& date : additional_holidays) {
        additional_holidays_.insert(core::to_date(date));
    }
}

bool BusinessCalendar::is_year_end_closure(const Timestamp& date) const {
    core::CivilDate c = core::to_civil(date);
    return (c.month == 12 && c.day == 31) || (c.month == 1 && c.day <= 3);
}

const std::map<Timestamp, std::string>& BusinessCalendar::national_holidays(int year) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = national_cache_.find(year);
    if (it == national_cache_.end()) {
        it = national_cache_.emplace(year, calendar::japanese_holidays(year)).first;
    }
    // std::map nodes are stable, so the reference outlives later insertions
    return it->second;
}

bool BusinessCalendar::is_holiday(const Timestamp& date) const {
    Timestamp day = core::to_date(date);
    if (additional_holidays_.count(day) != 0) {
        return true;
    }
    return national_holidays(core::to_civil(day).year).count(day) != 0;
}

std::optional<std::string> BusinessCalendar::holiday_name(const Timestamp& date) const {
    Timestamp day = core::to_date(date);
    const auto& national = national_holidays(core::to_civil(day).year);
    auto it = national.find(day);
    if (it != national.end()) {
        return it->second;
    }
    if (additional_holidays_.count(day) != 0) {
        return std::string("Exchange Holiday");
    }
    return std::nullopt;
}

bool BusinessCalendar::is_business_day(const Timestamp& date) const {
    unsigned dow = core::weekday(date);
    if (dow == 0 || dow == 6) {
        return false;
    }
    if (is_year_end_closure(date)) {
        return false;
    }
    return !is_holiday(date);
}

Timestamp BusinessCalendar::add_business_days(const Timestamp& date, int n) const {
    Timestamp current = core::to_date(date);
    const int step = n >= 0 ? 1 : -1;
    int remaining = n >= 0 ? n : -n;

    while (remaining > 0) {
        current = core::add_days(current, step);
        if (is_business_day(current)) {
            --remaining;
        }
    }
    return current;
}

int BusinessCalendar::business_days_between(const Timestamp& start, const Timestamp& end) const {
    Timestamp from = core::to_date(start);
    Timestamp to = core::to_date(end);
    if (from == to) {
        return 0;
    }

    int sign = 1;
    if (from > to) {
        std::swap(from, to);
        sign = -1;
    }

    int count = 0;
    Timestamp current = core::add_days(from, 1);
    while (current <= to) {
        if (is_business_day(current)) {
            ++count;
        }
        current = core::add_days(current, 1);
    }
    return sign * count;
}

Timestamp BusinessCalendar::roll_forward(const Timestamp& date) const {
    Timestamp current = core::to_date(date);
    while (!is_business_day(current)) {
        current = core::add_days(current, 1);
    }
    return current;
}

std::vector<Timestamp> BusinessCalendar::business_days(const Timestamp& start,
                                                       const Timestamp& end) const {
    std::vector<Timestamp> days;
    Timestamp current = core::to_date(start);
    Timestamp last = core::to_date(end);
    while (current <= last) {
        if (is_business_day(current)) {
            days.push_back(current);
        }
        current = core::add_days(current, 1);
    }
    return days;
}

}  // namespace divcap
