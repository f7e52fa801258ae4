// include/divcap/calendar/business_calendar.hpp
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "divcap/core/types.hpp"

namespace divcap {

/**
 * @brief Exchange business-day calendar and dividend date arithmetic
 *
 * A business day is a weekday that is neither a national holiday of Japan,
 * an additional exchange holiday, nor part of the year-end closure
 * (Dec 31 and Jan 1-3). All queries are const; the calendar never changes
 * after construction. National holidays are computed once per year and cached.
 */
class BusinessCalendar {
public:
    /// Business days between the ex-dividend date and the record date
    static constexpr int EX_TO_RECORD_DAYS = 2;

    BusinessCalendar() = default;

    /**
     * @brief Construct with exchange holidays on top of the national ones
     * @param additional_holidays Extra non-trading dates
     */
    explicit BusinessCalendar(const std::vector<Timestamp>& additional_holidays);

    bool is_business_day(const Timestamp& date) const;

    /**
     * @brief True for national or additional holidays (weekends excluded)
     */
    bool is_holiday(const Timestamp& date) const;

    std::optional<std::string> holiday_name(const Timestamp& date) const;

    /**
     * @brief True on Dec 31 and Jan 1-3
     */
    bool is_year_end_closure(const Timestamp& date) const;

    /**
     * @brief Move by a number of business days
     *
     * Walks one calendar day at a time in the sign of n and counts only
     * business days; n = 0 returns the date unchanged, even if it is not a
     * business day.
     *
     * @param date Starting date
     * @param n Signed number of business days
     * @return The date reached
     */
    Timestamp add_business_days(const Timestamp& date, int n) const;

    /**
     * @brief Signed count of business days in the half-open range (start, end]
     *
     * When start is after end the count of (end, start] is returned negated.
     */
    int business_days_between(const Timestamp& start, const Timestamp& end) const;

    /**
     * @brief The date itself if it is a business day, otherwise the next one
     */
    Timestamp roll_forward(const Timestamp& date) const;

    /**
     * @brief All business days in [start, end], ascending
     */
    std::vector<Timestamp> business_days(const Timestamp& start, const Timestamp& end) const;

    Timestamp record_date_from_ex_date(const Timestamp& ex_date) const {
        return add_business_days(ex_date, EX_TO_RECORD_DAYS);
    }

    Timestamp entry_date_from_record_date(const Timestamp& record_date, int days_before) const {
        return add_business_days(record_date, -days_before);
    }

    Timestamp ex_date_from_record_date(const Timestamp& record_date) const {
        return add_business_days(record_date, -EX_TO_RECORD_DAYS);
    }

private:
    const std::map<Timestamp, std::string>& national_holidays(int year) const;

    std::set<Timestamp> additional_holidays_;
    mutable std::map<int, std::map<Timestamp, std::string>> national_cache_;
    mutable std::mutex cache_mutex_;
};

}  // namespace divcap
