// src/calendar/japanese_holidays.cpp
#include "divcap/calendar/japanese_holidays.hpp"
#include <cmath>
#include "divcap/core/time_utils.hpp"

namespace divcap {
namespace calendar {

namespace {

constexpr unsigned SUNDAY = 0;
constexpr unsigned MONDAY = 1;

// n-th Monday of a month, n starting at 1
Timestamp nth_monday(int year, unsigned month, unsigned n) {
    Timestamp first = core::make_date(year, month, 1);
    unsigned dow = core::weekday(first);
    unsigned offset = (MONDAY + 7 - dow) % 7;
    return core::add_days(first, offset + 7 * (n - 1));
}

unsigned equinox_day(int year, double base) {
    double shift = 0.242194 * (year - 1980) - std::floor((year - 1980) / 4.0);
    return static_cast<unsigned>(std::floor(base + shift));
}

}  // namespace

unsigned vernal_equinox_day(int year) {
    return equinox_day(year, 20.8431);
}

unsigned autumnal_equinox_day(int year) {
    return equinox_day(year, 23.2488);
}

std::map<Timestamp, std::string> japanese_holidays(int year) {
    std::map<Timestamp, std::string> holidays;
    auto add = [&holidays, year](unsigned month, unsigned day, const char* name) {
        holidays[core::make_date(year, month, day)] = name;
    };

    add(1, 1, "New Year's Day");
    holidays[nth_monday(year, 1, 2)] = "Coming of Age Day";
    add(2, 11, "National Foundation Day");
    if (year >= 2020) {
        add(2, 23, "Emperor's Birthday");
    }
    add(3, vernal_equinox_day(year), "Vernal Equinox Day");
    add(4, 29, year >= 2007 ? "Showa Day" : "Greenery Day");
    add(5, 3, "Constitution Memorial Day");
    if (year >= 2007) {
        add(5, 4, "Greenery Day");
    }
    add(5, 5, "Children's Day");

    if (year == 2020) {
        add(7, 23, "Marine Day");
        add(7, 24, "Sports Day");
        add(8, 10, "Mountain Day");
    } else if (year == 2021) {
        add(7, 22, "Marine Day");
        add(7, 23, "Sports Day");
        add(8, 8, "Mountain Day");
    } else {
        if (year >= 2003) {
            holidays[nth_monday(year, 7, 3)] = "Marine Day";
        } else {
            add(7, 20, "Marine Day");
        }
        if (year >= 2016) {
            add(8, 11, "Mountain Day");
        }
        holidays[nth_monday(year, 10, 2)] = year >= 2020 ? "Sports Day" : "Health and Sports Day";
    }

    if (year >= 2003) {
        holidays[nth_monday(year, 9, 3)] = "Respect for the Aged Day";
    } else {
        add(9, 15, "Respect for the Aged Day");
    }
    add(9, autumnal_equinox_day(year), "Autumnal Equinox Day");
    add(11, 3, "Culture Day");
    add(11, 23, "Labor Thanksgiving Day");
    if (year <= 2018) {
        add(12, 23, "Emperor's Birthday");
    }

    if (year == 2019) {
        add(5, 1, "Enthronement Day");
        add(10, 22, "Enthronement Ceremony Day");
    }

    // Citizens' holiday: a weekday squeezed between two holidays
    std::map<Timestamp, std::string> citizens;
    for (const auto& [date, name] : holidays) {
        Timestamp candidate = core::add_days(date, 1);
        Timestamp after = core::add_days(date, 2);
        if (holidays.count(candidate) == 0 && holidays.count(after) != 0 &&
            core::weekday(candidate) != SUNDAY && core::to_civil(candidate).year == year) {
            citizens[candidate] = "Citizens' Holiday";
        }
    }
    holidays.insert(citizens.begin(), citizens.end());

    // Substitute holiday: the first following non-holiday after a Sunday holiday
    std::map<Timestamp, std::string> substitutes;
    for (const auto& [date, name] : holidays) {
        if (core::weekday(date) != SUNDAY) {
            continue;
        }
        Timestamp next = core::add_days(date, 1);
        while (holidays.count(next) != 0 || substitutes.count(next) != 0) {
            next = core::add_days(next, 1);
        }
        if (core::to_civil(next).year == year) {
            substitutes[next] = "Substitute Holiday";
        }
    }
    holidays.insert(substitutes.begin(), substitutes.end());

    return holidays;
}

}  // namespace calendar
}  // namespace divcap
