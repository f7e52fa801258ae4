// include/divcap/calendar/japanese_holidays.hpp
#pragma once

#include <map>
#include <string>
#include "divcap/core/types.hpp"

namespace divcap {
namespace calendar {

/**
 * @brief National holidays of Japan for one year, derived from the holiday law
 *
 * Covers fixed-date holidays, Happy Monday holidays, the equinox days, the
 * Emperor's Birthday changes of 2019 and 2020, the 2019 enthronement days,
 * the Olympic moves of 2020 and 2021, substitute holidays and citizens'
 * holidays. Rules are applied as in force from 2000 onwards.
 *
 * @param year Gregorian year
 * @return Map of holiday date to holiday name
 */
std::map<Timestamp, std::string> japanese_holidays(int year);

/**
 * @brief Vernal equinox day of March for the given year
 */
unsigned vernal_equinox_day(int year);

/**
 * @brief Autumnal equinox day of September for the given year
 */
unsigned autumnal_equinox_day(int year);

}  // namespace calendar
}  // namespace divcap
