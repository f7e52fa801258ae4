#include <gtest/gtest.h>
#include "divcap/calendar/japanese_holidays.hpp"
#include "divcap/core/time_utils.hpp"

using namespace divcap;
using divcap::core::make_date;

namespace {

bool has_holiday(int year, unsigned month, unsigned day) {
    return calendar::japanese_holidays(year).count(make_date(year, month, day)) != 0;
}

std::string holiday(int year, unsigned month, unsigned day) {
    auto holidays = calendar::japanese_holidays(year);
    auto it = holidays.find(make_date(year, month, day));
    return it == holidays.end() ? "" : it->second;
}

}  // namespace

TEST(JapaneseHolidaysTest, FixedHolidays2023) {
    EXPECT_EQ(holiday(2023, 1, 1), "New Year's Day");
    EXPECT_EQ(holiday(2023, 2, 11), "National Foundation Day");
    EXPECT_EQ(holiday(2023, 2, 23), "Emperor's Birthday");
    EXPECT_EQ(holiday(2023, 5, 3), "Constitution Memorial Day");
    EXPECT_EQ(holiday(2023, 5, 4), "Greenery Day");
    EXPECT_EQ(holiday(2023, 5, 5), "Children's Day");
    EXPECT_EQ(holiday(2023, 11, 3), "Culture Day");
    EXPECT_EQ(holiday(2023, 11, 23), "Labor Thanksgiving Day");
}

TEST(JapaneseHolidaysTest, HappyMondays2023) {
    EXPECT_EQ(holiday(2023, 1, 9), "Coming of Age Day");
    EXPECT_EQ(holiday(2023, 7, 17), "Marine Day");
    EXPECT_EQ(holiday(2023, 9, 18), "Respect for the Aged Day");
    EXPECT_EQ(holiday(2023, 10, 9), "Sports Day");
}

TEST(JapaneseHolidaysTest, EquinoxDays) {
    EXPECT_EQ(calendar::vernal_equinox_day(2023), 21u);
    EXPECT_EQ(calendar::autumnal_equinox_day(2023), 23u);
    EXPECT_EQ(calendar::vernal_equinox_day(2020), 20u);
    EXPECT_EQ(calendar::autumnal_equinox_day(2020), 22u);
    EXPECT_EQ(holiday(2023, 3, 21), "Vernal Equinox Day");
}

TEST(JapaneseHolidaysTest, SubstituteHolidays) {
    // New Year's Day 2023 fell on a Sunday
    EXPECT_EQ(holiday(2023, 1, 2), "Substitute Holiday");
    // Children's Day 2019 was Sunday after Greenery Day on Saturday
    EXPECT_EQ(holiday(2019, 5, 6), "Substitute Holiday");
    // Mountain Day 2021 was Sunday
    EXPECT_EQ(holiday(2021, 8, 9), "Substitute Holiday");
}

TEST(JapaneseHolidaysTest, EnthronementGoldenWeek2019) {
    EXPECT_EQ(holiday(2019, 4, 30), "Citizens' Holiday");
    EXPECT_EQ(holiday(2019, 5, 1), "Enthronement Day");
    EXPECT_EQ(holiday(2019, 5, 2), "Citizens' Holiday");
    EXPECT_EQ(holiday(2019, 10, 22), "Enthronement Ceremony Day");
    // No Emperor's Birthday in 2019
    EXPECT_FALSE(has_holiday(2019, 12, 23));
    EXPECT_FALSE(has_holiday(2019, 2, 23));
    EXPECT_TRUE(has_holiday(2018, 12, 23));
}

TEST(JapaneseHolidaysTest, OlympicMoves) {
    EXPECT_EQ(holiday(2020, 7, 23), "Marine Day");
    EXPECT_EQ(holiday(2020, 7, 24), "Sports Day");
    EXPECT_EQ(holiday(2020, 8, 10), "Mountain Day");
    EXPECT_FALSE(has_holiday(2020, 10, 12));

    EXPECT_EQ(holiday(2021, 7, 22), "Marine Day");
    EXPECT_EQ(holiday(2021, 7, 23), "Sports Day");
    EXPECT_FALSE(has_holiday(2021, 10, 11));
}

TEST(JapaneseHolidaysTest, SilverWeekCitizensHoliday) {
    // Respect for the Aged Day on Sep 21 and the equinox on Sep 23, 2015
    EXPECT_EQ(holiday(2015, 9, 22), "Citizens' Holiday");
}
