#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "divcap/core/holiday_checker.hpp"
#include "divcap/core/time_utils.hpp"

using namespace divcap;

class HolidayCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "divcap_holiday_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(HolidayCheckerTest, LoadsHolidaysByYear) {
    auto path = write_file("holidays.json", R"({
        "2023": [
            {"date": "2023-11-24", "name": "System maintenance", "type": "exchange", "note": "closed"}
        ],
        "2024": [
            {"date": "2024-01-04", "name": "Trading halt"}
        ]
    })");

    HolidayChecker checker;
    auto result = checker.load(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    EXPECT_EQ(checker.size(), 2u);
    EXPECT_TRUE(checker.is_holiday("2023-11-24"));
    EXPECT_FALSE(checker.is_holiday("2023-11-27"));

    auto info = checker.get_holiday_info("2024-01-04");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "Trading halt");
    EXPECT_EQ(info->type, "exchange");
    EXPECT_TRUE(info->note.empty());

    auto dates = checker.holiday_dates();
    ASSERT_EQ(dates.size(), 2u);
    EXPECT_EQ(dates[0], core::make_date(2023, 11, 24));
    EXPECT_EQ(dates[1], core::make_date(2024, 1, 4));
}

TEST_F(HolidayCheckerTest, MissingFile) {
    HolidayChecker checker;
    auto result = checker.load((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(HolidayCheckerTest, MalformedFileKeepsPreviousSet) {
    HolidayChecker checker;
    ASSERT_TRUE(checker.load(write_file("good.json",
                                        R"({"2023": [{"date": "2023-11-24", "name": "x"}]})"))
                    .is_ok());

    auto result = checker.load(write_file("bad.json", R"({"2023": [{"name": "no date"}]})"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_TRUE(checker.is_holiday("2023-11-24"));
}

TEST_F(HolidayCheckerTest, InvalidDateRejected) {
    HolidayChecker checker;
    auto result =
        checker.load(write_file("invalid.json", R"({"2023": [{"date": "2023-02-30", "name": "x"}]})"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_EQ(checker.size(), 0u);
}
