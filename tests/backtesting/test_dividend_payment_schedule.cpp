// test_dividend_payment_schedule.cpp
#include <gtest/gtest.h>
#include <memory>
#include "divcap/backtest/dividend_payment_schedule.hpp"
#include "divcap/core/time_utils.hpp"

using namespace divcap;
using namespace divcap::backtest;
using divcap::core::make_date;

class DividendPaymentScheduleTest : public ::testing::Test {
protected:
    void SetUp() override {
        calendar_ = std::make_shared<BusinessCalendar>();
    }

    static DividendInfo dividend(int year, int month, int day) {
        DividendInfo info;
        info.record_date = make_date(year, month, day);
        info.ex_dividend_date = make_date(year, month, day - 2);
        info.dividend_per_share = 30.0;
        return info;
    }

    Timestamp pay(DividendPaymentPolicy policy, const DividendInfo& info, int offset = 1) {
        DividendPaymentConfig config;
        config.policy = policy;
        config.payment_offset_days = offset;
        DividendPaymentSchedule schedule(config, calendar_);
        return schedule.payment_date(info);
    }

    std::shared_ptr<BusinessCalendar> calendar_;
};

TEST_F(DividendPaymentScheduleTest, RequiresCalendar) {
    EXPECT_THROW({ DividendPaymentSchedule schedule(DividendPaymentConfig(), nullptr); },
                 BacktestError);
}

TEST_F(DividendPaymentScheduleTest, ExDatePolicy) {
    auto info = dividend(2023, 3, 31);
    EXPECT_EQ(pay(DividendPaymentPolicy::EX_DATE, info), make_date(2023, 3, 29));
}

TEST_F(DividendPaymentScheduleTest, RecordDateOffsetSkipsWeekend) {
    // 2023-03-31 is a Friday
    auto info = dividend(2023, 3, 31);
    EXPECT_EQ(pay(DividendPaymentPolicy::RECORD_DATE_OFFSET, info, 1), make_date(2023, 4, 3));
    EXPECT_EQ(pay(DividendPaymentPolicy::RECORD_DATE_OFFSET, info, 0), make_date(2023, 3, 31));
}

TEST_F(DividendPaymentScheduleTest, FiscalScheduleMarchRecord) {
    // June 25 2023 is a Sunday
    EXPECT_EQ(pay(DividendPaymentPolicy::FISCAL_SCHEDULE, dividend(2023, 3, 31)),
              make_date(2023, 6, 26));
}

TEST_F(DividendPaymentScheduleTest, FiscalScheduleSeptemberRecord) {
    // December 10 2023 is a Sunday
    EXPECT_EQ(pay(DividendPaymentPolicy::FISCAL_SCHEDULE, dividend(2023, 9, 30)),
              make_date(2023, 12, 11));
}

TEST_F(DividendPaymentScheduleTest, FiscalScheduleOtherMonths) {
    EXPECT_EQ(pay(DividendPaymentPolicy::FISCAL_SCHEDULE, dividend(2023, 6, 30)),
              make_date(2023, 9, 13));
}

TEST_F(DividendPaymentScheduleTest, ConfigParsing) {
    DividendPaymentConfig config;
    config.from_json({{"payment_policy", "FISCAL_SCHEDULE"}, {"payment_offset_days", 2}});
    EXPECT_EQ(config.policy, DividendPaymentPolicy::FISCAL_SCHEDULE);
    EXPECT_EQ(config.payment_offset_days, 2);
    EXPECT_EQ(config.to_json()["payment_policy"].get<std::string>(), "FISCAL_SCHEDULE");

    EXPECT_THROW(config.from_json({{"payment_policy", "MONTHLY"}, {"payment_offset_days", 1}}),
                 BacktestError);
    EXPECT_THROW(config.from_json({{"payment_policy", "EX_DATE"}, {"payment_offset_days", -1}}),
                 BacktestError);
}
