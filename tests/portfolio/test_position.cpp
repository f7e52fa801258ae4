#include <gtest/gtest.h>
#include "divcap/core/time_utils.hpp"
#include "divcap/portfolio/position.hpp"

using namespace divcap;
using divcap::core::make_date;

class PositionTest : public ::testing::Test {
protected:
    Trade buy(Price price, Quantity shares, double commission, int day = 1) {
        return Trade::make("7203", TradeSide::BUY, make_date(2023, 3, day), price, shares,
                           commission, "test");
    }

    Trade sell(Price price, Quantity shares, double commission, int day = 10) {
        return Trade::make("7203", TradeSide::SELL, make_date(2023, 3, day), price, shares,
                           commission, "test");
    }
};

TEST_F(PositionTest, TradeGrossAmount) {
    auto b = buy(2000.0, 500, 550.0);
    EXPECT_DOUBLE_EQ(b.gross_amount, 1000550.0);

    auto s = sell(2100.0, 500, 550.0);
    EXPECT_DOUBLE_EQ(s.gross_amount, 1049450.0);
}

TEST_F(PositionTest, OpenSetsAverageCostToPrice) {
    auto opened = Position::open(buy(2000.0, 500, 550.0));
    ASSERT_TRUE(opened.is_ok());
    const Position& position = opened.value();

    EXPECT_TRUE(position.is_open());
    EXPECT_EQ(position.shares(), 500);
    EXPECT_DOUBLE_EQ(position.average_cost(), 2000.0);
    EXPECT_DOUBLE_EQ(position.entry_price(), 2000.0);
    EXPECT_DOUBLE_EQ(position.total_commission(), 550.0);
    EXPECT_EQ(position.trades().size(), 1u);
}

TEST_F(PositionTest, OpenRejectsInvalidBuy) {
    EXPECT_TRUE(Position::open(buy(2000.0, 0, 550.0)).is_error());
    EXPECT_TRUE(Position::open(buy(-1.0, 100, 550.0)).is_error());
    EXPECT_TRUE(Position::open(sell(2000.0, 100, 550.0)).is_error());
}

TEST_F(PositionTest, AdditionAveragesGrossCost) {
    auto opened = Position::open(buy(2000.0, 500, 500.0));
    ASSERT_TRUE(opened.is_ok());
    Position position = opened.take_value();

    ASSERT_TRUE(position.add(buy(1950.0, 300, 300.0, 2)).is_ok());
    EXPECT_EQ(position.shares(), 800);
    EXPECT_EQ(position.peak_shares(), 800);
    EXPECT_DOUBLE_EQ(position.average_cost(), 1981.625);
    EXPECT_DOUBLE_EQ(position.total_commission(), 800.0);
    EXPECT_EQ(position.trades().size(), 2u);
}

TEST_F(PositionTest, CloseRealizesPnlWithDividend) {
    Position position = Position::open(buy(2000.0, 500, 500.0)).take_value();
    position.record_dividend(10000.0);

    ASSERT_TRUE(position.close(sell(2100.0, 500, 500.0)).is_ok());
    EXPECT_FALSE(position.is_open());
    EXPECT_EQ(position.shares(), 0);
    EXPECT_EQ(position.peak_shares(), 500);
    // (1,050,000 - 500) - (1,000,000 + 500) + 10,000
    EXPECT_DOUBLE_EQ(position.realized_pnl(), 59000.0);
    ASSERT_TRUE(position.exit_date().has_value());
    EXPECT_EQ(*position.exit_date(), make_date(2023, 3, 10));
    EXPECT_DOUBLE_EQ(position.exit_price(), 2100.0);
}

TEST_F(PositionTest, CloseRequiresFullShareCount) {
    Position position = Position::open(buy(2000.0, 500, 500.0)).take_value();
    auto partial = position.close(sell(2100.0, 200, 500.0));
    ASSERT_TRUE(partial.is_error());
    EXPECT_EQ(partial.error()->code(), ErrorCode::INVALID_TRADE);
    EXPECT_TRUE(position.is_open());
    EXPECT_EQ(position.shares(), 500);
}

TEST_F(PositionTest, ClosedPositionRejectsFurtherTrades) {
    Position position = Position::open(buy(2000.0, 500, 500.0)).take_value();
    ASSERT_TRUE(position.close(sell(2100.0, 500, 500.0)).is_ok());

    EXPECT_TRUE(position.add(buy(2000.0, 100, 500.0)).is_error());
    EXPECT_TRUE(position.close(sell(2100.0, 0, 500.0)).is_error());
}

TEST_F(PositionTest, MarketValueAndUnrealized) {
    Position position = Position::open(buy(2000.0, 500, 500.0)).take_value();
    EXPECT_DOUBLE_EQ(position.market_value(2100.0), 1050000.0);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl(2100.0), 50000.0);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl(1900.0), -50000.0);
}

TEST_F(PositionTest, EntitledSharesExcludeBuysOnOrAfterExDate) {
    DividendInfo dividend;
    dividend.ex_dividend_date = make_date(2023, 3, 29);
    dividend.record_date = make_date(2023, 3, 31);
    dividend.dividend_per_share = 30.0;

    auto held = Position::open(buy(2000.0, 500, 550.0, 28), dividend);
    ASSERT_TRUE(held.is_ok());
    Position position = held.take_value();
    EXPECT_EQ(position.entitled_shares(), 500);

    ASSERT_TRUE(position.add(buy(1960.0, 200, 550.0, 29)).is_ok());
    EXPECT_EQ(position.shares(), 700);
    EXPECT_EQ(position.entitled_shares(), 500);

    auto late = Position::open(buy(1950.0, 500, 550.0, 29), dividend);
    ASSERT_TRUE(late.is_ok());
    EXPECT_EQ(late.value().entitled_shares(), 0);
}

TEST_F(PositionTest, EntitledSharesWithoutDividendEvent) {
    auto opened = Position::open(buy(2000.0, 500, 550.0, 28));
    ASSERT_TRUE(opened.is_ok());
    EXPECT_EQ(opened.value().entitled_shares(), 500);
}
