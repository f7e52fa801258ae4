#include <gtest/gtest.h>
#include <cmath>
#include "divcap/core/time_utils.hpp"
#include "divcap/portfolio/portfolio.hpp"

using namespace divcap;
using divcap::core::make_date;

class PortfolioTest : public ::testing::Test {
protected:
    static constexpr double CAPITAL = 10000000.0;

    DividendInfo dividend() {
        DividendInfo info;
        info.ex_dividend_date = make_date(2023, 3, 29);
        info.record_date = make_date(2023, 3, 31);
        info.dividend_per_share = 30.0;
        return info;
    }

    Portfolio portfolio{CAPITAL};
};

TEST_F(PortfolioTest, ConstructorRejectsNonPositiveCapital) {
    EXPECT_THROW(Portfolio(0.0), BacktestError);
    EXPECT_THROW(Portfolio(-1.0), BacktestError);
}

TEST_F(PortfolioTest, RoundTripProfit) {
    auto bought = portfolio.execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                        SignalKind::ENTRY, "entry", dividend());
    ASSERT_TRUE(bought.is_ok());
    EXPECT_DOUBLE_EQ(portfolio.cash(), CAPITAL - 1000500.0);

    auto sold = portfolio.execute_sell("7203", make_date(2023, 4, 3), 2100.0, 500.0,
                                       "window_filled");
    ASSERT_TRUE(sold.is_ok());
    EXPECT_EQ(sold.value().shares, 500);

    EXPECT_DOUBLE_EQ(portfolio.cash(), 10049000.0);
    ASSERT_EQ(portfolio.positions().closed_count(), 1u);
    EXPECT_DOUBLE_EQ(portfolio.positions().closed_positions()[0].realized_pnl(), 49000.0);
    EXPECT_EQ(portfolio.total_trades(), 2);
    EXPECT_EQ(portfolio.winning_trades(), 1);
    EXPECT_EQ(portfolio.losing_trades(), 0);
    EXPECT_DOUBLE_EQ(portfolio.total_commission(), 1000.0);
}

TEST_F(PortfolioTest, AdditionBuildsOnePosition) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 29), 1950.0, 300, 300.0,
                                 SignalKind::ADD, "addition")
                    .is_ok());

    const Position* position = portfolio.positions().get_open_position("7203");
    ASSERT_NE(position, nullptr);
    EXPECT_EQ(position->shares(), 800);
    EXPECT_DOUBLE_EQ(position->average_cost(), 1981.625);
    EXPECT_DOUBLE_EQ(position->total_commission(), 800.0);
    EXPECT_EQ(portfolio.positions().open_count(), 1u);
    // Dividend event stays attached to the opening entry
    ASSERT_TRUE(position->dividend().has_value());
    EXPECT_EQ(position->dividend()->record_date, make_date(2023, 3, 31));
}

TEST_F(PortfolioTest, DuplicateEntryRejected) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry")
                    .is_ok());
    double cash = portfolio.cash();

    auto duplicate = portfolio.execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                           SignalKind::ENTRY, "entry");
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::DUPLICATE_ENTRY);
    EXPECT_DOUBLE_EQ(portfolio.cash(), cash);
    EXPECT_EQ(portfolio.positions().get_open_position("7203")->shares(), 500);
}

TEST_F(PortfolioTest, AddWithoutPositionRejected) {
    auto result = portfolio.execute_buy("7203", make_date(2023, 3, 29), 1950.0, 300, 300.0,
                                        SignalKind::ADD, "addition");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NO_POSITION);
    EXPECT_DOUBLE_EQ(portfolio.cash(), CAPITAL);
}

TEST_F(PortfolioTest, ExitKindIsNotABuy) {
    auto result = portfolio.execute_buy("7203", make_date(2023, 3, 29), 1950.0, 300, 300.0,
                                        SignalKind::EXIT, "exit");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PortfolioTest, InsufficientCashLeavesStateUntouched) {
    Portfolio small(1000000.0);
    auto result = small.execute_buy("6861", make_date(2023, 3, 28), 60000.0, 100, 1100.0,
                                    SignalKind::ENTRY, "entry");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_CASH);
    EXPECT_DOUBLE_EQ(small.cash(), 1000000.0);
    EXPECT_EQ(small.positions().open_count(), 0u);
    EXPECT_TRUE(small.positions().trades().empty());
    EXPECT_EQ(small.total_trades(), 0);
    EXPECT_DOUBLE_EQ(small.total_commission(), 0.0);
}

TEST_F(PortfolioTest, InvalidTradeRejected) {
    auto result = portfolio.execute_buy("7203", make_date(2023, 3, 28), 2000.0, 0, 500.0,
                                        SignalKind::ENTRY, "entry");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_TRADE);
}

TEST_F(PortfolioTest, SellWithoutPosition) {
    auto result = portfolio.execute_sell("7203", make_date(2023, 4, 3), 2100.0, 500.0, "exit");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NO_POSITION);
}

TEST_F(PortfolioTest, DividendCredit) {
    EXPECT_EQ(portfolio.credit_dividend("7203", 24.0, make_date(2023, 3, 29)).error()->code(),
              ErrorCode::NO_POSITION);

    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    double cash = portfolio.cash();

    auto credited = portfolio.credit_dividend("7203", 24.0, make_date(2023, 3, 29));
    ASSERT_TRUE(credited.is_ok());
    EXPECT_DOUBLE_EQ(credited.value(), 12000.0);
    EXPECT_DOUBLE_EQ(portfolio.cash(), cash + 12000.0);
    EXPECT_DOUBLE_EQ(portfolio.total_dividend(), 12000.0);

    ASSERT_TRUE(portfolio.execute_sell("7203", make_date(2023, 4, 3), 1990.0, 500.0, "exit").is_ok());
    // (995,000 - 500) - (1,000,000 + 500) + 12,000
    EXPECT_DOUBLE_EQ(portfolio.positions().closed_positions()[0].realized_pnl(), 6000.0);
}

TEST_F(PortfolioTest, ExDateEntryReceivesNoDividend) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 29), 1950.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    double cash = portfolio.cash();

    auto credited = portfolio.credit_dividend("7203", 24.0, make_date(2023, 3, 29));
    ASSERT_TRUE(credited.is_ok());
    EXPECT_DOUBLE_EQ(credited.value(), 0.0);
    EXPECT_DOUBLE_EQ(portfolio.cash(), cash);
    EXPECT_DOUBLE_EQ(portfolio.total_dividend(), 0.0);
    EXPECT_DOUBLE_EQ(portfolio.positions().get_open_position("7203")->dividend_received(), 0.0);
}

TEST_F(PortfolioTest, ExDateAdditionIsNotEntitled) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 29), 1960.0, 200, 500.0,
                                 SignalKind::ADD, "addition")
                    .is_ok());

    auto credited = portfolio.credit_dividend("7203", 24.0, make_date(2023, 3, 29));
    ASSERT_TRUE(credited.is_ok());
    EXPECT_DOUBLE_EQ(credited.value(), 500 * 24.0);
}

TEST_F(PortfolioTest, CashConservation) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 550.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    ASSERT_TRUE(portfolio
                    .execute_buy("9432", make_date(2023, 3, 28), 150.0, 6600, 550.0,
                                 SignalKind::ENTRY, "entry")
                    .is_ok());
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 29), 1960.0, 200, 550.0,
                                 SignalKind::ADD, "addition")
                    .is_ok());
    ASSERT_TRUE(portfolio.credit_dividend("7203", 20.0, make_date(2023, 3, 29)).is_ok());
    ASSERT_TRUE(portfolio.execute_sell("7203", make_date(2023, 4, 3), 2010.0, 773.85, "exit").is_ok());

    double flows = 0.0;
    for (const auto& trade : portfolio.positions().trades()) {
        flows += trade.side == TradeSide::BUY ? -trade.gross_amount : trade.gross_amount;
    }
    flows += portfolio.total_dividend();
    EXPECT_NEAR(portfolio.cash(), CAPITAL + flows, 1e-6);
    EXPECT_GE(portfolio.cash(), 0.0);
}

TEST_F(PortfolioTest, MarkToMarketUsesLastKnownPrice) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry")
                    .is_ok());

    const auto& first = portfolio.mark_to_market(make_date(2023, 3, 28), {{"7203", 2020.0}});
    EXPECT_DOUBLE_EQ(first.positions_market_value, 1010000.0);
    EXPECT_EQ(first.open_position_count, 1u);
    EXPECT_DOUBLE_EQ(first.daily_return, 0.0);

    // No price on the next day: previous close is reused
    const auto& second = portfolio.mark_to_market(make_date(2023, 3, 29), {});
    EXPECT_DOUBLE_EQ(second.positions_market_value, 1010000.0);
    EXPECT_DOUBLE_EQ(second.daily_return, 0.0);

    const auto& third = portfolio.mark_to_market(make_date(2023, 3, 30), {{"7203", 1980.0}});
    EXPECT_DOUBLE_EQ(third.total_value, portfolio.cash() + 990000.0);
    EXPECT_LT(third.daily_return, 0.0);
    EXPECT_EQ(portfolio.history().size(), 3u);
}

TEST_F(PortfolioTest, MarkToMarketNeverPricedUsesAverageCost) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry")
                    .is_ok());
    const auto& snapshot = portfolio.mark_to_market(make_date(2023, 3, 28), {});
    EXPECT_DOUBLE_EQ(snapshot.positions_market_value, 1000000.0);
    EXPECT_DOUBLE_EQ(snapshot.total_value, CAPITAL - 500.0);
}

TEST_F(PortfolioTest, PerformanceMetrics) {
    ASSERT_TRUE(portfolio
                    .execute_buy("7203", make_date(2023, 3, 28), 2000.0, 500, 500.0,
                                 SignalKind::ENTRY, "entry", dividend())
                    .is_ok());
    portfolio.mark_to_market(make_date(2023, 3, 28), {{"7203", 2000.0}});
    ASSERT_TRUE(portfolio.credit_dividend("7203", 24.0, make_date(2023, 3, 29)).is_ok());
    portfolio.mark_to_market(make_date(2023, 3, 29), {{"7203", 1970.0}});
    ASSERT_TRUE(portfolio.execute_sell("7203", make_date(2023, 3, 30), 2100.0, 500.0, "exit").is_ok());
    portfolio.mark_to_market(make_date(2023, 3, 30), {{"7203", 2100.0}});

    auto metrics = portfolio.performance_metrics();
    EXPECT_DOUBLE_EQ(metrics.initial_capital, CAPITAL);
    EXPECT_DOUBLE_EQ(metrics.final_value, 10049000.0 + 12000.0);
    EXPECT_NEAR(metrics.total_return, 61000.0 / CAPITAL, 1e-12);
    EXPECT_EQ(metrics.trading_days, 3);
    EXPECT_EQ(metrics.total_trades, 2);
    EXPECT_EQ(metrics.winning_trades, 1);
    EXPECT_DOUBLE_EQ(metrics.win_rate, 1.0);
    EXPECT_TRUE(std::isinf(metrics.profit_factor));
    EXPECT_DOUBLE_EQ(metrics.total_dividend, 12000.0);
    EXPECT_EQ(metrics.positions_with_dividend, 1);
    EXPECT_GT(metrics.max_drawdown, 0.0);
}
