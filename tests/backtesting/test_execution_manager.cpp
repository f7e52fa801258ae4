// test_execution_manager.cpp
#include <gtest/gtest.h>
#include "divcap/backtest/backtest_execution_manager.hpp"

using namespace divcap;
using namespace divcap::backtest;

class BacktestExecutionManagerTest : public ::testing::Test {
protected:
    BacktestExecutionConfig config_;
};

TEST_F(BacktestExecutionManagerTest, SlippageMovesPriceAgainstTheTrade) {
    BacktestExecutionManager execution(config_);
    EXPECT_NEAR(execution.apply_slippage(2000.0, TradeSide::BUY, false), 2004.0, 1e-9);
    EXPECT_NEAR(execution.apply_slippage(2000.0, TradeSide::SELL, false), 1996.0, 1e-9);
}

TEST_F(BacktestExecutionManagerTest, ExDateSlippageIsWider) {
    BacktestExecutionManager execution(config_);
    EXPECT_NEAR(execution.apply_slippage(2000.0, TradeSide::BUY, true), 2010.0, 1e-9);
    EXPECT_NEAR(execution.apply_slippage(2000.0, TradeSide::SELL, true), 1990.0, 1e-9);
}

TEST_F(BacktestExecutionManagerTest, CommissionIsClamped) {
    BacktestExecutionManager execution(config_);
    // 200,000 notional: 110 before the floor
    EXPECT_DOUBLE_EQ(execution.calculate_commission(2000.0, 100), 550.0);
    // 1,600,000 notional: inside the band
    EXPECT_NEAR(execution.calculate_commission(2000.0, 800), 880.0, 1e-9);
    // 2,000,000 notional: exactly at the cap
    EXPECT_NEAR(execution.calculate_commission(2000.0, 1000), 1100.0, 1e-9);
    EXPECT_DOUBLE_EQ(execution.calculate_commission(2000.0, 10000), 1100.0);
}

TEST_F(BacktestExecutionManagerTest, DividendIsNetOfTax) {
    BacktestExecutionManager execution(config_);
    EXPECT_NEAR(execution.net_dividend(100.0), 79.685, 1e-9);

    config_.tax_rate = 0.0;
    BacktestExecutionManager untaxed(config_);
    EXPECT_DOUBLE_EQ(untaxed.net_dividend(30.0), 30.0);
}

TEST_F(BacktestExecutionManagerTest, ConfigValidation) {
    EXPECT_TRUE(config_.validate().is_ok());

    auto bad = config_;
    bad.slippage = -0.01;
    EXPECT_TRUE(bad.validate().is_error());

    bad = config_;
    bad.max_commission = 100.0;
    auto result = bad.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIG);

    bad = config_;
    bad.tax_rate = 1.0;
    EXPECT_TRUE(bad.validate().is_error());
}

TEST_F(BacktestExecutionManagerTest, ConfigJsonUsesCommissionKey) {
    auto j = config_.to_json();
    EXPECT_DOUBLE_EQ(j["commission"].get<double>(), 0.00055);

    j["commission"] = 0.001;
    BacktestExecutionConfig loaded;
    loaded.from_json(j);
    EXPECT_DOUBLE_EQ(loaded.commission_rate, 0.001);

    j["fee"] = 1.0;
    EXPECT_THROW(loaded.from_json(j), BacktestError);
}
