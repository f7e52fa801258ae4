// include/divcap/backtest/backtest_execution_manager.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "divcap/core/config_base.hpp"
#include "divcap/core/types.hpp"

namespace divcap {
namespace backtest {

/**
 * @brief Execution cost parameters
 */
struct BacktestExecutionConfig : public ConfigBase {
    double slippage = 0.002;          // fraction of price on ordinary days
    double slippage_ex_date = 0.005;  // fraction of price on the position's ex-dividend date
    double commission_rate = 0.00055; // fraction of notional
    double min_commission = 550.0;
    double max_commission = 1100.0;
    double tax_rate = 0.20315;        // withheld from dividends

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const;
};

/**
 * @brief Turns signal prices into fill prices and commissions
 *
 * Buys fill at price * (1 + slippage) and sells at price * (1 - slippage).
 * Commission is the notional times the commission rate, clamped to
 * [min_commission, max_commission].
 */
class BacktestExecutionManager {
public:
    explicit BacktestExecutionManager(const BacktestExecutionConfig& config);

    /**
     * @brief Apply slippage to a price
     * @param price Reference price
     * @param side Trade side
     * @param ex_dividend_date Whether the trade happens on the position's ex-dividend date
     * @return Price with slippage applied
     */
    Price apply_slippage(Price price, TradeSide side, bool ex_dividend_date) const;

    /**
     * @brief Calculate commission for a fill
     * @param price Fill price
     * @param shares Shares traded
     */
    double calculate_commission(Price price, Quantity shares) const;

    /**
     * @brief Dividend actually received per share after withholding tax
     */
    double net_dividend(double dividend_per_share) const {
        return dividend_per_share * (1.0 - config_.tax_rate);
    }

    const BacktestExecutionConfig& config() const {
        return config_;
    }

private:
    BacktestExecutionConfig config_;
};

}  // namespace backtest
}  // namespace divcap
