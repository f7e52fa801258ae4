// include/divcap/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <utility>
#include <vector>
#include "divcap/core/types.hpp"
#include "divcap/portfolio/position_registry.hpp"

namespace divcap {

/**
 * @brief Final performance figures of a backtest run
 */
struct PerformanceMetrics {
    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double annualized_volatility = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;  // positive fraction, 0.10 = 10% below the running peak
    double win_rate = 0.0;
    double profit_factor = 0.0;  // +inf when there are wins and no losses
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double avg_holding_days = 0.0;
    double total_commission = 0.0;
    double total_dividend = 0.0;
    int positions_with_dividend = 0;
    int trading_days = 0;

    /**
     * @brief Flat key to number map; non-finite values serialise as null
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Stateless calculations behind PerformanceMetrics
 *
 * All methods are const and have no side effects. Returns and volatility
 * use 252 trading days per year.
 */
class BacktestMetricsCalculator {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double DEFAULT_RISK_FREE_RATE = 0.01;

    // ========== Return Calculations ==========

    /**
     * @brief Calculate total return from start and end values
     * @return Total return as decimal (0.10 = 10%)
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Compound the mean daily return over a trading year
     * @param returns Daily returns
     * @return (1 + mean)^252 - 1, or 0 for an empty series
     */
    double calculate_annualized_return(const std::vector<double>& returns) const;

    /**
     * @brief Calculate daily returns from equity curve
     * @param equity_curve Vector of (timestamp, portfolio_value) pairs
     * @return One return per consecutive pair, skipping non-positive bases
     */
    std::vector<double> calculate_returns_from_equity(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Risk Metrics ==========

    /**
     * @brief Annualized volatility (population standard deviation times sqrt(252))
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Sharpe ratio from compounded annual return and annualized volatility
     * @param returns Daily returns
     * @param risk_free_rate Annual risk-free rate
     * @return Sharpe ratio, 0 when volatility is zero
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double risk_free_rate = DEFAULT_RISK_FREE_RATE) const;

    std::vector<std::pair<Timestamp, double>> calculate_drawdowns(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    double calculate_max_drawdown(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int closed_positions = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;
        double total_profit = 0.0;
        double total_loss = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double max_win = 0.0;
        double max_loss = 0.0;
        double avg_holding_days = 0.0;
        double total_dividend = 0.0;
        int positions_with_dividend = 0;
    };

    /**
     * @brief Statistics over closed positions
     *
     * A position counts as a win when its realized P&L is positive and as a
     * loss when it is negative. Profit factor is 0 without closed positions
     * and +inf when positions closed without any loss.
     */
    TradeStatistics calculate_trade_statistics(const std::vector<PositionRecord>& positions) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace divcap
