// include/divcap/portfolio/portfolio.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "divcap/backtest/backtest_metrics_calculator.hpp"
#include "divcap/core/error.hpp"
#include "divcap/core/logger.hpp"
#include "divcap/portfolio/position_registry.hpp"

namespace divcap {

/**
 * @brief Outcome of a buy or sell instruction: the executed trade or the rejection
 */
using ExecutionResult = Result<Trade>;

/**
 * @brief End-of-day valuation of the portfolio
 */
struct DailySnapshot {
    Timestamp date;
    double cash = 0.0;
    double positions_market_value = 0.0;
    double total_value = 0.0;
    double daily_return = 0.0;
    double cumulative_return = 0.0;
    size_t open_position_count = 0;
};

/**
 * @brief Cash account plus position book
 *
 * Every instruction either applies completely or is rejected with an error
 * result and leaves cash, positions and counters untouched. Cash never goes
 * negative.
 */
class Portfolio {
public:
    /**
     * @brief Constructor
     * @param initial_capital Starting cash, must be positive
     * @param logger Run logger, may be null
     */
    explicit Portfolio(double initial_capital, std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Execute a buy
     *
     * ENTRY opens a new position and is rejected with DUPLICATE_ENTRY when one
     * is already open. ADD applies to the open position and is rejected with
     * NO_POSITION when none exists. INSUFFICIENT_CASH when
     * price * shares + commission exceeds cash.
     *
     * @param instrument Instrument code
     * @param date Trade date
     * @param price Fill price
     * @param shares Number of shares, positive
     * @param commission Commission charged, non-negative
     * @param kind ENTRY or ADD
     * @param reason Free-text reason recorded on the trade
     * @param dividend Dividend event attached to a newly opened position
     * @param metadata Extra fields recorded on the trade
     * @return The executed trade, or the rejection
     */
    ExecutionResult execute_buy(const std::string& instrument, const Timestamp& date, Price price,
                                Quantity shares, double commission, SignalKind kind,
                                const std::string& reason,
                                const std::optional<DividendInfo>& dividend = std::nullopt,
                                nlohmann::json metadata = nlohmann::json::object());

    /**
     * @brief Sell the entire open position in an instrument
     * @return The executed trade, or NO_POSITION
     */
    ExecutionResult execute_sell(const std::string& instrument, const Timestamp& date, Price price,
                                 double commission, const std::string& reason,
                                 nlohmann::json metadata = nlohmann::json::object());

    /**
     * @brief Credit a dividend to the open position in an instrument
     * @param dividend_per_share Amount per share actually received
     * @return Cash credited, or NO_POSITION
     */
    Result<double> credit_dividend(const std::string& instrument, double dividend_per_share,
                                   const Timestamp& date);

    /**
     * @brief Record the pre-ex-dividend reference price on an open position
     */
    Result<void> set_pre_ex_price(const std::string& instrument, Price price);

    /**
     * @brief Value the portfolio and append the snapshot to the history
     *
     * Instruments missing from prices are marked at their last known price,
     * or at average cost if they were never priced.
     */
    const DailySnapshot& mark_to_market(const Timestamp& date,
                                        const std::unordered_map<std::string, Price>& prices);

    /**
     * @brief Performance figures over the recorded history
     */
    PerformanceMetrics performance_metrics(
        double risk_free_rate = BacktestMetricsCalculator::DEFAULT_RISK_FREE_RATE) const;

    double cash() const {
        return cash_;
    }
    double initial_capital() const {
        return initial_capital_;
    }
    const PositionRegistry& positions() const {
        return registry_;
    }
    const std::vector<DailySnapshot>& history() const {
        return history_;
    }
    double total_commission() const {
        return total_commission_;
    }
    double total_dividend() const {
        return total_dividend_;
    }
    int total_trades() const {
        return total_trades_;
    }
    int winning_trades() const {
        return winning_trades_;
    }
    int losing_trades() const {
        return losing_trades_;
    }

    /**
     * @brief Current value of cash plus open positions at the last known marks
     */
    double total_value() const;

private:
    double initial_capital_;
    double cash_;
    PositionRegistry registry_;
    std::vector<DailySnapshot> history_;
    std::unordered_map<std::string, Price> last_prices_;
    std::shared_ptr<Logger> logger_;

    double total_commission_{0.0};
    double total_dividend_{0.0};
    int total_trades_{0};
    int winning_trades_{0};
    int losing_trades_{0};
};

}  // namespace divcap
