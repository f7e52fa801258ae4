// include/divcap/backtest/backtest_engine.hpp
#pragma once

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "divcap/backtest/backtest_config.hpp"
#include "divcap/backtest/backtest_execution_manager.hpp"
#include "divcap/backtest/backtest_metrics_calculator.hpp"
#include "divcap/backtest/dividend_payment_schedule.hpp"
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/core/error.hpp"
#include "divcap/core/logger.hpp"
#include "divcap/data/data_provider.hpp"
#include "divcap/portfolio/portfolio.hpp"
#include "divcap/strategy/dividend_capture_strategy.hpp"

namespace divcap {
namespace backtest {

/**
 * @brief One generated signal and what became of it
 */
struct SignalRecord {
    Timestamp date;
    std::string instrument;
    SignalKind kind{SignalKind::ENTRY};
    Price price{0.0};
    Quantity shares{0};
    std::string reason;
    bool executed{false};
    std::string rejection;  // empty when executed
};

/**
 * @brief Everything a completed run produces
 */
struct BacktestResults {
    PerformanceMetrics metrics;
    std::vector<Trade> trades;
    std::vector<PositionRecord> positions;
    std::vector<DailySnapshot> portfolio_history;
    std::vector<SignalRecord> signals;
    std::vector<std::string> data_warnings;
};

/**
 * @brief Day-by-day simulation of the dividend-capture strategy
 *
 * Each business day in the configured window runs, in order:
 *  1. price lookup for every instrument in the universe
 *  2. open positions: exit check, otherwise the ex-dividend date addition
 *  3. new entries while below the position cap
 *  4. dividend credits due today
 *  5. mark to market
 *
 * Instruments without a price on a day are skipped for that day. Each call
 * to run() starts from a fresh portfolio, so repeated runs over the same
 * data produce identical results.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructor
     * @param config Validated run configuration
     * @param data Price and dividend source, must not be null
     * @param calendar Business calendar, must not be null
     * @param logger Run logger, may be null
     */
    BacktestEngine(BacktestConfig config, std::shared_ptr<DataProvider> data,
                   std::shared_ptr<const BusinessCalendar> calendar,
                   std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Run the backtest over the configured window
     * @return Results, or INVALID_CONFIG / DATA_VALIDATION_FAILED / load errors
     */
    Result<BacktestResults> run();

    const BacktestConfig& config() const {
        return config_;
    }

private:
    using PriceMap = std::unordered_map<std::string, Price>;

    /// Mutable state of one run
    struct RunState {
        explicit RunState(double initial_capital, std::shared_ptr<Logger> logger)
            : portfolio(initial_capital, std::move(logger)) {}

        Portfolio portfolio;
        std::vector<SignalRecord> signals;
        std::set<std::pair<std::string, Timestamp>> dividends_paid;
    };

    /**
     * @brief Load the universe and run the quality check
     * @return Validation warnings, or DATA_VALIDATION_FAILED listing every error
     */
    Result<std::vector<std::string>> prepare_data() const;
    PriceMap fetch_prices(const Timestamp& date) const;

    void process_open_positions(const Timestamp& date, const PriceMap& prices,
                                RunState& state) const;
    void process_entries(const Timestamp& date, const PriceMap& prices, RunState& state) const;
    void process_dividends(const Timestamp& date, RunState& state) const;

    bool execute_signal(const Signal& signal, const std::optional<DividendInfo>& dividend,
                        bool ex_dividend_date, RunState& state) const;
    void record_signal(const Signal& signal, bool executed, const std::string& rejection,
                       RunState& state) const;

    const BacktestConfig config_;
    std::shared_ptr<DataProvider> data_;
    std::shared_ptr<const BusinessCalendar> calendar_;
    std::shared_ptr<Logger> logger_;
    DividendCaptureStrategy strategy_;
    BacktestExecutionManager execution_;
    DividendPaymentSchedule payment_schedule_;
};

}  // namespace backtest
}  // namespace divcap
