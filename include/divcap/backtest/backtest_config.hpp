// include/divcap/backtest/backtest_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "divcap/backtest/backtest_execution_manager.hpp"
#include "divcap/backtest/dividend_payment_schedule.hpp"
#include "divcap/core/config_base.hpp"
#include "divcap/core/logger.hpp"
#include "divcap/core/types.hpp"
#include "divcap/strategy/types.hpp"

namespace divcap {
namespace backtest {

/**
 * @brief Input files of a CSV-backed run
 */
struct DataSourceConfig : public ConfigBase {
    std::string price_file{"data/prices.csv"};
    std::string dividend_file{"data/dividends.csv"};
    std::string holiday_file;  // optional exchange holidays, empty for none

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Which result files are written and where
 */
struct OutputConfig : public ConfigBase {
    std::string results_dir{"results"};
    bool save_trades{true};
    bool save_positions{true};
    bool save_portfolio_history{true};
    bool save_signals{true};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Complete configuration of a dividend-capture backtest
 *
 * Loaded once, validated, then handed to the engine by value. Parsing is
 * strict: every section and key is required and unknown keys are rejected.
 */
struct BacktestConfig : public ConfigBase {
    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{10000000.0};
    std::vector<std::string> tickers;

    DividendCaptureConfig strategy;
    BacktestExecutionConfig execution;
    DividendPaymentConfig dividend;
    DataSourceConfig data_source;
    LoggerConfig logging;
    OutputConfig output;

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Cross-field and range checks
     * @return INVALID_CONFIG describing the first problem found
     */
    Result<void> validate() const;
};

}  // namespace backtest
}  // namespace divcap
