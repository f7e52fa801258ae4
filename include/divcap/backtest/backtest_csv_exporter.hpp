// include/divcap/backtest/backtest_csv_exporter.hpp
#pragma once

#include <string>
#include <vector>
#include "divcap/backtest/backtest_config.hpp"
#include "divcap/backtest/backtest_engine.hpp"
#include "divcap/core/error.hpp"

namespace divcap {
namespace backtest {

/**
 * @brief Writes the result tables of a run into one directory
 *
 * Files: trades.csv, positions.csv, portfolio.csv, signals.csv and
 * metrics.json. Dates are written as YYYY-MM-DD.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(std::string output_directory);

    /**
     * @brief Write every table the output config asks for, plus metrics.json
     * @param results Completed run
     * @param output Which tables to write
     * @return FILE_IO_ERROR if the directory or a file cannot be written
     */
    Result<void> export_all(const BacktestResults& results, const OutputConfig& output) const;

    Result<void> export_trades(const std::vector<Trade>& trades) const;
    Result<void> export_positions(const std::vector<PositionRecord>& positions) const;
    Result<void> export_portfolio_history(const std::vector<DailySnapshot>& history) const;
    Result<void> export_signals(const std::vector<SignalRecord>& signals) const;
    Result<void> export_metrics(const PerformanceMetrics& metrics) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    Result<void> ensure_directory() const;
    std::string file_path(const std::string& name) const;

    std::string output_directory_;
};

}  // namespace backtest
}  // namespace divcap
