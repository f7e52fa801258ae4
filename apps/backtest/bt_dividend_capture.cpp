#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include "divcap/backtest/backtest_config.hpp"
#include "divcap/backtest/backtest_csv_exporter.hpp"
#include "divcap/backtest/backtest_engine.hpp"
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/core/holiday_checker.hpp"
#include "divcap/core/logger.hpp"
#include "divcap/core/time_utils.hpp"
#include "divcap/data/csv_data_provider.hpp"

using namespace divcap;
using namespace divcap::backtest;

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

    try {
        // Load configuration
        BacktestConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load configuration " << config_path << ": "
                      << load_result.error()->what() << std::endl;
            return 1;
        }
        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid configuration: " << valid.error()->what() << std::endl;
            return 1;
        }

        auto logger = std::make_shared<Logger>(config.logging);
        INFO(logger, "Loaded configuration " << config_path << " (version " << config.version
                                             << ")");

        // Business calendar, with exchange holidays when a holiday file is configured
        std::shared_ptr<const BusinessCalendar> calendar;
        if (config.data_source.holiday_file.empty()) {
            calendar = std::make_shared<BusinessCalendar>();
        } else {
            HolidayChecker holidays(logger);
            auto holiday_result = holidays.load(config.data_source.holiday_file);
            if (holiday_result.is_error()) {
                ERROR(logger, "Failed to load holidays: " << holiday_result.error()->what());
                return 1;
            }
            calendar = std::make_shared<BusinessCalendar>(holidays.holiday_dates());
        }

        auto data = std::make_shared<CsvDataProvider>(config.data_source.price_file,
                                                      config.data_source.dividend_file,
                                                      calendar, logger);

        std::cout << "\n=== Backtest Configuration ===" << std::endl;
        std::cout << "Period:          " << core::format_date(config.start_date) << " to "
                  << core::format_date(config.end_date) << std::endl;
        std::cout << "Tickers:         ";
        for (const auto& ticker : config.tickers) {
            std::cout << ticker << " ";
        }
        std::cout << std::endl;
        std::cout << "Initial capital: " << std::fixed << std::setprecision(0)
                  << config.initial_capital << std::endl;
        std::cout << "================================\n" << std::endl;

        BacktestEngine engine(config, data, calendar, logger);
        auto result = engine.run();
        if (result.is_error()) {
            std::cerr << "Backtest failed: " << result.error()->what() << std::endl;
            return 1;
        }

        const auto& results = result.value();
        const auto& metrics = results.metrics;

        std::cout << "\n=== Backtest Results ===" << std::endl;
        std::cout << "Final value:     " << std::fixed << std::setprecision(0)
                  << metrics.final_value << std::endl;
        std::cout << "Total Return:    " << std::fixed << std::setprecision(2)
                  << (metrics.total_return * 100.0) << "%" << std::endl;
        std::cout << "Annual Return:   " << std::fixed << std::setprecision(2)
                  << (metrics.annualized_return * 100.0) << "%" << std::endl;
        std::cout << "Sharpe Ratio:    " << std::fixed << std::setprecision(3)
                  << metrics.sharpe_ratio << std::endl;
        std::cout << "Max Drawdown:    " << std::fixed << std::setprecision(2)
                  << (metrics.max_drawdown * 100.0) << "%" << std::endl;
        std::cout << "Win Rate:        " << std::fixed << std::setprecision(2)
                  << (metrics.win_rate * 100.0) << "%" << std::endl;
        std::cout << "Total Trades:    " << metrics.total_trades << std::endl;
        std::cout << "Dividends:       " << std::fixed << std::setprecision(0)
                  << metrics.total_dividend << std::endl;
        std::cout << "========================\n" << std::endl;

        BacktestCSVExporter exporter(config.output.results_dir);
        auto export_result = exporter.export_all(results, config.output);
        if (export_result.is_error()) {
            ERROR(logger, "Failed to save results: " << export_result.error()->what());
            return 1;
        }
        INFO(logger, "Results written to " << exporter.output_directory());
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
