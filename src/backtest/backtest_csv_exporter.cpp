// src/backtest/backtest_csv_exporter.cpp
#include "divcap/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "divcap/core/time_utils.hpp"

namespace divcap {
namespace backtest {

namespace {

// Quote a field when it contains a separator, quote or newline
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

Result<void> open_for_writing(std::ofstream& file, const std::string& path) {
    file.open(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", "BacktestCSVExporter");
    }
    file << std::setprecision(10);
    return Result<void>();
}

Result<void> finish(std::ofstream& file, const std::string& path) {
    file.flush();
    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

}  // namespace

BacktestCSVExporter::BacktestCSVExporter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

Result<void> BacktestCSVExporter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create " + output_directory_ + ": " + ec.message(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

std::string BacktestCSVExporter::file_path(const std::string& name) const {
    return (std::filesystem::path(output_directory_) / name).string();
}

Result<void> BacktestCSVExporter::export_all(const BacktestResults& results,
                                             const OutputConfig& output) const {
    if (output.save_trades) {
        auto written = export_trades(results.trades);
        if (written.is_error()) return written;
    }
    if (output.save_positions) {
        auto written = export_positions(results.positions);
        if (written.is_error()) return written;
    }
    if (output.save_portfolio_history) {
        auto written = export_portfolio_history(results.portfolio_history);
        if (written.is_error()) return written;
    }
    if (output.save_signals) {
        auto written = export_signals(results.signals);
        if (written.is_error()) return written;
    }
    return export_metrics(results.metrics);
}

Result<void> BacktestCSVExporter::export_trades(const std::vector<Trade>& trades) const {
    auto dir = ensure_directory();
    if (dir.is_error()) return dir;

    const std::string path = file_path("trades.csv");
    std::ofstream file;
    auto opened = open_for_writing(file, path);
    if (opened.is_error()) return opened;

    file << "date,instrument,kind,price,shares,amount,commission,reason\n";
    for (const auto& trade : trades) {
        file << core::format_date(trade.date) << "," << csv_field(trade.instrument) << ","
             << trade_side_to_string(trade.side) << "," << trade.price << "," << trade.shares
             << "," << trade.gross_amount << "," << trade.commission << ","
             << csv_field(trade.reason) << "\n";
    }
    return finish(file, path);
}

Result<void> BacktestCSVExporter::export_positions(
    const std::vector<PositionRecord>& positions) const {
    auto dir = ensure_directory();
    if (dir.is_error()) return dir;

    const std::string path = file_path("positions.csv");
    std::ofstream file;
    auto opened = open_for_writing(file, path);
    if (opened.is_error()) return opened;

    file << "instrument,status,entry_date,entry_price,shares,peak_shares,average_cost,"
         << "ex_dividend_date,record_date,dividend_per_share,pre_ex_price,"
         << "exit_date,exit_price,exit_reason,realized_pnl,dividend_received,"
         << "total_commission,trade_count\n";
    for (const auto& record : positions) {
        file << csv_field(record.instrument) << "," << position_status_to_string(record.status)
             << "," << core::format_date(record.entry_date) << "," << record.entry_price << ","
             << record.shares << "," << record.peak_shares << "," << record.average_cost << ",";
        if (record.dividend) {
            file << core::format_date(record.dividend->ex_dividend_date) << ","
                 << core::format_date(record.dividend->record_date) << ","
                 << record.dividend->dividend_per_share << ",";
        } else {
            file << ",,,";
        }
        if (record.pre_ex_price) {
            file << *record.pre_ex_price;
        }
        file << "," << (record.exit_date ? core::format_date(*record.exit_date) : "") << ","
             << record.exit_price << "," << csv_field(record.exit_reason) << ","
             << record.realized_pnl << "," << record.dividend_received << "," << record.total_commission << ","
             << record.trade_count << "\n";
    }
    return finish(file, path);
}

Result<void> BacktestCSVExporter::export_portfolio_history(
    const std::vector<DailySnapshot>& history) const {
    auto dir = ensure_directory();
    if (dir.is_error()) return dir;

    const std::string path = file_path("portfolio.csv");
    std::ofstream file;
    auto opened = open_for_writing(file, path);
    if (opened.is_error()) return opened;

    file << "date,cash,positions_value,total_value,daily_return,cumulative_return,"
         << "open_positions\n";
    for (const auto& snapshot : history) {
        file << core::format_date(snapshot.date) << "," << snapshot.cash << ","
             << snapshot.positions_market_value << "," << snapshot.total_value << ","
             << snapshot.daily_return << "," << snapshot.cumulative_return << ","
             << snapshot.open_position_count << "\n";
    }
    return finish(file, path);
}

Result<void> BacktestCSVExporter::export_signals(const std::vector<SignalRecord>& signals) const {
    auto dir = ensure_directory();
    if (dir.is_error()) return dir;

    const std::string path = file_path("signals.csv");
    std::ofstream file;
    auto opened = open_for_writing(file, path);
    if (opened.is_error()) return opened;

    file << "date,instrument,kind,price,shares,reason,executed,rejection\n";
    for (const auto& signal : signals) {
        file << core::format_date(signal.date) << "," << csv_field(signal.instrument) << ","
             << signal_kind_to_string(signal.kind) << "," << signal.price << ","
             << signal.shares << "," << csv_field(signal.reason) << ","
             << (signal.executed ? "true" : "false") << "," << csv_field(signal.rejection)
             << "\n";
    }
    return finish(file, path);
}

Result<void> BacktestCSVExporter::export_metrics(const PerformanceMetrics& metrics) const {
    auto dir = ensure_directory();
    if (dir.is_error()) return dir;

    const std::string path = file_path("metrics.json");
    std::ofstream file;
    auto opened = open_for_writing(file, path);
    if (opened.is_error()) return opened;

    file << metrics.to_json().dump(4) << "\n";
    return finish(file, path);
}

}  // namespace backtest
}  // namespace divcap
