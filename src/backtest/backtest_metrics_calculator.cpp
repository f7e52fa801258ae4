// src/backtest/backtest_metrics_calculator.cpp
#include "divcap/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace divcap {

nlohmann::json PerformanceMetrics::to_json() const {
    auto number = [](double value) -> nlohmann::json {
        if (std::isfinite(value)) {
            return value;
        }
        return nullptr;
    };

    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["final_value"] = final_value;
    j["total_return"] = total_return;
    j["annualized_return"] = number(annualized_return);
    j["annualized_volatility"] = annualized_volatility;
    j["sharpe_ratio"] = number(sharpe_ratio);
    j["max_drawdown"] = max_drawdown;
    j["win_rate"] = win_rate;
    j["profit_factor"] = number(profit_factor);
    j["total_trades"] = total_trades;
    j["winning_trades"] = winning_trades;
    j["losing_trades"] = losing_trades;
    j["avg_win"] = avg_win;
    j["avg_loss"] = avg_loss;
    j["avg_holding_days"] = avg_holding_days;
    j["total_commission"] = total_commission;
    j["total_dividend"] = total_dividend;
    j["positions_with_dividend"] = positions_with_dividend;
    j["trading_days"] = trading_days;
    return j;
}

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

double BacktestMetricsCalculator::calculate_annualized_return(
    const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    return std::pow(1.0 + calculate_mean(returns), TRADING_DAYS_PER_YEAR) - 1.0;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1].second > 0.0) {
            returns.push_back((equity_curve[i].second - equity_curve[i - 1].second) /
                              equity_curve[i - 1].second);
        }
    }
    return returns;
}

// ========== Risk Metrics ==========

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    double mean_return = calculate_mean(returns);
    return calculate_std_dev(returns, mean_return) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                         double risk_free_rate) const {
    double volatility = calculate_volatility(returns);
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (calculate_annualized_return(returns) - risk_free_rate) / volatility;
}

std::vector<std::pair<Timestamp, double>> BacktestMetricsCalculator::calculate_drawdowns(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    std::vector<std::pair<Timestamp, double>> drawdowns;
    drawdowns.reserve(equity_curve.size());

    double peak = 0.0;
    for (const auto& [timestamp, value] : equity_curve) {
        peak = std::max(peak, value);
        double drawdown = peak > 0.0 ? (peak - value) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    double max_drawdown = 0.0;
    for (const auto& [timestamp, drawdown] : calculate_drawdowns(equity_curve)) {
        max_drawdown = std::max(max_drawdown, drawdown);
    }
    return max_drawdown;
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<PositionRecord>& positions) const {
    TradeStatistics stats;
    double holding_days_sum = 0.0;

    for (const auto& record : positions) {
        stats.total_dividend += record.dividend_received;
        if (record.dividend_received > 0.0) {
            ++stats.positions_with_dividend;
        }

        if (record.status != PositionStatus::CLOSED) {
            continue;
        }
        ++stats.closed_positions;

        if (record.realized_pnl > 0.0) {
            ++stats.winning_trades;
            stats.total_profit += record.realized_pnl;
            stats.max_win = std::max(stats.max_win, record.realized_pnl);
        } else if (record.realized_pnl < 0.0) {
            ++stats.losing_trades;
            stats.total_loss += -record.realized_pnl;
            stats.max_loss = std::max(stats.max_loss, -record.realized_pnl);
        }

        if (record.exit_date) {
            auto held = std::chrono::duration_cast<std::chrono::hours>(*record.exit_date -
                                                                       record.entry_date);
            holding_days_sum += static_cast<double>(held.count()) / 24.0;
        }
    }

    if (stats.closed_positions == 0) {
        return stats;
    }

    stats.win_rate = static_cast<double>(stats.winning_trades) / stats.closed_positions;
    stats.avg_holding_days = holding_days_sum / stats.closed_positions;
    if (stats.winning_trades > 0) {
        stats.avg_win = stats.total_profit / stats.winning_trades;
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss = stats.total_loss / stats.losing_trades;
        stats.profit_factor = stats.total_profit / stats.total_loss;
    } else if (stats.winning_trades > 0) {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    }
    return stats;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.empty()) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double value : values) {
        sq_sum += (value - mean) * (value - mean);
    }
    return std::sqrt(sq_sum / values.size());
}

}  // namespace divcap
