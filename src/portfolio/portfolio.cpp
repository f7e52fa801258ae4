// src/portfolio/portfolio.cpp
#include "divcap/portfolio/portfolio.hpp"
#include "divcap/core/time_utils.hpp"

namespace divcap {

Portfolio::Portfolio(double initial_capital, std::shared_ptr<Logger> logger)
    : initial_capital_(initial_capital), cash_(initial_capital), logger_(std::move(logger)) {
    if (initial_capital <= 0.0) {
        throw BacktestError(ErrorCode::INVALID_ARGUMENT, "Initial capital must be positive",
                            "Portfolio");
    }
}

ExecutionResult Portfolio::execute_buy(const std::string& instrument, const Timestamp& date,
                                       Price price, Quantity shares, double commission,
                                       SignalKind kind, const std::string& reason,
                                       const std::optional<DividendInfo>& dividend,
                                       nlohmann::json metadata) {
    if (kind == SignalKind::EXIT) {
        return make_error<Trade>(ErrorCode::INVALID_ARGUMENT,
                                 "EXIT cannot be executed as a buy for " + instrument,
                                 "Portfolio");
    }
    if (shares <= 0 || price <= 0.0 || commission < 0.0) {
        return make_error<Trade>(ErrorCode::INVALID_TRADE,
                                 "Invalid buy for " + instrument + ": " + std::to_string(shares) +
                                     " shares at " + std::to_string(price),
                                 "Portfolio");
    }

    Trade trade = Trade::make(instrument, TradeSide::BUY, date, price, shares, commission, reason,
                              std::move(metadata));
    if (trade.gross_amount > cash_) {
        WARN(logger_, "Insufficient cash for " << instrument << ": need " << trade.gross_amount
                                               << ", have " << cash_);
        return make_error<Trade>(ErrorCode::INSUFFICIENT_CASH,
                                 "Insufficient cash for " + instrument + ": need " +
                                     std::to_string(trade.gross_amount) + ", have " +
                                     std::to_string(cash_),
                                 "Portfolio");
    }

    bool has_position = registry_.has_open_position(instrument);
    if (has_position && kind != SignalKind::ADD) {
        WARN(logger_, "Duplicate entry rejected for " << instrument << " on "
                                                      << core::format_date(date));
        return make_error<Trade>(ErrorCode::DUPLICATE_ENTRY,
                                 "Position already open for " + instrument, "Portfolio");
    }

    if (!has_position && kind == SignalKind::ADD) {
        return make_error<Trade>(ErrorCode::NO_POSITION,
                                 "No open position to add to for " + instrument, "Portfolio");
    }

    auto applied = has_position ? registry_.add_to_position(trade)
                                : registry_.open_position(trade, dividend);
    if (applied.is_error()) {
        return make_error<Trade>(applied.error()->code(), applied.error()->what(), "Portfolio");
    }

    cash_ -= trade.gross_amount;
    total_commission_ += commission;
    ++total_trades_;

    INFO(logger_, "BUY " << instrument << " " << shares << " @ " << price
                         << " (" << signal_kind_to_string(kind) << ", commission " << commission
                         << ", cash " << cash_ << ")");
    return ExecutionResult(std::move(trade));
}

ExecutionResult Portfolio::execute_sell(const std::string& instrument, const Timestamp& date,
                                        Price price, double commission, const std::string& reason,
                                        nlohmann::json metadata) {
    const Position* position = registry_.get_open_position(instrument);
    if (position == nullptr) {
        return make_error<Trade>(ErrorCode::NO_POSITION, "No open position in " + instrument,
                                 "Portfolio");
    }
    if (price <= 0.0 || commission < 0.0) {
        return make_error<Trade>(ErrorCode::INVALID_TRADE,
                                 "Invalid sell price for " + instrument, "Portfolio");
    }

    Trade trade = Trade::make(instrument, TradeSide::SELL, date, price, position->shares(),
                              commission, reason, std::move(metadata));
    auto closed = registry_.close_position(trade);
    if (closed.is_error()) {
        return make_error<Trade>(closed.error()->code(), closed.error()->what(), "Portfolio");
    }

    cash_ += trade.gross_amount;
    total_commission_ += commission;
    ++total_trades_;

    double realized = closed.value().realized_pnl();
    if (realized > 0.0) {
        ++winning_trades_;
    } else if (realized < 0.0) {
        ++losing_trades_;
    }

    INFO(logger_, "SELL " << instrument << " " << trade.shares << " @ " << price << " ("
                          << reason << ", realized " << realized << ", cash " << cash_ << ")");
    return ExecutionResult(std::move(trade));
}

Result<double> Portfolio::credit_dividend(const std::string& instrument,
                                          double dividend_per_share, const Timestamp& date) {
    const Position* position = registry_.get_open_position(instrument);
    if (position == nullptr) {
        return make_error<double>(ErrorCode::NO_POSITION,
                                  "No open position to credit dividend for " + instrument,
                                  "Portfolio");
    }
    if (dividend_per_share < 0.0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Negative dividend for " + instrument, "Portfolio");
    }

    Quantity entitled = position->entitled_shares();
    if (entitled == 0) {
        DEBUG(logger_, "No entitled shares in " << instrument << " for dividend on "
                                                << core::format_date(date));
    }
    double amount = dividend_per_share * static_cast<double>(entitled);
    auto recorded = registry_.record_dividend(instrument, amount);
    if (recorded.is_error()) {
        return make_error<double>(recorded.error()->code(), recorded.error()->what(),
                                  "Portfolio");
    }

    cash_ += amount;
    total_dividend_ += amount;

    INFO(logger_, "DIVIDEND " << instrument << " " << amount << " on "
                              << core::format_date(date));
    return Result<double>(amount);
}

Result<void> Portfolio::set_pre_ex_price(const std::string& instrument, Price price) {
    return registry_.set_pre_ex_price(instrument, price);
}

double Portfolio::total_value() const {
    return cash_ + registry_.market_value(last_prices_);
}

const DailySnapshot& Portfolio::mark_to_market(
    const Timestamp& date, const std::unordered_map<std::string, Price>& prices) {
    for (const auto& [instrument, price] : prices) {
        last_prices_[instrument] = price;
    }

    DailySnapshot snapshot;
    snapshot.date = date;
    snapshot.cash = cash_;
    snapshot.positions_market_value = registry_.market_value(last_prices_);
    snapshot.total_value = snapshot.cash + snapshot.positions_market_value;
    snapshot.open_position_count = registry_.open_count();

    if (!history_.empty() && history_.back().total_value > 0.0) {
        double previous = history_.back().total_value;
        snapshot.daily_return = (snapshot.total_value - previous) / previous;
    }
    snapshot.cumulative_return = (snapshot.total_value - initial_capital_) / initial_capital_;

    history_.push_back(snapshot);
    DEBUG(logger_, "MTM " << core::format_date(date) << " total " << snapshot.total_value
                          << " cash " << snapshot.cash << " positions "
                          << snapshot.open_position_count);
    return history_.back();
}

PerformanceMetrics Portfolio::performance_metrics(double risk_free_rate) const {
    BacktestMetricsCalculator calculator;
    PerformanceMetrics metrics;
    metrics.initial_capital = initial_capital_;
    metrics.final_value = history_.empty() ? total_value() : history_.back().total_value;
    metrics.total_return = calculator.calculate_total_return(initial_capital_, metrics.final_value);
    metrics.trading_days = static_cast<int>(history_.size());

    std::vector<std::pair<Timestamp, double>> equity_curve;
    equity_curve.reserve(history_.size());
    for (const auto& snapshot : history_) {
        equity_curve.emplace_back(snapshot.date, snapshot.total_value);
    }
    std::vector<double> returns = calculator.calculate_returns_from_equity(equity_curve);

    metrics.annualized_return = calculator.calculate_annualized_return(returns);
    metrics.annualized_volatility = calculator.calculate_volatility(returns);
    metrics.sharpe_ratio = calculator.calculate_sharpe_ratio(returns, risk_free_rate);
    metrics.max_drawdown = calculator.calculate_max_drawdown(equity_curve);

    auto stats = calculator.calculate_trade_statistics(registry_.position_records());
    metrics.win_rate = stats.win_rate;
    metrics.profit_factor = stats.profit_factor;
    metrics.avg_win = stats.avg_win;
    metrics.avg_loss = stats.avg_loss;
    metrics.avg_holding_days = stats.avg_holding_days;
    metrics.positions_with_dividend = stats.positions_with_dividend;

    metrics.total_trades = total_trades_;
    metrics.winning_trades = winning_trades_;
    metrics.losing_trades = losing_trades_;
    metrics.total_commission = total_commission_;
    metrics.total_dividend = total_dividend_;
    return metrics;
}

}  // namespace divcap
