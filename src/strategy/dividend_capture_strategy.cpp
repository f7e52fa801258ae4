// src/strategy/dividend_capture_strategy.cpp
#include "divcap/strategy/dividend_capture_strategy.hpp"
#include <cmath>
#include "divcap/core/time_utils.hpp"

namespace divcap {

DividendCaptureStrategy::DividendCaptureStrategy(DividendCaptureConfig config,
                                                 std::shared_ptr<const BusinessCalendar> calendar)
    : config_(std::move(config)), calendar_(std::move(calendar)) {
    if (!calendar_) {
        throw BacktestError(ErrorCode::INVALID_ARGUMENT, "Business calendar is required",
                            "DividendCaptureStrategy");
    }
}

Quantity DividendCaptureStrategy::round_to_lot(double amount, Price price) const {
    if (price <= 0.0 || amount <= 0.0) {
        return 0;
    }
    double lots = std::floor(amount / price / static_cast<double>(LOT_SIZE));
    return static_cast<Quantity>(lots) * LOT_SIZE;
}

std::optional<Signal> DividendCaptureStrategy::check_entry_signal(
    const std::string& instrument, const Timestamp& current_date, const DividendInfo& dividend,
    Price current_price) const {
    if (current_price <= 0.0) {
        return std::nullopt;
    }

    Timestamp entry_date =
        calendar_->entry_date_from_record_date(dividend.record_date, config_.days_before_record);
    if (core::to_date(current_date) != entry_date) {
        return std::nullopt;
    }

    Quantity shares = round_to_lot(config_.position_size, current_price);
    if (shares <= 0) {
        return std::nullopt;
    }

    Signal signal;
    signal.instrument = instrument;
    signal.kind = SignalKind::ENTRY;
    signal.date = current_date;
    signal.price = current_price;
    signal.shares = shares;
    signal.reason = "entry " + std::to_string(config_.days_before_record) +
                    " business days before record date " + core::format_date(dividend.record_date);
    signal.metadata = {{"record_date", core::format_date(dividend.record_date)},
                       {"ex_dividend_date", core::format_date(dividend.ex_dividend_date)},
                       {"dividend_per_share", dividend.dividend_per_share}};
    return signal;
}

std::optional<Signal> DividendCaptureStrategy::check_addition_signal(
    const std::string& instrument, const Timestamp& current_date, const PositionInfo& position,
    Price current_price, Price pre_ex_price) const {
    if (!config_.addition_enabled || current_price <= 0.0) {
        return std::nullopt;
    }
    if (config_.addition_on_drop_only && !(current_price < pre_ex_price)) {
        return std::nullopt;
    }

    Quantity shares = round_to_lot(position.initial_value * config_.addition_ratio, current_price);
    if (shares <= 0) {
        return std::nullopt;
    }

    double drop_pct = pre_ex_price > 0.0 ? (pre_ex_price - current_price) / pre_ex_price : 0.0;

    Signal signal;
    signal.instrument = instrument;
    signal.kind = SignalKind::ADD;
    signal.date = current_date;
    signal.price = current_price;
    signal.shares = shares;
    signal.reason = "addition on ex-dividend date";
    signal.metadata = {{"pre_ex_price", pre_ex_price}, {"drop_pct", drop_pct}};
    return signal;
}

std::optional<Signal> DividendCaptureStrategy::check_exit_signal(const std::string& instrument,
                                                                 const Timestamp& current_date,
                                                                 const PositionInfo& position,
                                                                 Price current_price) const {
    if (position.total_shares <= 0 || current_price <= 0.0) {
        return std::nullopt;
    }

    int holding_days = calendar_->business_days_between(position.entry_date, current_date);

    std::optional<ExitReason> reason;
    if (current_price <= position.average_price * (1.0 - config_.stop_loss_pct)) {
        reason = ExitReason::STOP_LOSS;
    } else if (holding_days >= config_.max_holding_days) {
        reason = ExitReason::MAX_HOLDING_PERIOD;
    } else if (config_.exit_on_window_fill && position.pre_ex_price &&
               current_price >= *position.pre_ex_price) {
        reason = ExitReason::WINDOW_FILLED;
    }

    if (!reason) {
        return std::nullopt;
    }

    double pnl_pct = position.average_price > 0.0
                         ? (current_price - position.average_price) / position.average_price
                         : 0.0;

    Signal signal;
    signal.instrument = instrument;
    signal.kind = SignalKind::EXIT;
    signal.date = current_date;
    signal.price = current_price;
    signal.shares = position.total_shares;
    signal.reason = exit_reason_to_string(*reason);
    signal.exit_reason = reason;
    signal.metadata = {{"exit_reason", exit_reason_to_string(*reason)},
                       {"holding_days", holding_days},
                       {"pnl_pct", pnl_pct}};
    return signal;
}

Result<void> DividendCaptureStrategy::validate_signal(const Signal& signal,
                                                      const PortfolioInfo& portfolio) const {
    if (signal.kind != SignalKind::ENTRY) {
        return Result<void>();
    }

    if (portfolio.open_position_count >= static_cast<size_t>(config_.max_positions)) {
        return make_error<void>(ErrorCode::SIGNAL_REJECTED,
                                "Max positions reached (" + std::to_string(config_.max_positions) +
                                    ") for " + signal.instrument,
                                "DividendCaptureStrategy");
    }

    double required = signal.price * static_cast<double>(signal.shares);
    if (portfolio.cash < required) {
        return make_error<void>(ErrorCode::SIGNAL_REJECTED,
                                "Insufficient cash for " + signal.instrument + ": need " +
                                    std::to_string(required) + ", have " +
                                    std::to_string(portfolio.cash),
                                "DividendCaptureStrategy");
    }
    return Result<void>();
}

}  // namespace divcap
