// src/backtest/backtest_engine.cpp
#include "divcap/backtest/backtest_engine.hpp"
#include <sstream>
#include "divcap/core/time_utils.hpp"

namespace divcap {
namespace backtest {

BacktestEngine::BacktestEngine(BacktestConfig config, std::shared_ptr<DataProvider> data,
                               std::shared_ptr<const BusinessCalendar> calendar,
                               std::shared_ptr<Logger> logger)
    : config_(std::move(config)),
      data_(std::move(data)),
      calendar_(std::move(calendar)),
      logger_(std::move(logger)),
      strategy_(config_.strategy, calendar_),
      execution_(config_.execution),
      payment_schedule_(config_.dividend, calendar_) {
    if (!data_) {
        throw BacktestError(ErrorCode::INVALID_ARGUMENT, "Data provider is required",
                            "BacktestEngine");
    }
}

Result<BacktestResults> BacktestEngine::run() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR(logger_, "Invalid configuration: " << valid.error()->what());
        return make_error<BacktestResults>(valid.error()->code(), valid.error()->what(),
                                           "BacktestEngine");
    }

    auto prepared = prepare_data();
    if (prepared.is_error()) {
        return make_error<BacktestResults>(prepared.error()->code(), prepared.error()->what(),
                                           "BacktestEngine");
    }

    RunState state(config_.initial_capital, logger_);
    std::vector<Timestamp> days = calendar_->business_days(config_.start_date, config_.end_date);

    INFO(logger_, "Starting backtest " << core::format_date(config_.start_date) << " to "
                                       << core::format_date(config_.end_date) << " over "
                                       << days.size() << " business days, "
                                       << config_.tickers.size() << " instruments");

    for (const auto& date : days) {
        PriceMap prices = fetch_prices(date);
        process_open_positions(date, prices, state);
        process_entries(date, prices, state);
        process_dividends(date, state);
        state.portfolio.mark_to_market(date, prices);
    }

    BacktestResults results;
    results.metrics = state.portfolio.performance_metrics();
    results.trades = state.portfolio.positions().trades();
    results.positions = state.portfolio.positions().position_records();
    results.portfolio_history = state.portfolio.history();
    results.signals = std::move(state.signals);
    results.data_warnings = prepared.take_value();

    INFO(logger_, "Backtest finished: final value " << results.metrics.final_value
                                                    << ", total return "
                                                    << results.metrics.total_return * 100.0
                                                    << "%, " << results.trades.size()
                                                    << " trades");
    return Result<BacktestResults>(std::move(results));
}

Result<std::vector<std::string>> BacktestEngine::prepare_data() const {
    auto loaded = data_->load_data(config_.tickers, config_.start_date, config_.end_date);
    if (loaded.is_error()) {
        ERROR(logger_, "Failed to load data: " << loaded.error()->what());
        return make_error<std::vector<std::string>>(loaded.error()->code(),
                                                    loaded.error()->what(), "BacktestEngine");
    }

    DataValidationReport report = data_->validate();
    for (const auto& warning : report.warnings) {
        WARN(logger_, "Data warning: " << warning);
    }

    if (!report.ok()) {
        std::ostringstream message;
        message << "Data validation failed: ";
        for (size_t i = 0; i < report.errors.size(); ++i) {
            ERROR(logger_, "Data error: " << report.errors[i]);
            message << (i > 0 ? "; " : "") << report.errors[i];
        }
        return make_error<std::vector<std::string>>(ErrorCode::DATA_VALIDATION_FAILED,
                                                    message.str(), "BacktestEngine");
    }
    return Result<std::vector<std::string>>(std::move(report.warnings));
}

BacktestEngine::PriceMap BacktestEngine::fetch_prices(const Timestamp& date) const {
    PriceMap prices;
    for (const auto& instrument : config_.tickers) {
        auto price = data_->price_on_date(instrument, date);
        if (price.is_ok()) {
            prices.emplace(instrument, price.value());
        } else {
            DEBUG(logger_, "No price for " << instrument << " on " << core::format_date(date));
        }
    }
    return prices;
}

void BacktestEngine::process_open_positions(const Timestamp& date, const PriceMap& prices,
                                            RunState& state) const {
    std::vector<std::string> instruments;
    for (const auto& [instrument, position] : state.portfolio.positions().open_positions()) {
        instruments.push_back(instrument);
    }

    for (const auto& instrument : instruments) {
        auto price_it = prices.find(instrument);
        if (price_it == prices.end()) {
            continue;
        }
        const Position* position = state.portfolio.positions().get_open_position(instrument);
        if (position == nullptr) {
            continue;
        }

        PositionInfo info = PositionInfo::from_position(*position);
        bool on_ex_date = info.ex_dividend_date && *info.ex_dividend_date == date;

        auto exit = strategy_.check_exit_signal(instrument, date, info, price_it->second);
        if (exit) {
            execute_signal(*exit, std::nullopt, on_ex_date, state);
            continue;
        }

        if (!on_ex_date || info.pre_ex_price) {
            continue;
        }

        // Reference for the window fill: close of the business day before the ex date
        Timestamp previous_day = calendar_->add_business_days(date, -1);
        auto previous_close = data_->price_on_date(instrument, previous_day);
        Price pre_ex_price = info.entry_price;
        if (previous_close.is_ok()) {
            pre_ex_price = previous_close.value();
        } else {
            WARN(logger_, "No pre-ex close for " << instrument << ", using entry price "
                                                 << info.entry_price);
        }

        auto stored = state.portfolio.set_pre_ex_price(instrument, pre_ex_price);
        if (stored.is_error()) {
            WARN(logger_, stored.error()->what());
            continue;
        }
        info.pre_ex_price = pre_ex_price;

        auto addition = strategy_.check_addition_signal(instrument, date, info,
                                                        price_it->second, pre_ex_price);
        if (addition) {
            execute_signal(*addition, std::nullopt, true, state);
        }
    }
}

void BacktestEngine::process_entries(const Timestamp& date, const PriceMap& prices,
                                     RunState& state) const {
    const auto max_positions = static_cast<size_t>(config_.strategy.max_positions);

    for (const auto& instrument : config_.tickers) {
        if (state.portfolio.positions().open_count() >= max_positions) {
            break;
        }
        if (state.portfolio.positions().has_open_position(instrument)) {
            continue;
        }
        auto price_it = prices.find(instrument);
        if (price_it == prices.end()) {
            continue;
        }

        auto dividend = data_->next_dividend(instrument, date);
        if (!dividend) {
            continue;
        }

        auto entry = strategy_.check_entry_signal(instrument, date, *dividend, price_it->second);
        if (!entry) {
            continue;
        }

        PortfolioInfo portfolio_info{state.portfolio.cash(),
                                     state.portfolio.positions().open_count()};
        auto valid = strategy_.validate_signal(*entry, portfolio_info);
        if (valid.is_error()) {
            INFO(logger_, "Entry rejected for " << instrument << ": " << valid.error()->what());
            record_signal(*entry, false, valid.error()->what(), state);
            continue;
        }

        execute_signal(*entry, dividend, dividend->ex_dividend_date == date, state);
    }
}

void BacktestEngine::process_dividends(const Timestamp& date, RunState& state) const {
    std::vector<std::pair<std::string, DividendInfo>> due;
    for (const auto& [instrument, position] : state.portfolio.positions().open_positions()) {
        const auto& dividend = position.dividend();
        if (!dividend) {
            continue;
        }
        if (state.dividends_paid.count({instrument, dividend->ex_dividend_date}) != 0) {
            continue;
        }
        if (payment_schedule_.payment_date(*dividend) == date) {
            due.emplace_back(instrument, *dividend);
        }
    }

    for (const auto& [instrument, dividend] : due) {
        double net_per_share = execution_.net_dividend(dividend.dividend_per_share);
        auto credited = state.portfolio.credit_dividend(instrument, net_per_share, date);
        if (credited.is_error()) {
            WARN(logger_, "Dividend not credited for " << instrument << ": "
                                                       << credited.error()->what());
            continue;
        }
        state.dividends_paid.insert({instrument, dividend.ex_dividend_date});
    }
}

bool BacktestEngine::execute_signal(const Signal& signal,
                                    const std::optional<DividendInfo>& dividend,
                                    bool ex_dividend_date, RunState& state) const {
    nlohmann::json metadata = signal.metadata;
    metadata["signal_price"] = signal.price;

    if (signal.kind == SignalKind::EXIT) {
        Price fill = execution_.apply_slippage(signal.price, TradeSide::SELL, ex_dividend_date);
        double commission = execution_.calculate_commission(fill, signal.shares);
        auto sold = state.portfolio.execute_sell(signal.instrument, signal.date, fill, commission,
                                                 signal.reason, std::move(metadata));
        if (sold.is_error()) {
            WARN(logger_, "Exit failed for " << signal.instrument << ": "
                                             << sold.error()->what());
            record_signal(signal, false, sold.error()->what(), state);
            return false;
        }
        record_signal(signal, true, "", state);
        return true;
    }

    Price fill = execution_.apply_slippage(signal.price, TradeSide::BUY, ex_dividend_date);
    double commission = execution_.calculate_commission(fill, signal.shares);
    auto bought = state.portfolio.execute_buy(signal.instrument, signal.date, fill, signal.shares,
                                              commission, signal.kind, signal.reason, dividend,
                                              std::move(metadata));
    if (bought.is_error()) {
        WARN(logger_, signal_kind_to_string(signal.kind)
                          << " failed for " << signal.instrument << ": "
                          << bought.error()->what());
        record_signal(signal, false, bought.error()->what(), state);
        return false;
    }
    record_signal(signal, true, "", state);
    return true;
}

void BacktestEngine::record_signal(const Signal& signal, bool executed,
                                   const std::string& rejection, RunState& state) const {
    SignalRecord record;
    record.date = signal.date;
    record.instrument = signal.instrument;
    record.kind = signal.kind;
    record.price = signal.price;
    record.shares = signal.shares;
    record.reason = signal.reason;
    record.executed = executed;
    record.rejection = rejection;
    state.signals.push_back(std::move(record));
}

}  // namespace backtest
}  // namespace divcap
