// src/portfolio/position_registry.cpp
#include "divcap/portfolio/position_registry.hpp"

namespace divcap {

namespace {

PositionRecord to_record(const Position& position) {
    PositionRecord record;
    record.instrument = position.instrument();
    record.status = position.status();
    record.entry_date = position.entry_date();
    record.entry_price = position.entry_price();
    record.shares = position.shares();
    record.peak_shares = position.peak_shares();
    record.average_cost = position.average_cost();
    record.dividend = position.dividend();
    record.pre_ex_price = position.pre_ex_price();
    record.exit_date = position.exit_date();
    record.exit_price = position.exit_price();
    record.exit_reason = position.exit_reason();
    record.realized_pnl = position.realized_pnl();
    record.dividend_received = position.dividend_received();
    record.total_commission = position.total_commission();
    record.trade_count = position.trades().size();
    return record;
}

}  // namespace

Result<void> PositionRegistry::open_position(const Trade& buy,
                                             const std::optional<DividendInfo>& dividend) {
    if (has_open_position(buy.instrument)) {
        return make_error<void>(ErrorCode::DUPLICATE_ENTRY,
                                "Position already open for " + buy.instrument,
                                "PositionRegistry");
    }

    auto opened = Position::open(buy, dividend);
    if (opened.is_error()) {
        return make_error<void>(opened.error()->code(), opened.error()->what(),
                                "PositionRegistry");
    }

    open_.emplace(buy.instrument, opened.take_value());
    trades_.push_back(buy);
    return Result<void>();
}

Result<void> PositionRegistry::add_to_position(const Trade& buy) {
    auto it = open_.find(buy.instrument);
    if (it == open_.end()) {
        return make_error<void>(ErrorCode::NO_POSITION,
                                "No open position to add to for " + buy.instrument,
                                "PositionRegistry");
    }

    auto added = it->second.add(buy);
    if (added.is_error()) {
        return added;
    }
    trades_.push_back(buy);
    return Result<void>();
}

Result<Position> PositionRegistry::close_position(const Trade& sell) {
    auto it = open_.find(sell.instrument);
    if (it == open_.end()) {
        return make_error<Position>(ErrorCode::NO_POSITION,
                                    "No open position to close for " + sell.instrument,
                                    "PositionRegistry");
    }

    auto closed = it->second.close(sell);
    if (closed.is_error()) {
        return make_error<Position>(closed.error()->code(), closed.error()->what(),
                                    "PositionRegistry");
    }

    trades_.push_back(sell);
    closed_.push_back(std::move(it->second));
    open_.erase(it);
    return Result<Position>(closed_.back());
}

Result<void> PositionRegistry::record_dividend(const std::string& instrument, double amount) {
    auto it = open_.find(instrument);
    if (it == open_.end()) {
        return make_error<void>(ErrorCode::NO_POSITION,
                                "No open position to credit dividend for " + instrument,
                                "PositionRegistry");
    }
    it->second.record_dividend(amount);
    return Result<void>();
}

Result<void> PositionRegistry::set_pre_ex_price(const std::string& instrument, Price price) {
    auto it = open_.find(instrument);
    if (it == open_.end()) {
        return make_error<void>(ErrorCode::NO_POSITION, "No open position for " + instrument,
                                "PositionRegistry");
    }
    it->second.set_pre_ex_price(price);
    return Result<void>();
}

const Position* PositionRegistry::get_open_position(const std::string& instrument) const {
    auto it = open_.find(instrument);
    return it == open_.end() ? nullptr : &it->second;
}

double PositionRegistry::market_value(const std::unordered_map<std::string, Price>& prices) const {
    double total = 0.0;
    for (const auto& [instrument, position] : open_) {
        auto price_it = prices.find(instrument);
        Price mark = price_it != prices.end() ? price_it->second : position.average_cost();
        total += position.market_value(mark);
    }
    return total;
}

std::vector<PositionRecord> PositionRegistry::position_records() const {
    std::vector<PositionRecord> records;
    records.reserve(open_.size() + closed_.size());
    for (const auto& [instrument, position] : open_) {
        records.push_back(to_record(position));
    }
    for (const auto& position : closed_) {
        records.push_back(to_record(position));
    }
    return records;
}

}  // namespace divcap
