// src/portfolio/position.cpp
#include "divcap/portfolio/position.hpp"
#include "divcap/core/time_utils.hpp"

namespace divcap {

Trade Trade::make(const std::string& instrument, TradeSide side, const Timestamp& date,
                  Price price, Quantity shares, double commission, const std::string& reason,
                  nlohmann::json metadata) {
    Trade trade;
    trade.instrument = instrument;
    trade.side = side;
    trade.date = date;
    trade.price = price;
    trade.shares = shares;
    trade.commission = commission;
    double notional = price * static_cast<double>(shares);
    trade.gross_amount = side == TradeSide::BUY ? notional + commission : notional - commission;
    trade.reason = reason;
    trade.metadata = std::move(metadata);
    return trade;
}

namespace {

Result<void> validate_buy(const Trade& buy) {
    if (buy.side != TradeSide::BUY) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Expected a BUY trade for " + buy.instrument, "Position");
    }
    if (buy.shares <= 0 || buy.price <= 0.0 || buy.commission < 0.0) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Buy for " + buy.instrument + " needs positive shares and price",
                                "Position");
    }
    return Result<void>();
}

}  // namespace

Result<Position> Position::open(const Trade& buy, const std::optional<DividendInfo>& dividend) {
    auto valid = validate_buy(buy);
    if (valid.is_error()) {
        return make_error<Position>(valid.error()->code(), valid.error()->what(), "Position");
    }

    Position position;
    position.instrument_ = buy.instrument;
    position.status_ = PositionStatus::OPEN;
    position.entry_date_ = buy.date;
    position.entry_price_ = buy.price;
    position.shares_ = buy.shares;
    position.peak_shares_ = buy.shares;
    position.average_cost_ = buy.price;
    position.opening_commission_ = buy.commission;
    position.total_commission_ = buy.commission;
    position.dividend_ = dividend;
    position.trades_.push_back(buy);
    return Result<Position>(std::move(position));
}

Result<void> Position::add(const Trade& buy) {
    if (!is_open()) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Cannot add to closed position in " + instrument_, "Position");
    }
    if (buy.instrument != instrument_) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Trade for " + buy.instrument + " applied to " + instrument_,
                                "Position");
    }
    auto valid = validate_buy(buy);
    if (valid.is_error()) {
        return valid;
    }

    Quantity shares_after = shares_ + buy.shares;
    average_cost_ = (average_cost_ * static_cast<double>(shares_) + buy.gross_amount) /
                    static_cast<double>(shares_after);
    shares_ = shares_after;
    if (shares_ > peak_shares_) {
        peak_shares_ = shares_;
    }
    total_commission_ += buy.commission;
    trades_.push_back(buy);
    return Result<void>();
}

Result<void> Position::close(const Trade& sell) {
    if (!is_open()) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Position in " + instrument_ + " is already closed", "Position");
    }
    if (sell.side != TradeSide::SELL || sell.instrument != instrument_) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Expected a SELL trade for " + instrument_, "Position");
    }
    if (sell.shares != shares_) {
        return make_error<void>(ErrorCode::INVALID_TRADE,
                                "Sell of " + std::to_string(sell.shares) + " shares does not match " +
                                    std::to_string(shares_) + " held in " + instrument_,
                                "Position");
    }

    double proceeds = sell.price * static_cast<double>(shares_) - sell.commission;
    double cost_basis = average_cost_ * static_cast<double>(shares_) + opening_commission_;
    realized_pnl_ = proceeds - cost_basis + dividend_received_;

    total_commission_ += sell.commission;
    shares_ = 0;
    status_ = PositionStatus::CLOSED;
    exit_date_ = sell.date;
    exit_price_ = sell.price;
    exit_reason_ = sell.reason;
    trades_.push_back(sell);
    return Result<void>();
}

Quantity Position::entitled_shares() const {
    if (!dividend_.has_value()) {
        return shares_;
    }
    Timestamp ex_date = core::to_date(dividend_->ex_dividend_date);
    Quantity entitled = 0;
    for (const auto& trade : trades_) {
        if (trade.side == TradeSide::BUY && core::to_date(trade.date) < ex_date) {
            entitled += trade.shares;
        }
    }
    return entitled;
}

}  // namespace divcap
