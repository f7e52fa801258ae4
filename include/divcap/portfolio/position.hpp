// include/divcap/portfolio/position.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "divcap/core/error.hpp"
#include "divcap/core/types.hpp"

namespace divcap {

/**
 * @brief Immutable record of one executed trade
 */
struct Trade {
    std::string instrument;
    TradeSide side{TradeSide::BUY};
    Timestamp date;
    Price price{0.0};
    Quantity shares{0};
    double commission{0.0};
    double gross_amount{0.0};  // BUY: price*shares + commission, SELL: price*shares - commission
    std::string reason;
    nlohmann::json metadata = nlohmann::json::object();

    /**
     * @brief Build a trade with its gross amount filled in
     */
    static Trade make(const std::string& instrument, TradeSide side, const Timestamp& date,
                      Price price, Quantity shares, double commission,
                      const std::string& reason,
                      nlohmann::json metadata = nlohmann::json::object());
};

/**
 * @brief One holding in one instrument, from the opening buy to the closing sell
 *
 * Every trade passes through exactly one of open(), add() or close(), and is
 * recorded once. averageCost changes only on buys; the opening buy sets it to
 * the fill price and later buys fold their gross amount (commission included)
 * into it. The opening commission is carried separately and charged against
 * realized P&L when the position closes.
 */
class Position {
public:
    Position() = default;

    /**
     * @brief Open a position from its first buy
     * @param buy Opening trade, must be a BUY with positive shares and price
     * @param dividend Dividend event the position was opened for
     * @return The new open position, or INVALID_TRADE
     */
    static Result<Position> open(const Trade& buy,
                                 const std::optional<DividendInfo>& dividend = std::nullopt);

    /**
     * @brief Apply an additional buy
     * @return INVALID_TRADE if the position is closed or the trade is not a valid buy
     */
    Result<void> add(const Trade& buy);

    /**
     * @brief Close the position with a sell of the full share count
     *
     * realizedPnL = (price*shares - sell commission)
     *             - (averageCost*shares + opening commission)
     *             + dividends received
     *
     * @param sell Closing trade
     * @return INVALID_TRADE if the sell does not match the open share count
     */
    Result<void> close(const Trade& sell);

    /**
     * @brief Accumulate a dividend credit
     */
    void record_dividend(double amount) {
        dividend_received_ += amount;
    }

    void set_pre_ex_price(Price price) {
        pre_ex_price_ = price;
    }

    double market_value(Price price) const {
        return price * static_cast<double>(shares_);
    }

    /**
     * @brief Shares carrying the dividend entitlement
     *
     * Only buys dated before the ex-dividend date settle in time for the record
     * date. Without a dividend event every held share counts.
     */
    Quantity entitled_shares() const;

    double unrealized_pnl(Price price) const {
        return (price - average_cost_) * static_cast<double>(shares_);
    }

    const std::string& instrument() const {
        return instrument_;
    }
    PositionStatus status() const {
        return status_;
    }
    bool is_open() const {
        return status_ == PositionStatus::OPEN;
    }
    const Timestamp& entry_date() const {
        return entry_date_;
    }
    Price entry_price() const {
        return entry_price_;
    }
    Quantity shares() const {
        return shares_;
    }
    Quantity peak_shares() const {
        return peak_shares_;
    }
    double average_cost() const {
        return average_cost_;
    }
    const std::vector<Trade>& trades() const {
        return trades_;
    }
    const std::optional<DividendInfo>& dividend() const {
        return dividend_;
    }
    const std::optional<Price>& pre_ex_price() const {
        return pre_ex_price_;
    }
    double dividend_received() const {
        return dividend_received_;
    }
    const std::optional<Timestamp>& exit_date() const {
        return exit_date_;
    }
    Price exit_price() const {
        return exit_price_;
    }
    const std::string& exit_reason() const {
        return exit_reason_;
    }
    double realized_pnl() const {
        return realized_pnl_;
    }
    double total_commission() const {
        return total_commission_;
    }

private:
    std::string instrument_;
    PositionStatus status_{PositionStatus::OPEN};
    Timestamp entry_date_;
    Price entry_price_{0.0};
    Quantity shares_{0};
    Quantity peak_shares_{0};
    double average_cost_{0.0};
    double opening_commission_{0.0};
    std::vector<Trade> trades_;

    std::optional<DividendInfo> dividend_;
    std::optional<Price> pre_ex_price_;
    double dividend_received_{0.0};

    std::optional<Timestamp> exit_date_;
    Price exit_price_{0.0};
    std::string exit_reason_;
    double realized_pnl_{0.0};
    double total_commission_{0.0};
};

}  // namespace divcap
