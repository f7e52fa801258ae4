// include/divcap/portfolio/position_registry.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "divcap/core/error.hpp"
#include "divcap/portfolio/position.hpp"

namespace divcap {

/**
 * @brief Flat row describing one position, open or closed
 */
struct PositionRecord {
    std::string instrument;
    PositionStatus status{PositionStatus::OPEN};
    Timestamp entry_date;
    Price entry_price{0.0};
    Quantity shares{0};       // currently held
    Quantity peak_shares{0};  // largest holding over the position's life
    double average_cost{0.0};
    std::optional<DividendInfo> dividend;
    std::optional<Price> pre_ex_price;
    std::optional<Timestamp> exit_date;
    Price exit_price{0.0};
    std::string exit_reason;
    double realized_pnl{0.0};
    double dividend_received{0.0};
    double total_commission{0.0};
    size_t trade_count{0};
};

/**
 * @brief Book of all positions and the global trade log
 *
 * Open positions are keyed by instrument, so at most one holding per
 * instrument is active and iteration order is deterministic. A position
 * moves to the closed list in the same call that reduces it to zero shares.
 */
class PositionRegistry {
public:
    /**
     * @brief Open a new position
     * @return DUPLICATE_ENTRY if the instrument already has an open position
     */
    Result<void> open_position(const Trade& buy,
                               const std::optional<DividendInfo>& dividend = std::nullopt);

    /**
     * @brief Apply an additional buy to an open position
     * @return NO_POSITION if nothing is open for the instrument
     */
    Result<void> add_to_position(const Trade& buy);

    /**
     * @brief Close an open position and move it to the closed list
     * @return The closed position, or NO_POSITION / INVALID_TRADE
     */
    Result<Position> close_position(const Trade& sell);

    Result<void> record_dividend(const std::string& instrument, double amount);

    Result<void> set_pre_ex_price(const std::string& instrument, Price price);

    bool has_open_position(const std::string& instrument) const {
        return open_.find(instrument) != open_.end();
    }

    /**
     * @brief Look up an open position
     * @return Pointer into the registry, or nullptr; invalidated by the next close
     */
    const Position* get_open_position(const std::string& instrument) const;

    const std::map<std::string, Position>& open_positions() const {
        return open_;
    }

    const std::vector<Position>& closed_positions() const {
        return closed_;
    }

    const std::vector<Trade>& trades() const {
        return trades_;
    }

    size_t open_count() const {
        return open_.size();
    }

    size_t closed_count() const {
        return closed_.size();
    }

    /**
     * @brief Market value of all open positions
     * @param prices Mark prices by instrument; a missing price marks at average cost
     */
    double market_value(const std::unordered_map<std::string, Price>& prices) const;

    /**
     * @brief Summary rows, open positions first in instrument order, then closed ones
     */
    std::vector<PositionRecord> position_records() const;

private:
    std::map<std::string, Position> open_;
    std::vector<Position> closed_;
    std::vector<Trade> trades_;
};

}  // namespace divcap
