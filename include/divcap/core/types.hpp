// include/divcap/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace divcap {

/**
 * @brief Timestamp type for consistent time representation
 * Trading dates are stored as UTC midnight of the calendar day
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 * Used for all price and cash amounts
 */
using Price = double;

/**
 * @brief Share count type
 * Equities trade in whole shares, so quantities are integral
 */
using Quantity = int64_t;

/**
 * @brief Side of an executed trade
 */
enum class TradeSide { BUY, SELL };

/**
 * @brief Kind of a strategy signal
 * Buy routing in the portfolio dispatches on this tag
 */
enum class SignalKind { ENTRY, ADD, EXIT };

/**
 * @brief Reason for closing a position, in evaluation priority order
 */
enum class ExitReason { STOP_LOSS, MAX_HOLDING_PERIOD, WINDOW_FILLED };

/**
 * @brief Lifecycle status of a position
 */
enum class PositionStatus { OPEN, CLOSED };

/**
 * @brief Dividend event for one instrument
 */
struct DividendInfo {
    Timestamp ex_dividend_date;
    Timestamp record_date;
    double dividend_per_share{0.0};
};

inline std::string trade_side_to_string(TradeSide side) {
    return side == TradeSide::BUY ? "BUY" : "SELL";
}

inline std::string signal_kind_to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::ENTRY:
            return "ENTRY";
        case SignalKind::ADD:
            return "ADD";
        case SignalKind::EXIT:
            return "EXIT";
        default:
            return "UNKNOWN";
    }
}

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS:
            return "stop_loss";
        case ExitReason::MAX_HOLDING_PERIOD:
            return "max_holding_period";
        case ExitReason::WINDOW_FILLED:
            return "window_filled";
        default:
            return "unknown";
    }
}

inline std::string position_status_to_string(PositionStatus status) {
    return status == PositionStatus::OPEN ? "OPEN" : "CLOSED";
}

}  // namespace divcap
