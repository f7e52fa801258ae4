// include/divcap/strategy/types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "divcap/core/config_base.hpp"
#include "divcap/core/types.hpp"

namespace divcap {

class Position;

/**
 * @brief Parameters of the dividend-capture strategy
 */
struct DividendCaptureConfig : public ConfigBase {
    // Entry
    int days_before_record = 3;         // business days before the record date
    double position_size = 1000000.0;   // currency amount per new position
    int max_positions = 10;             // cap on simultaneously open positions

    // Addition on the ex-dividend date
    bool addition_enabled = true;
    double addition_ratio = 0.5;        // fraction of the initial position value
    bool addition_on_drop_only = true;  // require price below the pre-ex price

    // Exit
    int max_holding_days = 20;          // business days since entry
    double stop_loss_pct = 0.1;         // fraction below average cost
    bool exit_on_window_fill = true;    // exit once price recovers to the pre-ex price

    nlohmann::json to_json() const override;

    /**
     * @brief Load the {entry, addition, exit} sections; all keys required
     */
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Range checks on every parameter
     * @return INVALID_CONFIG naming the first offending field
     */
    Result<void> validate() const;
};

/**
 * @brief Decision emitted by the strategy, consumed once by the engine
 */
struct Signal {
    std::string instrument;
    SignalKind kind{SignalKind::ENTRY};
    Timestamp date;
    Price price{0.0};
    Quantity shares{0};
    std::string reason;
    std::optional<ExitReason> exit_reason;  // set on EXIT signals
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Snapshot of an open position as seen by the strategy
 */
struct PositionInfo {
    Timestamp entry_date;
    Price entry_price{0.0};
    Price average_price{0.0};
    Quantity total_shares{0};
    double initial_value{0.0};  // entry price times shares held
    std::optional<Timestamp> ex_dividend_date;
    std::optional<Price> pre_ex_price;

    static PositionInfo from_position(const Position& position);
};

/**
 * @brief Portfolio state needed to validate a signal
 */
struct PortfolioInfo {
    double cash{0.0};
    size_t open_position_count{0};
};

}  // namespace divcap
