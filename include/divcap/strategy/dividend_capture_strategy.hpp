// include/divcap/strategy/dividend_capture_strategy.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/core/error.hpp"
#include "divcap/strategy/types.hpp"

namespace divcap {

/**
 * @brief Signal generator for buying ahead of a dividend record date
 *
 * Holds only its configuration and calendar. Every check is a pure
 * function of its arguments, so the engine can call them in any order.
 */
class DividendCaptureStrategy {
public:
    /// Minimum tradable share increment
    static constexpr Quantity LOT_SIZE = 100;

    /**
     * @brief Constructor
     * @param config Strategy parameters
     * @param calendar Business calendar for date arithmetic, must not be null
     */
    DividendCaptureStrategy(DividendCaptureConfig config,
                            std::shared_ptr<const BusinessCalendar> calendar);

    /**
     * @brief Entry on the configured number of business days before the record date
     *
     * @param instrument Instrument code
     * @param current_date Trading date being evaluated
     * @param dividend Next dividend event of the instrument
     * @param current_price Close on current_date
     * @return ENTRY sized to whole lots of position_size, or nothing
     */
    std::optional<Signal> check_entry_signal(const std::string& instrument,
                                             const Timestamp& current_date,
                                             const DividendInfo& dividend,
                                             Price current_price) const;

    /**
     * @brief Addition to an open position
     *
     * Only meaningful on the ex-dividend date, which the caller guarantees.
     * Sized to whole lots of initial_value * addition_ratio.
     */
    std::optional<Signal> check_addition_signal(const std::string& instrument,
                                                const Timestamp& current_date,
                                                const PositionInfo& position,
                                                Price current_price, Price pre_ex_price) const;

    /**
     * @brief Exit check with fixed priority: stop loss, max holding period, window fill
     *
     * The window-fill rule needs the pre-ex price, which is only known once
     * the ex-dividend date has been reached.
     */
    std::optional<Signal> check_exit_signal(const std::string& instrument,
                                            const Timestamp& current_date,
                                            const PositionInfo& position,
                                            Price current_price) const;

    /**
     * @brief Check an entry against portfolio limits
     * @return SIGNAL_REJECTED when the position cap is reached or cash is short
     */
    Result<void> validate_signal(const Signal& signal, const PortfolioInfo& portfolio) const;

    const DividendCaptureConfig& config() const {
        return config_;
    }

    const BusinessCalendar& calendar() const {
        return *calendar_;
    }

private:
    Quantity round_to_lot(double amount, Price price) const;

    DividendCaptureConfig config_;
    std::shared_ptr<const BusinessCalendar> calendar_;
};

}  // namespace divcap
