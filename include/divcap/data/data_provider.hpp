// include/divcap/data/data_provider.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "divcap/core/error.hpp"
#include "divcap/core/types.hpp"

namespace divcap {

/**
 * @brief Outcome of the pre-run data quality check
 *
 * Errors abort the backtest; warnings are logged and the run proceeds.
 */
struct DataValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool ok() const {
        return errors.empty();
    }
};

/**
 * @brief Source of historical closes and dividend events
 */
class DataProvider {
public:
    virtual ~DataProvider() = default;

    /**
     * @brief Load everything needed for a run before the day loop starts
     * @param instruments Instruments to load
     * @param start First trading date of the run
     * @param end Last trading date of the run
     * @return Result indicating success or failure
     */
    virtual Result<void> load_data(const std::vector<std::string>& instruments,
                                   const Timestamp& start, const Timestamp& end) = 0;

    /**
     * @brief Close on a date, falling back to the latest earlier close
     * @return The close, or DATA_NOT_FOUND if no close exists on or before the date
     */
    virtual Result<Price> price_on_date(const std::string& instrument,
                                        const Timestamp& date) const = 0;

    /**
     * @brief First dividend whose record date is strictly after a date
     */
    virtual std::optional<DividendInfo> next_dividend(const std::string& instrument,
                                                      const Timestamp& after) const = 0;

    /**
     * @brief Quality check over the loaded instruments
     */
    virtual DataValidationReport validate() const = 0;
};

}  // namespace divcap
