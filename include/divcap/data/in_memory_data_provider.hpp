// include/divcap/data/in_memory_data_provider.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "divcap/core/logger.hpp"
#include "divcap/data/data_provider.hpp"

namespace divcap {

/**
 * @brief Data provider backed by in-process price series and dividend lists
 *
 * A NaN close marks a missing observation. Dividends are kept sorted by
 * record date.
 */
class InMemoryDataProvider : public DataProvider {
public:
    /// Single-day move above which a close is reported as suspicious
    static constexpr double MAX_DAILY_MOVE = 0.5;

    explicit InMemoryDataProvider(std::shared_ptr<Logger> logger = nullptr);

    void add_price(const std::string& instrument, const Timestamp& date, Price close);

    void add_dividend(const std::string& instrument, const DividendInfo& dividend);

    /**
     * @brief Restrict subsequent queries and validation to the given instruments
     *
     * Instruments without any stored data are kept so validation reports them.
     */
    Result<void> load_data(const std::vector<std::string>& instruments, const Timestamp& start,
                           const Timestamp& end) override;

    Result<Price> price_on_date(const std::string& instrument,
                                const Timestamp& date) const override;

    std::optional<DividendInfo> next_dividend(const std::string& instrument,
                                              const Timestamp& after) const override;

    /**
     * @brief Errors for instruments with no usable close; warnings for missing
     * closes, moves above MAX_DAILY_MOVE and instruments without dividends
     */
    DataValidationReport validate() const override;

    const std::vector<std::string>& instruments() const {
        return instruments_;
    }

protected:
    void clear();

    std::shared_ptr<Logger> logger_;
    std::vector<std::string> instruments_;
    std::map<std::string, std::map<Timestamp, Price>> prices_;
    std::map<std::string, std::vector<DividendInfo>> dividends_;
};

}  // namespace divcap
