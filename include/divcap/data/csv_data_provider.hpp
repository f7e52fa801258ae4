// include/divcap/data/csv_data_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/data/in_memory_data_provider.hpp"

namespace divcap {

/**
 * @brief Data provider reading closes and dividends from CSV files
 *
 * prices file columns: date, ticker, close
 * dividends file columns: ticker, ex_dividend_date, dividend, and an
 * optional record_date. A missing record date is derived from the
 * ex-dividend date with the business calendar.
 *
 * Files are parsed with the Arrow CSV reader; ticker and date columns are
 * read as strings so codes like "7203" keep their text form.
 */
class CsvDataProvider : public InMemoryDataProvider {
public:
    /// Business days past the end date for which dividends are still loaded
    static constexpr int DIVIDEND_LOOKAHEAD_DAYS = 60;
    /// Calendar days before the start date for which closes are still loaded
    static constexpr int PRICE_LOOKBACK_DAYS = 31;

    CsvDataProvider(std::string price_file, std::string dividend_file,
                    std::shared_ptr<const BusinessCalendar> calendar,
                    std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Read both files and keep the rows relevant to the run window
     * @return FILE_NOT_FOUND, INVALID_DATA or CONVERSION_ERROR on failure
     */
    Result<void> load_data(const std::vector<std::string>& instruments, const Timestamp& start,
                           const Timestamp& end) override;

private:
    Result<std::shared_ptr<arrow::Table>> read_table(
        const std::string& path,
        const std::unordered_map<std::string, std::shared_ptr<arrow::DataType>>& column_types)
        const;

    Result<void> load_prices(const std::shared_ptr<arrow::Table>& table,
                             const std::vector<std::string>& instruments, const Timestamp& start,
                             const Timestamp& end);

    Result<void> load_dividends(const std::shared_ptr<arrow::Table>& table,
                                const std::vector<std::string>& instruments,
                                const Timestamp& start, const Timestamp& end);

    std::string price_file_;
    std::string dividend_file_;
    std::shared_ptr<const BusinessCalendar> calendar_;
};

}  // namespace divcap
