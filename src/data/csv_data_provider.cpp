// src/data/csv_data_provider.cpp
#include "divcap/data/csv_data_provider.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <cmath>
#include <filesystem>
#include <optional>
#include <set>
#include "divcap/core/time_utils.hpp"

namespace divcap {

namespace {

Result<std::vector<std::optional<std::string>>> extract_strings(
    const std::shared_ptr<arrow::Table>& table, const std::string& name) {
    using Column = std::vector<std::optional<std::string>>;

    auto column = table->GetColumnByName(name);
    if (!column) {
        return make_error<Column>(ErrorCode::INVALID_DATA, "Missing required column: " + name,
                                  "CsvDataProvider");
    }
    if (column->type()->id() != arrow::Type::STRING) {
        return make_error<Column>(ErrorCode::CONVERSION_ERROR,
                                  "Column " + name + " is not a string column",
                                  "CsvDataProvider");
    }

    Column values;
    values.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        auto array = std::static_pointer_cast<arrow::StringArray>(chunk);
        for (int64_t i = 0; i < array->length(); ++i) {
            if (array->IsNull(i)) {
                values.emplace_back(std::nullopt);
            } else {
                values.emplace_back(array->GetString(i));
            }
        }
    }
    return Result<Column>(std::move(values));
}

Result<std::vector<double>> extract_doubles(const std::shared_ptr<arrow::Table>& table,
                                            const std::string& name) {
    auto column = table->GetColumnByName(name);
    if (!column) {
        return make_error<std::vector<double>>(ErrorCode::INVALID_DATA,
                                               "Missing required column: " + name,
                                               "CsvDataProvider");
    }
    if (column->type()->id() != arrow::Type::DOUBLE) {
        return make_error<std::vector<double>>(ErrorCode::CONVERSION_ERROR,
                                               "Column " + name + " is not numeric",
                                               "CsvDataProvider");
    }

    std::vector<double> values;
    values.reserve(static_cast<size_t>(column->length()));
    for (const auto& chunk : column->chunks()) {
        auto array = std::static_pointer_cast<arrow::DoubleArray>(chunk);
        for (int64_t i = 0; i < array->length(); ++i) {
            values.push_back(array->IsNull(i) ? std::nan("") : array->Value(i));
        }
    }
    return Result<std::vector<double>>(std::move(values));
}

}  // namespace

CsvDataProvider::CsvDataProvider(std::string price_file, std::string dividend_file,
                                 std::shared_ptr<const BusinessCalendar> calendar,
                                 std::shared_ptr<Logger> logger)
    : InMemoryDataProvider(std::move(logger)),
      price_file_(std::move(price_file)),
      dividend_file_(std::move(dividend_file)),
      calendar_(std::move(calendar)) {
    if (!calendar_) {
        throw BacktestError(ErrorCode::INVALID_ARGUMENT, "Business calendar is required",
                            "CsvDataProvider");
    }
}

Result<std::shared_ptr<arrow::Table>> CsvDataProvider::read_table(
    const std::string& path,
    const std::unordered_map<std::string, std::shared_ptr<arrow::DataType>>& column_types) const {
    using TablePtr = std::shared_ptr<arrow::Table>;

    if (!std::filesystem::exists(path)) {
        return make_error<TablePtr>(ErrorCode::FILE_NOT_FOUND, "CSV file not found: " + path,
                                    "CsvDataProvider");
    }

    auto maybe_input = arrow::io::ReadableFile::Open(path, arrow::default_memory_pool());
    if (!maybe_input.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + path + ": " +
                                        maybe_input.status().ToString(),
                                    "CsvDataProvider");
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types = column_types;
    convert_options.strings_can_be_null = true;

    auto maybe_reader =
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), *maybe_input, read_options,
                                      parse_options, convert_options);
    if (!maybe_reader.ok()) {
        return make_error<TablePtr>(ErrorCode::CONVERSION_ERROR,
                                    "Failed to create CSV reader for " + path + ": " +
                                        maybe_reader.status().ToString(),
                                    "CsvDataProvider");
    }

    auto maybe_table = (*maybe_reader)->Read();
    if (!maybe_table.ok()) {
        return make_error<TablePtr>(ErrorCode::CONVERSION_ERROR,
                                    "Failed to parse " + path + ": " +
                                        maybe_table.status().ToString(),
                                    "CsvDataProvider");
    }
    return Result<TablePtr>(*maybe_table);
}

Result<void> CsvDataProvider::load_data(const std::vector<std::string>& instruments,
                                        const Timestamp& start, const Timestamp& end) {
    clear();

    auto prices = read_table(price_file_, {{"date", arrow::utf8()},
                                           {"ticker", arrow::utf8()},
                                           {"close", arrow::float64()}});
    if (prices.is_error()) {
        return make_error<void>(prices.error()->code(), prices.error()->what(), "CsvDataProvider");
    }

    auto dividends = read_table(dividend_file_, {{"ticker", arrow::utf8()},
                                                 {"ex_dividend_date", arrow::utf8()},
                                                 {"record_date", arrow::utf8()},
                                                 {"dividend", arrow::float64()}});
    if (dividends.is_error()) {
        return make_error<void>(dividends.error()->code(), dividends.error()->what(),
                                "CsvDataProvider");
    }

    auto price_result = load_prices(prices.value(), instruments, start, end);
    if (price_result.is_error()) {
        return price_result;
    }
    auto dividend_result = load_dividends(dividends.value(), instruments, start, end);
    if (dividend_result.is_error()) {
        return dividend_result;
    }

    INFO(logger_, "Loaded " << prices.value()->num_rows() << " price rows from " << price_file_
                            << " and " << dividends.value()->num_rows()
                            << " dividend rows from " << dividend_file_);
    return InMemoryDataProvider::load_data(instruments, start, end);
}

Result<void> CsvDataProvider::load_prices(const std::shared_ptr<arrow::Table>& table,
                                          const std::vector<std::string>& instruments,
                                          const Timestamp& start, const Timestamp& end) {
    auto dates = extract_strings(table, "date");
    auto tickers = extract_strings(table, "ticker");
    auto closes = extract_doubles(table, "close");
    if (dates.is_error()) {
        return make_error<void>(dates.error()->code(), dates.error()->what(), "CsvDataProvider");
    }
    if (tickers.is_error()) {
        return make_error<void>(tickers.error()->code(), tickers.error()->what(),
                                "CsvDataProvider");
    }
    if (closes.is_error()) {
        return make_error<void>(closes.error()->code(), closes.error()->what(),
                                "CsvDataProvider");
    }

    std::set<std::string> wanted(instruments.begin(), instruments.end());
    Timestamp first = core::add_days(core::to_date(start), -PRICE_LOOKBACK_DAYS);
    Timestamp last = core::to_date(end);

    size_t skipped = 0;
    for (size_t row = 0; row < dates.value().size(); ++row) {
        const auto& ticker = tickers.value()[row];
        const auto& date_text = dates.value()[row];
        if (!ticker || wanted.count(*ticker) == 0) {
            continue;
        }
        auto date = date_text ? core::parse_date(*date_text) : std::nullopt;
        if (!date) {
            ++skipped;
            continue;
        }
        if (*date < first || *date > last) {
            continue;
        }
        add_price(*ticker, *date, closes.value()[row]);
    }

    if (skipped > 0) {
        WARN(logger_, "Skipped " << skipped << " price rows with unparseable dates");
    }
    return Result<void>();
}

Result<void> CsvDataProvider::load_dividends(const std::shared_ptr<arrow::Table>& table,
                                             const std::vector<std::string>& instruments,
                                             const Timestamp& start, const Timestamp& end) {
    auto tickers = extract_strings(table, "ticker");
    auto ex_dates = extract_strings(table, "ex_dividend_date");
    auto amounts = extract_doubles(table, "dividend");
    if (tickers.is_error()) {
        return make_error<void>(tickers.error()->code(), tickers.error()->what(),
                                "CsvDataProvider");
    }
    if (ex_dates.is_error()) {
        return make_error<void>(ex_dates.error()->code(), ex_dates.error()->what(),
                                "CsvDataProvider");
    }
    if (amounts.is_error()) {
        return make_error<void>(amounts.error()->code(), amounts.error()->what(),
                                "CsvDataProvider");
    }

    // record_date is optional
    std::vector<std::optional<std::string>> record_dates(tickers.value().size());
    if (table->GetColumnByName("record_date")) {
        auto records = extract_strings(table, "record_date");
        if (records.is_error()) {
            return make_error<void>(records.error()->code(), records.error()->what(),
                                    "CsvDataProvider");
        }
        record_dates = records.take_value();
    }

    std::set<std::string> wanted(instruments.begin(), instruments.end());
    Timestamp first = core::to_date(start);
    Timestamp last = calendar_->add_business_days(end, DIVIDEND_LOOKAHEAD_DAYS);

    size_t skipped = 0;
    for (size_t row = 0; row < tickers.value().size(); ++row) {
        const auto& ticker = tickers.value()[row];
        if (!ticker || wanted.count(*ticker) == 0) {
            continue;
        }

        const auto& ex_text = ex_dates.value()[row];
        auto ex_date = ex_text ? core::parse_date(*ex_text) : std::nullopt;
        double amount = amounts.value()[row];
        if (!ex_date || !std::isfinite(amount) || amount < 0.0) {
            ++skipped;
            continue;
        }

        DividendInfo dividend;
        dividend.ex_dividend_date = *ex_date;
        dividend.dividend_per_share = amount;

        const auto& record_text = record_dates[row];
        auto record_date = record_text ? core::parse_date(*record_text) : std::nullopt;
        dividend.record_date =
            record_date ? *record_date : calendar_->record_date_from_ex_date(*ex_date);

        if (dividend.record_date < first || dividend.record_date > last) {
            continue;
        }
        add_dividend(*ticker, dividend);
    }

    if (skipped > 0) {
        WARN(logger_, "Skipped " << skipped << " dividend rows with missing dates or amounts");
    }
    return Result<void>();
}

}  // namespace divcap
