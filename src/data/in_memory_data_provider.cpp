// src/data/in_memory_data_provider.cpp
#include "divcap/data/in_memory_data_provider.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "divcap/core/time_utils.hpp"

namespace divcap {

InMemoryDataProvider::InMemoryDataProvider(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

void InMemoryDataProvider::add_price(const std::string& instrument, const Timestamp& date,
                                     Price close) {
    prices_[instrument][core::to_date(date)] = close;
}

void InMemoryDataProvider::add_dividend(const std::string& instrument,
                                        const DividendInfo& dividend) {
    auto& list = dividends_[instrument];
    list.push_back(dividend);
    std::stable_sort(list.begin(), list.end(), [](const DividendInfo& a, const DividendInfo& b) {
        return a.record_date < b.record_date;
    });
}

void InMemoryDataProvider::clear() {
    instruments_.clear();
    prices_.clear();
    dividends_.clear();
}

Result<void> InMemoryDataProvider::load_data(const std::vector<std::string>& instruments,
                                             const Timestamp& start, const Timestamp& end) {
    if (start > end) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Start date " + core::format_date(start) + " is after end date " +
                                    core::format_date(end),
                                "InMemoryDataProvider");
    }
    instruments_ = instruments;
    DEBUG(logger_, "Data window " << core::format_date(start) << " to " << core::format_date(end)
                                  << " for " << instruments_.size() << " instruments");
    return Result<void>();
}

Result<Price> InMemoryDataProvider::price_on_date(const std::string& instrument,
                                                  const Timestamp& date) const {
    auto series_it = prices_.find(instrument);
    if (series_it == prices_.end() || series_it->second.empty()) {
        return make_error<Price>(ErrorCode::DATA_NOT_FOUND, "No prices for " + instrument,
                                 "InMemoryDataProvider");
    }

    const auto& series = series_it->second;
    auto it = series.upper_bound(core::to_date(date));
    while (it != series.begin()) {
        --it;
        if (std::isfinite(it->second)) {
            return Result<Price>(it->second);
        }
    }
    return make_error<Price>(ErrorCode::DATA_NOT_FOUND,
                             "No price for " + instrument + " on or before " +
                                 core::format_date(date),
                             "InMemoryDataProvider");
}

std::optional<DividendInfo> InMemoryDataProvider::next_dividend(const std::string& instrument,
                                                                const Timestamp& after) const {
    auto it = dividends_.find(instrument);
    if (it == dividends_.end()) {
        return std::nullopt;
    }
    Timestamp day = core::to_date(after);
    for (const auto& dividend : it->second) {
        if (dividend.record_date > day) {
            return dividend;
        }
    }
    return std::nullopt;
}

DataValidationReport InMemoryDataProvider::validate() const {
    DataValidationReport report;

    for (const auto& instrument : instruments_) {
        auto series_it = prices_.find(instrument);
        if (series_it == prices_.end() || series_it->second.empty()) {
            report.errors.push_back(instrument + ": no price data");
            continue;
        }

        const auto& series = series_it->second;
        size_t missing = 0;
        size_t large_moves = 0;
        double previous = std::nan("");
        for (const auto& [date, close] : series) {
            if (!std::isfinite(close)) {
                ++missing;
                continue;
            }
            if (std::isfinite(previous) && previous > 0.0 &&
                std::abs(close - previous) / previous > MAX_DAILY_MOVE) {
                ++large_moves;
            }
            previous = close;
        }

        if (missing == series.size()) {
            report.errors.push_back(instrument + ": all closes are missing");
            continue;
        }
        if (missing > 0) {
            std::ostringstream os;
            os << instrument << ": " << missing << " missing closes";
            report.warnings.push_back(os.str());
        }
        if (large_moves > 0) {
            std::ostringstream os;
            os << instrument << ": " << large_moves << " daily moves above "
               << MAX_DAILY_MOVE * 100.0 << "%";
            report.warnings.push_back(os.str());
        }

        auto dividend_it = dividends_.find(instrument);
        if (dividend_it == dividends_.end() || dividend_it->second.empty()) {
            report.warnings.push_back(instrument + ": no dividend data");
        }
    }
    return report;
}

}  // namespace divcap
