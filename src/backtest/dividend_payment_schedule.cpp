// src/backtest/dividend_payment_schedule.cpp
#include "divcap/backtest/dividend_payment_schedule.hpp"
#include "divcap/core/time_utils.hpp"

namespace divcap {
namespace backtest {

std::string payment_policy_to_string(DividendPaymentPolicy policy) {
    switch (policy) {
        case DividendPaymentPolicy::EX_DATE:
            return "EX_DATE";
        case DividendPaymentPolicy::RECORD_DATE_OFFSET:
            return "RECORD_DATE_OFFSET";
        case DividendPaymentPolicy::FISCAL_SCHEDULE:
            return "FISCAL_SCHEDULE";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json DividendPaymentConfig::to_json() const {
    nlohmann::json j;
    j["payment_policy"] = payment_policy_to_string(policy);
    j["payment_offset_days"] = payment_offset_days;
    return j;
}

void DividendPaymentConfig::from_json(const nlohmann::json& j) {
    const std::string section = "dividend";
    config::require_exact_keys(j, section, {"payment_policy", "payment_offset_days"});

    std::string policy_str = config::get_field<std::string>(j, section, "payment_policy");
    if (policy_str == "EX_DATE") {
        policy = DividendPaymentPolicy::EX_DATE;
    } else if (policy_str == "RECORD_DATE_OFFSET") {
        policy = DividendPaymentPolicy::RECORD_DATE_OFFSET;
    } else if (policy_str == "FISCAL_SCHEDULE") {
        policy = DividendPaymentPolicy::FISCAL_SCHEDULE;
    } else {
        throw BacktestError(ErrorCode::INVALID_CONFIG,
                            "Unknown dividend.payment_policy: " + policy_str,
                            "DividendPaymentConfig");
    }

    payment_offset_days = config::get_field<int>(j, section, "payment_offset_days");
    if (payment_offset_days < 0) {
        throw BacktestError(ErrorCode::INVALID_CONFIG,
                            "dividend.payment_offset_days must be non-negative",
                            "DividendPaymentConfig");
    }
}

DividendPaymentSchedule::DividendPaymentSchedule(const DividendPaymentConfig& config,
                                                 std::shared_ptr<const BusinessCalendar> calendar)
    : config_(config), calendar_(std::move(calendar)) {
    if (!calendar_) {
        throw BacktestError(ErrorCode::INVALID_ARGUMENT, "Business calendar is required",
                            "DividendPaymentSchedule");
    }
}

Timestamp DividendPaymentSchedule::payment_date(const DividendInfo& dividend) const {
    switch (config_.policy) {
        case DividendPaymentPolicy::EX_DATE:
            return core::to_date(dividend.ex_dividend_date);
        case DividendPaymentPolicy::RECORD_DATE_OFFSET:
            return calendar_->add_business_days(dividend.record_date,
                                                config_.payment_offset_days);
        case DividendPaymentPolicy::FISCAL_SCHEDULE: {
            core::CivilDate record = core::to_civil(dividend.record_date);
            Timestamp estimate;
            if (record.month == 3 || record.month == 4) {
                estimate = core::make_date(record.year, 6, 25);
            } else if (record.month == 9 || record.month == 10) {
                estimate = core::make_date(record.year, 12, 10);
            } else {
                estimate = core::add_days(core::to_date(dividend.record_date), 75);
            }
            return calendar_->roll_forward(estimate);
        }
        default:
            return core::to_date(dividend.ex_dividend_date);
    }
}

}  // namespace backtest
}  // namespace divcap
