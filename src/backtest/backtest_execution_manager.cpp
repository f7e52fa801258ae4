// src/backtest/backtest_execution_manager.cpp
#include "divcap/backtest/backtest_execution_manager.hpp"
#include <algorithm>

namespace divcap {
namespace backtest {

nlohmann::json BacktestExecutionConfig::to_json() const {
    nlohmann::json j;
    j["slippage"] = slippage;
    j["slippage_ex_date"] = slippage_ex_date;
    j["commission"] = commission_rate;
    j["min_commission"] = min_commission;
    j["max_commission"] = max_commission;
    j["tax_rate"] = tax_rate;
    return j;
}

void BacktestExecutionConfig::from_json(const nlohmann::json& j) {
    const std::string section = "execution";
    config::require_exact_keys(j, section,
                               {"slippage", "slippage_ex_date", "commission", "min_commission",
                                "max_commission", "tax_rate"});
    slippage = config::get_field<double>(j, section, "slippage");
    slippage_ex_date = config::get_field<double>(j, section, "slippage_ex_date");
    commission_rate = config::get_field<double>(j, section, "commission");
    min_commission = config::get_field<double>(j, section, "min_commission");
    max_commission = config::get_field<double>(j, section, "max_commission");
    tax_rate = config::get_field<double>(j, section, "tax_rate");
}

Result<void> BacktestExecutionConfig::validate() const {
    auto in_unit_range = [](double value) { return value >= 0.0 && value < 1.0; };

    if (!in_unit_range(slippage) || !in_unit_range(slippage_ex_date)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "execution slippage must be in [0, 1)",
                                "BacktestExecutionConfig");
    }
    if (!in_unit_range(commission_rate)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "execution.commission must be in [0, 1)",
                                "BacktestExecutionConfig");
    }
    if (min_commission < 0.0 || max_commission < min_commission) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "execution requires 0 <= min_commission <= max_commission",
                                "BacktestExecutionConfig");
    }
    if (!in_unit_range(tax_rate)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "execution.tax_rate must be in [0, 1)",
                                "BacktestExecutionConfig");
    }
    return Result<void>();
}

BacktestExecutionManager::BacktestExecutionManager(const BacktestExecutionConfig& config)
    : config_(config) {}

Price BacktestExecutionManager::apply_slippage(Price price, TradeSide side,
                                               bool ex_dividend_date) const {
    double rate = ex_dividend_date ? config_.slippage_ex_date : config_.slippage;
    return side == TradeSide::BUY ? price * (1.0 + rate) : price * (1.0 - rate);
}

double BacktestExecutionManager::calculate_commission(Price price, Quantity shares) const {
    double notional = price * static_cast<double>(shares);
    return std::clamp(notional * config_.commission_rate, config_.min_commission,
                      config_.max_commission);
}

}  // namespace backtest
}  // namespace divcap
