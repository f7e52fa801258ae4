// src/strategy/types.cpp
#include "divcap/strategy/types.hpp"
#include "divcap/calendar/business_calendar.hpp"
#include "divcap/portfolio/position.hpp"

namespace divcap {

nlohmann::json DividendCaptureConfig::to_json() const {
    nlohmann::json j;
    j["entry"] = {{"days_before_record", days_before_record},
                  {"position_size", position_size},
                  {"max_positions", max_positions}};
    j["addition"] = {{"enabled", addition_enabled},
                     {"add_ratio", addition_ratio},
                     {"add_on_drop", addition_on_drop_only}};
    j["exit"] = {{"max_holding_days", max_holding_days},
                 {"stop_loss_pct", stop_loss_pct},
                 {"take_profit_on_window_fill", exit_on_window_fill}};
    return j;
}

void DividendCaptureConfig::from_json(const nlohmann::json& j) {
    config::require_exact_keys(j, "strategy", {"entry", "addition", "exit"});

    const auto& entry = j.at("entry");
    config::require_exact_keys(entry, "strategy.entry",
                               {"days_before_record", "position_size", "max_positions"});
    days_before_record = config::get_field<int>(entry, "strategy.entry", "days_before_record");
    position_size = config::get_field<double>(entry, "strategy.entry", "position_size");
    max_positions = config::get_field<int>(entry, "strategy.entry", "max_positions");

    const auto& addition = j.at("addition");
    config::require_exact_keys(addition, "strategy.addition",
                               {"enabled", "add_ratio", "add_on_drop"});
    addition_enabled = config::get_field<bool>(addition, "strategy.addition", "enabled");
    addition_ratio = config::get_field<double>(addition, "strategy.addition", "add_ratio");
    addition_on_drop_only = config::get_field<bool>(addition, "strategy.addition", "add_on_drop");

    const auto& exit = j.at("exit");
    config::require_exact_keys(exit, "strategy.exit",
                               {"max_holding_days", "stop_loss_pct", "take_profit_on_window_fill"});
    max_holding_days = config::get_field<int>(exit, "strategy.exit", "max_holding_days");
    stop_loss_pct = config::get_field<double>(exit, "strategy.exit", "stop_loss_pct");
    exit_on_window_fill =
        config::get_field<bool>(exit, "strategy.exit", "take_profit_on_window_fill");
}

Result<void> DividendCaptureConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, message, "DividendCaptureConfig");
    };

    // Entry must fall before the ex-dividend date to carry the entitlement
    const int min_days_before_record = BusinessCalendar::EX_TO_RECORD_DAYS + 1;
    if (days_before_record < min_days_before_record) {
        return invalid("strategy.entry.days_before_record must be at least " +
                       std::to_string(min_days_before_record) +
                       " so the entry precedes the ex-dividend date");
    }
    if (position_size <= 0.0) {
        return invalid("strategy.entry.position_size must be positive");
    }
    if (max_positions < 1) {
        return invalid("strategy.entry.max_positions must be at least 1");
    }
    if (addition_ratio < 0.0) {
        return invalid("strategy.addition.add_ratio must be non-negative");
    }
    if (max_holding_days < 1) {
        return invalid("strategy.exit.max_holding_days must be at least 1");
    }
    if (stop_loss_pct <= 0.0 || stop_loss_pct >= 1.0) {
        return invalid("strategy.exit.stop_loss_pct must be in (0, 1)");
    }
    return Result<void>();
}

PositionInfo PositionInfo::from_position(const Position& position) {
    PositionInfo info;
    info.entry_date = position.entry_date();
    info.entry_price = position.entry_price();
    info.average_price = position.average_cost();
    info.total_shares = position.shares();
    info.initial_value = position.entry_price() * static_cast<double>(position.shares());
    if (position.dividend()) {
        info.ex_dividend_date = position.dividend()->ex_dividend_date;
    }
    info.pre_ex_price = position.pre_ex_price();
    return info;
}

}  // namespace divcap
