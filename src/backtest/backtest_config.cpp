// src/backtest/backtest_config.cpp
#include "divcap/backtest/backtest_config.hpp"
#include <set>
#include "divcap/core/time_utils.hpp"

namespace divcap {
namespace backtest {

namespace {

Timestamp parse_config_date(const nlohmann::json& j, const std::string& section,
                            const char* key) {
    std::string text = config::get_field<std::string>(j, section, key);
    auto date = core::parse_date(text);
    if (!date) {
        throw BacktestError(ErrorCode::INVALID_CONFIG,
                            "Invalid date for '" + section + "." + key + "': " + text,
                            "BacktestConfig");
    }
    return *date;
}

}  // namespace

nlohmann::json DataSourceConfig::to_json() const {
    nlohmann::json j;
    j["price_file"] = price_file;
    j["dividend_file"] = dividend_file;
    j["holiday_file"] = holiday_file;
    return j;
}

void DataSourceConfig::from_json(const nlohmann::json& j) {
    const std::string section = "data_source";
    config::require_exact_keys(j, section, {"price_file", "dividend_file", "holiday_file"});
    price_file = config::get_field<std::string>(j, section, "price_file");
    dividend_file = config::get_field<std::string>(j, section, "dividend_file");
    holiday_file = config::get_field<std::string>(j, section, "holiday_file");
}

nlohmann::json OutputConfig::to_json() const {
    nlohmann::json j;
    j["results_dir"] = results_dir;
    j["save_trades"] = save_trades;
    j["save_positions"] = save_positions;
    j["save_portfolio_history"] = save_portfolio_history;
    j["save_signals"] = save_signals;
    return j;
}

void OutputConfig::from_json(const nlohmann::json& j) {
    const std::string section = "output";
    config::require_exact_keys(j, section,
                               {"results_dir", "save_trades", "save_positions",
                                "save_portfolio_history", "save_signals"});
    results_dir = config::get_field<std::string>(j, section, "results_dir");
    save_trades = config::get_field<bool>(j, section, "save_trades");
    save_positions = config::get_field<bool>(j, section, "save_positions");
    save_portfolio_history = config::get_field<bool>(j, section, "save_portfolio_history");
    save_signals = config::get_field<bool>(j, section, "save_signals");
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["version"] = version;
    j["backtest"] = {{"start_date", core::format_date(start_date)},
                     {"end_date", core::format_date(end_date)},
                     {"initial_capital", initial_capital}};
    j["universe"] = {{"tickers", tickers}};
    j["strategy"] = strategy.to_json();
    j["execution"] = execution.to_json();
    j["dividend"] = dividend.to_json();
    j["data_source"] = data_source.to_json();
    j["logging"] = logging.to_json();
    j["output"] = output.to_json();
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    config::require_exact_keys(j, "config",
                               {"version", "backtest", "universe", "strategy", "execution",
                                "dividend", "data_source", "logging", "output"});
    version = config::get_field<std::string>(j, "config", "version");

    const auto& window = j.at("backtest");
    config::require_exact_keys(window, "backtest", {"start_date", "end_date", "initial_capital"});
    start_date = parse_config_date(window, "backtest", "start_date");
    end_date = parse_config_date(window, "backtest", "end_date");
    initial_capital = config::get_field<double>(window, "backtest", "initial_capital");

    const auto& universe = j.at("universe");
    config::require_exact_keys(universe, "universe", {"tickers"});
    tickers = config::get_field<std::vector<std::string>>(universe, "universe", "tickers");

    strategy.from_json(j.at("strategy"));
    execution.from_json(j.at("execution"));
    dividend.from_json(j.at("dividend"));
    data_source.from_json(j.at("data_source"));
    logging.from_json(j.at("logging"));
    output.from_json(j.at("output"));
}

Result<void> BacktestConfig::validate() const {
    if (start_date > end_date) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "backtest.start_date " + core::format_date(start_date) +
                                    " is after backtest.end_date " + core::format_date(end_date),
                                "BacktestConfig");
    }
    if (initial_capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "backtest.initial_capital must be positive", "BacktestConfig");
    }
    if (tickers.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG, "universe.tickers must not be empty",
                                "BacktestConfig");
    }

    std::set<std::string> seen;
    for (const auto& ticker : tickers) {
        if (ticker.empty() || !seen.insert(ticker).second) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "universe.tickers contains an empty or duplicate entry: '" +
                                        ticker + "'",
                                    "BacktestConfig");
        }
    }

    auto strategy_result = strategy.validate();
    if (strategy_result.is_error()) {
        return strategy_result;
    }
    return execution.validate();
}

}  // namespace backtest
}  // namespace divcap
