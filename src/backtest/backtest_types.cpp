// src/backtest/backtest_types.cpp
#include "trend_engine/backtest/backtest_types.hpp"
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {
namespace backtest {

Result<void> BacktestConfig::validate() const {
    std::vector<std::pair<std::string, Result<void>>> checks;
    checks.emplace_back("indicators", indicators.validate());
    checks.emplace_back("universe", universe.validate());
    checks.emplace_back("signals", signals.validate());
    checks.emplace_back("risk", risk.validate());
    checks.emplace_back("portfolio", portfolio.validate());

    for (const auto& [section, check] : checks) {
        if (check.is_error()) {
            return make_error<void>(check.error()->code(),
                                    section + ": " + check.error()->what(), "BacktestConfig");
        }
    }

    if (universe.min_warmup_bars < indicators.sma_period) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "universe.min_warmup_bars must cover indicators.sma_period",
                                "BacktestConfig");
    }
    if (progress_log_interval < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "progress_log_interval cannot be negative", "BacktestConfig");
    }
    if (signals.shorting_enabled && !portfolio.allow_short) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "signals.shorting_enabled requires portfolio.allow_short",
                                "BacktestConfig");
    }
    return Result<void>();
}

nlohmann::json OrderLogEntry::to_json() const {
    nlohmann::json j;
    j["timestamp"] = core::to_epoch_seconds(timestamp);
    j["date"] = core::format_timestamp(timestamp, "%Y-%m-%d");
    j["symbol"] = symbol;
    j["side"] = side_to_string(side);
    j["quantity"] = quantity;
    j["reference_price"] = reference_price;
    j["fill_price"] = fill_price;
    j["reason"] = reason;
    j["status"] = order_status_to_string(status);
    j["message"] = message;
    return j;
}

nlohmann::json BacktestResults::to_json() const {
    nlohmann::json j;
    j["steps"] = steps;
    j["accepted"] = accepted;
    j["rejected"] = rejected;
    j["dropped"] = dropped;
    j["initial_equity"] = initial_equity;
    j["final_equity"] = final_equity;
    j["total_return"] = total_return();
    j["stopped_early"] = stopped_early;

    j["snapshots"] = nlohmann::json::array();
    for (const auto& snapshot : snapshots) {
        j["snapshots"].push_back(snapshot.to_json());
    }
    j["order_log"] = nlohmann::json::array();
    for (const auto& entry : order_log) {
        j["order_log"].push_back(entry.to_json());
    }
    return j;
}

}  // namespace backtest
}  // namespace trend_engine
