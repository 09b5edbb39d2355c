// include/trend_engine/backtest/backtest_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/logger.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"
#include "trend_engine/portfolio/portfolio_tracker.hpp"
#include "trend_engine/risk/risk_config.hpp"
#include "trend_engine/signals/signal_detector.hpp"
#include "trend_engine/universe/universe_selector.hpp"

namespace trend_engine {
namespace backtest {

/**
 * @brief Run configuration threaded through every component constructor
 */
struct BacktestConfig : public ConfigBase {
    IndicatorConfig indicators;
    UniverseConfig universe;
    SignalConfig signals;
    RiskConfig risk;
    PortfolioConfig portfolio;
    LoggerConfig logging;

    PriceReference fill_price_reference{PriceReference::LAST_CLOSE};
    bool use_benchmark_filter{true};  // Only effective when universe.benchmark_symbol is set
    int progress_log_interval{250};   // Steps between progress lines, 0 disables

    std::string version{"1.0.0"};

    /**
     * @brief Validate every section
     * @return First failing section's error
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["indicators"] = indicators.to_json();
        j["universe"] = universe.to_json();
        j["signals"] = signals.to_json();
        j["risk"] = risk.to_json();
        j["portfolio"] = portfolio.to_json();
        j["logging"] = logging.to_json();
        j["fill_price_reference"] = price_reference_to_string(fill_price_reference);
        j["use_benchmark_filter"] = use_benchmark_filter;
        j["progress_log_interval"] = progress_log_interval;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("indicators"))
            indicators.from_json(j.at("indicators"));
        if (j.contains("universe"))
            universe.from_json(j.at("universe"));
        if (j.contains("signals"))
            signals.from_json(j.at("signals"));
        if (j.contains("risk"))
            risk.from_json(j.at("risk"));
        if (j.contains("portfolio"))
            portfolio.from_json(j.at("portfolio"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("fill_price_reference"))
            fill_price_reference =
                price_reference_from_string(j.at("fill_price_reference").get<std::string>());
        if (j.contains("use_benchmark_filter"))
            use_benchmark_filter = j.at("use_benchmark_filter").get<bool>();
        if (j.contains("progress_log_interval"))
            progress_log_interval = j.at("progress_log_interval").get<int>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

enum class OrderStatus {
    ACCEPTED,  // Filled by the portfolio
    REJECTED,  // Refused by a risk rule or by the portfolio
    DROPPED    // Could not be sized
};

inline std::string order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::ACCEPTED:
            return "ACCEPTED";
        case OrderStatus::REJECTED:
            return "REJECTED";
        case OrderStatus::DROPPED:
            return "DROPPED";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief One line of the order log
 */
struct OrderLogEntry {
    Timestamp timestamp;
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    Price reference_price{0.0};
    Price fill_price{0.0};  // 0 unless accepted
    std::string reason;     // Rationale, e.g. "entry_cross", "stop", "forced_exit"
    OrderStatus status{OrderStatus::ACCEPTED};
    std::string message;

    nlohmann::json to_json() const;
};

/**
 * @brief Everything a run hands to reporting
 */
struct BacktestResults {
    std::vector<PortfolioSnapshot> snapshots;
    std::vector<OrderLogEntry> order_log;

    size_t steps{0};
    size_t accepted{0};
    size_t rejected{0};
    size_t dropped{0};
    double initial_equity{0.0};
    double final_equity{0.0};
    bool stopped_early{false};

    double total_return() const {
        return initial_equity > 0.0 ? (final_equity - initial_equity) / initial_equity : 0.0;
    }

    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace trend_engine
