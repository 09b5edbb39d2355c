// include/trend_engine/risk/risk_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"

namespace trend_engine {

enum class SizingMethod {
    RISK_PER_TRADE,   // Equity * risk_per_trade / distance to stop
    FIXED_FRACTIONAL  // Equity * position_fraction of notional
};

inline std::string sizing_method_to_string(SizingMethod method) {
    return method == SizingMethod::FIXED_FRACTIONAL ? "FIXED_FRACTIONAL" : "RISK_PER_TRADE";
}

inline SizingMethod sizing_method_from_string(const std::string& str) {
    return str == "FIXED_FRACTIONAL" ? SizingMethod::FIXED_FRACTIONAL
                                     : SizingMethod::RISK_PER_TRADE;
}

/**
 * @brief Configuration for position sizing and portfolio limits
 */
struct RiskConfig : public ConfigBase {
    // Sizing
    SizingMethod sizing_method{SizingMethod::RISK_PER_TRADE};
    double risk_per_trade{0.01};     // Fraction of equity lost if the stop is hit
    double position_fraction{0.1};   // Notional fraction for fixed-fractional sizing
    double cash_buffer{0.95};        // Fraction of cash usable for a single entry

    // Protective stops
    double stop_loss_pct{0.015};              // Stop distance below the SMA
    double take_profit_pct{0.0};              // Target above entry, 0 disables
    double trailing_profit_threshold{0.15};   // Open profit that activates the trailing stop
    double trailing_atr_multiplier{2.0};      // Trailing distance in ATRs

    // Portfolio limits
    int max_positions{2};
    double max_aggregate_exposure{1.0};  // Gross exposure as a fraction of equity
    bool scale_to_exposure_cap{false};   // Shrink instead of rejecting at the cap

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["sizing_method"] = sizing_method_to_string(sizing_method);
        j["risk_per_trade"] = risk_per_trade;
        j["position_fraction"] = position_fraction;
        j["cash_buffer"] = cash_buffer;
        j["stop_loss_pct"] = stop_loss_pct;
        j["take_profit_pct"] = take_profit_pct;
        j["trailing_profit_threshold"] = trailing_profit_threshold;
        j["trailing_atr_multiplier"] = trailing_atr_multiplier;
        j["max_positions"] = max_positions;
        j["max_aggregate_exposure"] = max_aggregate_exposure;
        j["scale_to_exposure_cap"] = scale_to_exposure_cap;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("sizing_method"))
            sizing_method = sizing_method_from_string(j.at("sizing_method").get<std::string>());
        if (j.contains("risk_per_trade"))
            risk_per_trade = j.at("risk_per_trade").get<double>();
        if (j.contains("position_fraction"))
            position_fraction = j.at("position_fraction").get<double>();
        if (j.contains("cash_buffer"))
            cash_buffer = j.at("cash_buffer").get<double>();
        if (j.contains("stop_loss_pct"))
            stop_loss_pct = j.at("stop_loss_pct").get<double>();
        if (j.contains("take_profit_pct"))
            take_profit_pct = j.at("take_profit_pct").get<double>();
        if (j.contains("trailing_profit_threshold"))
            trailing_profit_threshold = j.at("trailing_profit_threshold").get<double>();
        if (j.contains("trailing_atr_multiplier"))
            trailing_atr_multiplier = j.at("trailing_atr_multiplier").get<double>();
        if (j.contains("max_positions"))
            max_positions = j.at("max_positions").get<int>();
        if (j.contains("max_aggregate_exposure"))
            max_aggregate_exposure = j.at("max_aggregate_exposure").get<double>();
        if (j.contains("scale_to_exposure_cap"))
            scale_to_exposure_cap = j.at("scale_to_exposure_cap").get<bool>();
    }
};

}  // namespace trend_engine
