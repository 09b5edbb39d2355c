// include/trend_engine/indicators/indicator_engine.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/rolling_window.hpp"

namespace trend_engine {

/**
 * @brief Lookback settings for the per-symbol indicators
 */
struct IndicatorConfig : public ConfigBase {
    int sma_period{150};      // Trend moving average
    int atr_period{14};       // Wilder ATR used by trailing stops
    int slope_lookback{5};    // Bars between the SMA values compared for slope
    int volume_lookback{20};  // Window for average volume and dollar volume

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["sma_period"] = sma_period;
        j["atr_period"] = atr_period;
        j["slope_lookback"] = slope_lookback;
        j["volume_lookback"] = volume_lookback;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("sma_period"))
            sma_period = j.at("sma_period").get<int>();
        if (j.contains("atr_period"))
            atr_period = j.at("atr_period").get<int>();
        if (j.contains("slope_lookback"))
            slope_lookback = j.at("slope_lookback").get<int>();
        if (j.contains("volume_lookback"))
            volume_lookback = j.at("volume_lookback").get<int>();
    }
};

/**
 * @brief Indicator values for one symbol after its latest bar
 *
 * An empty optional means the indicator is still warming up and must not be
 * acted on.
 */
struct IndicatorState {
    std::string symbol;
    Timestamp timestamp;
    size_t bars_seen{0};

    Price close{0.0};
    std::optional<Price> previous_close;

    std::optional<double> sma;
    std::optional<double> previous_sma;
    std::optional<double> sma_slope;  // Fractional change over slope_lookback bars
    std::optional<double> atr;
    std::optional<double> average_volume;
    std::optional<double> average_dollar_volume;

    bool warming_up() const {
        return !sma.has_value();
    }

    /**
     * @brief Distance of the close from the SMA as a fraction of the SMA
     */
    std::optional<double> distance_from_sma() const {
        if (!sma || *sma <= 0.0) {
            return std::nullopt;
        }
        return (close - *sma) / *sma;
    }

    /**
     * @brief Computed indicators by name; warming-up indicators are absent
     */
    std::map<std::string, double> values() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Wilder-smoothed average true range
 */
class AverageTrueRange {
public:
    explicit AverageTrueRange(size_t period);

    void update(double high, double low, std::optional<double> previous_close);

    std::optional<double> value() const {
        return atr_;
    }

private:
    size_t period_;
    size_t count_{0};
    double seed_sum_{0.0};
    std::optional<double> atr_;
};

/**
 * @brief Maintains rolling indicators per symbol from incoming bars
 *
 * Sole owner of IndicatorState; other components read it through
 * get_state(). Bars for a symbol must arrive with strictly increasing
 * timestamps.
 */
class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorConfig config);

    /**
     * @brief Fold one bar into the symbol's indicators
     * @param symbol Symbol the bar belongs to
     * @param bar The bar
     * @return Updated state, SEQUENCE_ERROR for out-of-order or duplicate
     *         timestamps, DATA_ERROR for a bar tagged with another symbol
     */
    Result<IndicatorState> update(const std::string& symbol, const Bar& bar);

    /**
     * @brief Latest state for a symbol, nullptr if no bar was seen
     */
    const IndicatorState* get_state(const std::string& symbol) const;

    std::vector<std::string> get_symbols() const;

    const IndicatorConfig& get_config() const {
        return config_;
    }

    void reset() {
        series_.clear();
    }

private:
    struct SymbolSeries {
        explicit SymbolSeries(const IndicatorConfig& config);

        RollingMean closes;
        RollingMean volumes;
        RollingMean dollar_volumes;
        RollingWindow<double> sma_history;
        AverageTrueRange atr;
        IndicatorState state;
    };

    IndicatorConfig config_;
    std::map<std::string, SymbolSeries> series_;
};

}  // namespace trend_engine
