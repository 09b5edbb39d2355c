// include/trend_engine/universe/universe_selector.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"

namespace trend_engine {

/**
 * @brief Eligibility rules for the tradable universe
 */
struct UniverseConfig : public ConfigBase {
    double min_price{5.0};           // Minimum last close
    double min_average_volume{0.0};  // Minimum average volume, 0 disables the rule
    int min_warmup_bars{150};        // Bars a symbol must have history for
    int universe_size{100};          // Top-N by average dollar volume, 0 means no limit
    std::string benchmark_symbol;    // Regime filter symbol, never traded

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_price"] = min_price;
        j["min_average_volume"] = min_average_volume;
        j["min_warmup_bars"] = min_warmup_bars;
        j["universe_size"] = universe_size;
        j["benchmark_symbol"] = benchmark_symbol;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_price"))
            min_price = j.at("min_price").get<double>();
        if (j.contains("min_average_volume"))
            min_average_volume = j.at("min_average_volume").get<double>();
        if (j.contains("min_warmup_bars"))
            min_warmup_bars = j.at("min_warmup_bars").get<int>();
        if (j.contains("universe_size"))
            universe_size = j.at("universe_size").get<int>();
        if (j.contains("benchmark_symbol"))
            benchmark_symbol = j.at("benchmark_symbol").get<std::string>();
    }
};

/**
 * @brief Eligible set for one step plus open positions that lost eligibility
 */
struct UniverseSelection {
    Timestamp as_of;
    std::set<std::string> eligible;
    std::set<std::string> forced_exit;

    bool is_eligible(const std::string& symbol) const {
        return eligible.count(symbol) > 0;
    }

    bool is_forced_exit(const std::string& symbol) const {
        return forced_exit.count(symbol) > 0;
    }
};

/**
 * @brief Filters the tradable symbol set per step
 *
 * Pure function of the indicator history up to `as_of`; ranking ties are
 * broken by symbol so repeated runs select the same universe.
 */
class UniverseSelector {
public:
    UniverseSelector(UniverseConfig config, const IndicatorEngine& indicators);

    /**
     * @brief Eligible subset of the candidates at a timestamp
     * @param as_of Step timestamp; indicator states newer than this are ignored
     * @param candidates Symbols to consider
     */
    std::set<std::string> eligible(const Timestamp& as_of,
                                   const std::set<std::string>& candidates) const;

    /**
     * @brief Eligible set plus forced-exit flags for open positions
     * @param as_of Step timestamp
     * @param candidates Symbols to consider
     * @param open_positions Symbols currently held
     */
    UniverseSelection select(const Timestamp& as_of, const std::set<std::string>& candidates,
                             const std::set<std::string>& open_positions) const;

    /**
     * @brief Whether the symbol passes the per-symbol rules, before ranking
     */
    bool passes_filters(const std::string& symbol, const Timestamp& as_of) const;

    const UniverseConfig& get_config() const {
        return config_;
    }

private:
    UniverseConfig config_;
    const IndicatorEngine& indicators_;
};

}  // namespace trend_engine
