// include/trend_engine/risk/stop_book.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"
#include "trend_engine/risk/risk_config.hpp"

namespace trend_engine {

/**
 * @brief Protective levels stored for one open position
 */
struct StopLevels {
    bool is_long{true};
    Price static_stop{0.0};
    std::optional<Price> target;
    std::optional<Price> trailing_stop;  // Set once open profit reaches the threshold
    Price extreme_close{0.0};            // Highest close for longs, lowest for shorts

    // A close exactly at the stop does not breach it
    bool stop_breached(Price close) const {
        return is_long ? close < static_stop : close > static_stop;
    }

    bool target_reached(Price close) const {
        if (!target)
            return false;
        return is_long ? close >= *target : close <= *target;
    }
};

/**
 * @brief Per-position stop, target and trailing levels
 *
 * Levels only ever move in the position's favour.
 */
class StopBook {
public:
    explicit StopBook(const RiskConfig& config);

    /**
     * @brief Record a fill
     * @param intent The filled intent
     * @param fill_price Fill price
     * @param position Position after the fill, nullptr once closed
     */
    void on_fill(const OrderIntent& intent, Price fill_price, const Position* position);

    /**
     * @brief Ratchet the levels of an open position after a bar
     */
    void update(const Position& position, const IndicatorState& state);

    const StopLevels* get(const std::string& symbol) const;

    std::optional<Price> trailing_stop(const std::string& symbol) const;

    void erase(const std::string& symbol) {
        levels_.erase(symbol);
    }

    void clear() {
        levels_.clear();
    }

    size_t size() const {
        return levels_.size();
    }

private:
    double stop_loss_pct_;
    double trailing_profit_threshold_;
    double trailing_atr_multiplier_;
    std::map<std::string, StopLevels> levels_;
};

}  // namespace trend_engine
