// src/risk/stop_book.cpp
#include "trend_engine/risk/stop_book.hpp"
#include <algorithm>
#include "trend_engine/core/logger.hpp"

namespace trend_engine {

StopBook::StopBook(const RiskConfig& config)
    : stop_loss_pct_(config.stop_loss_pct),
      trailing_profit_threshold_(config.trailing_profit_threshold),
      trailing_atr_multiplier_(config.trailing_atr_multiplier) {}

void StopBook::on_fill(const OrderIntent& intent, Price fill_price, const Position* position) {
    if (position == nullptr || !position->has_position()) {
        levels_.erase(intent.symbol);
        return;
    }
    if (!intent.is_entry()) {
        return;
    }

    const bool is_long = position->quantity > 0.0;
    const Price stop = intent.stop_price
                           ? *intent.stop_price
                           : fill_price * (is_long ? 1.0 - stop_loss_pct_ : 1.0 + stop_loss_pct_);

    auto it = levels_.find(intent.symbol);
    if (it == levels_.end()) {
        StopLevels levels;
        levels.is_long = is_long;
        levels.static_stop = stop;
        levels.target = intent.target_price;
        levels.extreme_close = fill_price;
        levels_.emplace(intent.symbol, levels);
        DEBUG(intent.symbol << ": stop " << stop
                            << (levels.target ? ", target " + std::to_string(*levels.target) : ""));
        return;
    }

    // Pyramid add: keep the tighter stop, re-anchor the target on the new fill
    auto& levels = it->second;
    levels.static_stop = is_long ? std::max(levels.static_stop, stop)
                                 : std::min(levels.static_stop, stop);
    if (intent.target_price) {
        levels.target = intent.target_price;
    }
}

void StopBook::update(const Position& position, const IndicatorState& state) {
    auto it = levels_.find(position.symbol);
    if (it == levels_.end() || !position.has_position()) {
        return;
    }
    auto& levels = it->second;
    const Price close = state.close;

    if (state.sma) {
        if (levels.is_long) {
            levels.static_stop = std::max(levels.static_stop, *state.sma * (1.0 - stop_loss_pct_));
        } else {
            levels.static_stop = std::min(levels.static_stop, *state.sma * (1.0 + stop_loss_pct_));
        }
    }

    levels.extreme_close = levels.is_long ? std::max(levels.extreme_close, close)
                                          : std::min(levels.extreme_close, close);

    if (position.average_price <= 0.0 || !state.atr) {
        return;
    }

    const double profit = levels.is_long
                              ? (close - position.average_price) / position.average_price
                              : (position.average_price - close) / position.average_price;
    if (!levels.trailing_stop && profit < trailing_profit_threshold_) {
        return;
    }

    const double offset = trailing_atr_multiplier_ * *state.atr;
    if (levels.is_long) {
        Price trail = levels.extreme_close - offset;
        if (!levels.trailing_stop) {
            DEBUG(position.symbol << ": trailing stop activated at " << trail);
        }
        levels.trailing_stop = levels.trailing_stop ? std::max(*levels.trailing_stop, trail) : trail;
    } else {
        Price trail = levels.extreme_close + offset;
        if (!levels.trailing_stop) {
            DEBUG(position.symbol << ": trailing stop activated at " << trail);
        }
        levels.trailing_stop = levels.trailing_stop ? std::min(*levels.trailing_stop, trail) : trail;
    }
}

const StopLevels* StopBook::get(const std::string& symbol) const {
    auto it = levels_.find(symbol);
    return it == levels_.end() ? nullptr : &it->second;
}

std::optional<Price> StopBook::trailing_stop(const std::string& symbol) const {
    auto it = levels_.find(symbol);
    if (it == levels_.end()) {
        return std::nullopt;
    }
    return it->second.trailing_stop;
}

}  // namespace trend_engine
