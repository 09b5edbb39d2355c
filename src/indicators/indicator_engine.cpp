// src/indicators/indicator_engine.cpp
#include "trend_engine/indicators/indicator_engine.hpp"
#include <algorithm>
#include <cmath>
#include "trend_engine/core/logger.hpp"
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {

Result<void> IndicatorConfig::validate() const {
    if (sma_period < 1 || atr_period < 1 || slope_lookback < 1 || volume_lookback < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Indicator periods must be at least 1", "IndicatorConfig");
    }
    return Result<void>();
}

std::map<std::string, double> IndicatorState::values() const {
    std::map<std::string, double> result;
    result["close"] = close;
    if (sma)
        result["sma"] = *sma;
    if (sma_slope)
        result["sma_slope"] = *sma_slope;
    if (atr)
        result["atr"] = *atr;
    if (average_volume)
        result["average_volume"] = *average_volume;
    if (average_dollar_volume)
        result["average_dollar_volume"] = *average_dollar_volume;
    return result;
}

nlohmann::json IndicatorState::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["timestamp"] = core::to_epoch_seconds(timestamp);
    j["bars_seen"] = bars_seen;
    j["warming_up"] = warming_up();
    j["values"] = values();
    return j;
}

AverageTrueRange::AverageTrueRange(size_t period) : period_(std::max<size_t>(period, 1)) {}

void AverageTrueRange::update(double high, double low, std::optional<double> previous_close) {
    double true_range = high - low;
    if (previous_close) {
        true_range = std::max({true_range, std::abs(high - *previous_close),
                               std::abs(low - *previous_close)});
    }

    ++count_;
    if (atr_) {
        const double n = static_cast<double>(period_);
        atr_ = (*atr_ * (n - 1.0) + true_range) / n;
        return;
    }

    // Seed with the simple mean of the first `period` true ranges
    seed_sum_ += true_range;
    if (count_ == period_) {
        atr_ = seed_sum_ / static_cast<double>(period_);
    }
}

IndicatorEngine::SymbolSeries::SymbolSeries(const IndicatorConfig& config)
    : closes(static_cast<size_t>(config.sma_period)),
      volumes(static_cast<size_t>(config.volume_lookback)),
      dollar_volumes(static_cast<size_t>(config.volume_lookback)),
      sma_history(static_cast<size_t>(config.slope_lookback) + 1),
      atr(static_cast<size_t>(config.atr_period)) {}

IndicatorEngine::IndicatorEngine(IndicatorConfig config) : config_(std::move(config)) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw EngineError(valid.error()->code(), valid.error()->what(), "IndicatorEngine");
    }
}

Result<IndicatorState> IndicatorEngine::update(const std::string& symbol, const Bar& bar) {
    if (symbol.empty()) {
        return make_error<IndicatorState>(ErrorCode::DATA_ERROR, "Bar has empty symbol",
                                          "IndicatorEngine");
    }
    if (!bar.symbol.empty() && bar.symbol != symbol) {
        return make_error<IndicatorState>(
            ErrorCode::DATA_ERROR,
            "Bar for " + bar.symbol + " routed to indicator series " + symbol, "IndicatorEngine");
    }

    auto it = series_.find(symbol);
    if (it == series_.end()) {
        it = series_.emplace(symbol, SymbolSeries(config_)).first;
    }
    auto& series = it->second;
    auto& state = series.state;

    if (state.bars_seen > 0 && bar.timestamp <= state.timestamp) {
        const bool duplicate = bar.timestamp == state.timestamp;
        return make_error<IndicatorState>(
            ErrorCode::SEQUENCE_ERROR,
            std::string(duplicate ? "Duplicate" : "Out-of-order") + " bar for " + symbol + " at " +
                core::format_timestamp(bar.timestamp) + " (last " +
                core::format_timestamp(state.timestamp) + ")",
            "IndicatorEngine");
    }

    std::optional<Price> previous_close;
    if (state.bars_seen > 0) {
        previous_close = state.close;
    }
    const auto previous_sma = state.sma;

    series.closes.add(bar.close);
    series.volumes.add(bar.volume);
    series.dollar_volumes.add(bar.close * bar.volume);
    series.atr.update(bar.high, bar.low, previous_close);

    state.symbol = symbol;
    state.timestamp = bar.timestamp;
    state.bars_seen += 1;
    state.close = bar.close;
    state.previous_close = previous_close;
    state.previous_sma = previous_sma;
    state.sma = series.closes.value();
    state.atr = series.atr.value();
    state.average_volume = series.volumes.value();
    state.average_dollar_volume = series.dollar_volumes.value();

    state.sma_slope.reset();
    if (state.sma) {
        series.sma_history.push(*state.sma);
        if (series.sma_history.full() && series.sma_history.oldest() > 0.0) {
            state.sma_slope =
                (series.sma_history.newest() - series.sma_history.oldest()) /
                series.sma_history.oldest();
        }
    } else if (state.bars_seen % 50 == 0) {
        DEBUG("Warming up " << symbol << " (" << state.bars_seen << " of " << config_.sma_period
                            << " bars)");
    }

    return Result<IndicatorState>(state);
}

const IndicatorState* IndicatorEngine::get_state(const std::string& symbol) const {
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        return nullptr;
    }
    return &it->second.state;
}

std::vector<std::string> IndicatorEngine::get_symbols() const {
    std::vector<std::string> symbols;
    symbols.reserve(series_.size());
    for (const auto& [symbol, _] : series_) {
        symbols.push_back(symbol);
    }
    return symbols;
}

}  // namespace trend_engine
