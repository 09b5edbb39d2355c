// src/universe/universe_selector.cpp
#include "trend_engine/universe/universe_selector.hpp"
#include <algorithm>
#include <utility>
#include <vector>
#include "trend_engine/core/logger.hpp"

namespace trend_engine {

Result<void> UniverseConfig::validate() const {
    if (min_price < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "min_price cannot be negative",
                                "UniverseConfig");
    }
    if (min_average_volume < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "min_average_volume cannot be negative", "UniverseConfig");
    }
    if (min_warmup_bars < 0 || universe_size < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "min_warmup_bars and universe_size cannot be negative",
                                "UniverseConfig");
    }
    return Result<void>();
}

UniverseSelector::UniverseSelector(UniverseConfig config, const IndicatorEngine& indicators)
    : config_(std::move(config)), indicators_(indicators) {}

bool UniverseSelector::passes_filters(const std::string& symbol, const Timestamp& as_of) const {
    if (!config_.benchmark_symbol.empty() && symbol == config_.benchmark_symbol) {
        return false;
    }

    const auto* state = indicators_.get_state(symbol);
    if (state == nullptr || state->timestamp > as_of) {
        return false;
    }

    if (state->bars_seen < static_cast<size_t>(config_.min_warmup_bars)) {
        return false;
    }

    if (state->close < config_.min_price) {
        return false;
    }

    if (config_.min_average_volume > 0.0) {
        if (!state->average_volume || *state->average_volume < config_.min_average_volume) {
            return false;
        }
    }

    return true;
}

std::set<std::string> UniverseSelector::eligible(const Timestamp& as_of,
                                                 const std::set<std::string>& candidates) const {
    std::vector<std::pair<std::string, double>> ranked;
    ranked.reserve(candidates.size());

    for (const auto& symbol : candidates) {
        if (!passes_filters(symbol, as_of)) {
            continue;
        }
        const auto* state = indicators_.get_state(symbol);
        ranked.emplace_back(symbol, state->average_dollar_volume.value_or(0.0));
    }

    // Highest average dollar volume first, symbol order on ties
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    if (config_.universe_size > 0 && ranked.size() > static_cast<size_t>(config_.universe_size)) {
        ranked.resize(static_cast<size_t>(config_.universe_size));
    }

    std::set<std::string> result;
    for (const auto& [symbol, _] : ranked) {
        result.insert(symbol);
    }
    return result;
}

UniverseSelection UniverseSelector::select(const Timestamp& as_of,
                                           const std::set<std::string>& candidates,
                                           const std::set<std::string>& open_positions) const {
    UniverseSelection selection;
    selection.as_of = as_of;
    selection.eligible = eligible(as_of, candidates);

    for (const auto& symbol : open_positions) {
        if (!selection.is_eligible(symbol)) {
            selection.forced_exit.insert(symbol);
            DEBUG("Open position " << symbol << " left the universe, flagged for forced exit");
        }
    }

    return selection;
}

}  // namespace trend_engine
