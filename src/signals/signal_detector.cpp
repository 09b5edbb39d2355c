// src/signals/signal_detector.cpp
#include "trend_engine/signals/signal_detector.hpp"
#include <algorithm>
#include "trend_engine/core/logger.hpp"

namespace trend_engine {

Result<void> SignalConfig::validate() const {
    if (cross_threshold <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "cross_threshold must be positive",
                                "SignalConfig");
    }
    if (retest_min >= retest_max) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "retest_min must be less than retest_max", "SignalConfig");
    }
    if (retest_min < 0.0 || exit_threshold < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "retest_min and exit_threshold cannot be negative",
                                "SignalConfig");
    }
    if (max_entries_per_symbol < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_entries_per_symbol must be at least 1", "SignalConfig");
    }
    return Result<void>();
}

SignalDetector::SignalDetector(SignalConfig config) : config_(std::move(config)) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw EngineError(valid.error()->code(), valid.error()->what(), "SignalDetector");
    }
}

PositionState SignalDetector::transition(PositionState current, SignalKind kind) {
    switch (kind) {
        case SignalKind::ENTRY_LONG:
            return current == PositionState::SHORT ? current : PositionState::LONG;
        case SignalKind::ENTRY_SHORT:
            return current == PositionState::LONG ? current : PositionState::SHORT;
        case SignalKind::EXIT_LONG:
            return current == PositionState::LONG ? PositionState::FLAT : current;
        case SignalKind::EXIT_SHORT:
            return current == PositionState::SHORT ? PositionState::FLAT : current;
    }
    return current;
}

std::optional<Signal> SignalDetector::detect(const std::string& symbol,
                                             const IndicatorState& state,
                                             const PositionView& position) const {
    if (state.warming_up() || *state.sma <= 0.0) {
        return std::nullopt;
    }

    auto exit_signal = detect_exit(symbol, state, position);
    if (exit_signal) {
        return exit_signal;
    }

    return detect_entry(symbol, state, position);
}

std::optional<Signal> SignalDetector::detect_exit(const std::string& symbol,
                                                  const IndicatorState& state,
                                                  const PositionView& position) const {
    if (position.state == PositionState::FLAT) {
        return std::nullopt;
    }

    const bool is_long = position.state == PositionState::LONG;
    const double sma = *state.sma;

    Signal signal;
    signal.symbol = symbol;
    signal.kind = is_long ? SignalKind::EXIT_LONG : SignalKind::EXIT_SHORT;
    signal.timestamp = state.timestamp;
    signal.price = state.close;
    signal.strength = 1.0;

    if (position.trailing_stop) {
        const bool breached =
            is_long ? state.close < *position.trailing_stop : state.close > *position.trailing_stop;
        if (breached) {
            signal.pattern = SignalPattern::TRAILING_STOP;
            return signal;
        }
    }

    const bool trend_broken = is_long ? state.close < sma * (1.0 - config_.exit_threshold)
                                      : state.close > sma * (1.0 + config_.exit_threshold);
    if (trend_broken) {
        signal.pattern = SignalPattern::TREND_BREAK;
        return signal;
    }

    return std::nullopt;
}

std::optional<std::pair<SignalPattern, double>> SignalDetector::match_entry_pattern(
    double distance, std::optional<double> previous_distance) const {
    // First computable bar has no previous SMA; the band alone confirms the cross
    const bool confirmed = !previous_distance || *previous_distance <= 0.0;
    if (distance > 0.0 && distance <= config_.cross_threshold && confirmed) {
        double strength = 0.5 + 0.5 * (1.0 - distance / config_.cross_threshold);
        return std::make_pair(SignalPattern::CROSS, strength);
    }

    if (distance >= config_.retest_min && distance <= config_.retest_max) {
        double width = config_.retest_max - config_.retest_min;
        double strength = 0.5 * (1.0 - (distance - config_.retest_min) / width);
        return std::make_pair(SignalPattern::RETEST, strength);
    }

    return std::nullopt;
}

std::optional<Signal> SignalDetector::detect_entry(const std::string& symbol,
                                                   const IndicatorState& state,
                                                   const PositionView& position) const {
    const double distance = (state.close - *state.sma) / *state.sma;

    std::optional<double> previous_distance;
    if (state.previous_sma && state.previous_close && *state.previous_sma > 0.0) {
        previous_distance = (*state.previous_close - *state.previous_sma) / *state.previous_sma;
    }

    const bool can_add = position.entries < config_.max_entries_per_symbol;

    Signal signal;
    signal.symbol = symbol;
    signal.timestamp = state.timestamp;
    signal.price = state.close;

    if (position.state == PositionState::FLAT ||
        (position.state == PositionState::LONG && can_add)) {
        const bool slope_ok =
            !config_.require_positive_slope || (state.sma_slope && *state.sma_slope > 0.0);
        auto match = slope_ok ? match_entry_pattern(distance, previous_distance) : std::nullopt;
        if (match) {
            signal.kind = SignalKind::ENTRY_LONG;
            signal.pattern = match->first;
            signal.strength = match->second;
            DEBUG(symbol << ": " << signal_pattern_to_string(signal.pattern)
                         << " long signal @ " << state.close << " (SMA " << *state.sma << ")");
            return signal;
        }
    }

    if (config_.shorting_enabled && (position.state == PositionState::FLAT ||
                                     (position.state == PositionState::SHORT && can_add))) {
        const bool slope_ok =
            !config_.require_positive_slope || (state.sma_slope && *state.sma_slope < 0.0);
        std::optional<double> mirrored_previous;
        if (previous_distance) {
            mirrored_previous = -*previous_distance;
        }
        auto match =
            slope_ok ? match_entry_pattern(-distance, mirrored_previous) : std::nullopt;
        if (match) {
            signal.kind = SignalKind::ENTRY_SHORT;
            signal.pattern = match->first;
            signal.strength = match->second;
            DEBUG(symbol << ": " << signal_pattern_to_string(signal.pattern)
                         << " short signal @ " << state.close << " (SMA " << *state.sma << ")");
            return signal;
        }
    }

    return std::nullopt;
}

}  // namespace trend_engine
