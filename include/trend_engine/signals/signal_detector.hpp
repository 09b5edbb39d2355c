// include/trend_engine/signals/signal_detector.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"

namespace trend_engine {

enum class SignalKind { ENTRY_LONG, EXIT_LONG, ENTRY_SHORT, EXIT_SHORT };

inline std::string signal_kind_to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::ENTRY_LONG:
            return "ENTRY_LONG";
        case SignalKind::EXIT_LONG:
            return "EXIT_LONG";
        case SignalKind::ENTRY_SHORT:
            return "ENTRY_SHORT";
        case SignalKind::EXIT_SHORT:
            return "EXIT_SHORT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Pattern that produced a signal
 */
enum class SignalPattern {
    CROSS,          // Close just crossed to the trend side of the SMA
    RETEST,         // Close pulled back to within the retest band
    TREND_BREAK,    // Close fell through the SMA against the position
    TRAILING_STOP   // Close breached the trailing level supplied by risk
};

inline std::string signal_pattern_to_string(SignalPattern pattern) {
    switch (pattern) {
        case SignalPattern::CROSS:
            return "cross";
        case SignalPattern::RETEST:
            return "retest";
        case SignalPattern::TREND_BREAK:
            return "trend_break";
        case SignalPattern::TRAILING_STOP:
            return "trailing_stop";
        default:
            return "unknown";
    }
}

enum class PositionState { FLAT, LONG, SHORT };

inline std::string position_state_to_string(PositionState state) {
    switch (state) {
        case PositionState::FLAT:
            return "FLAT";
        case PositionState::LONG:
            return "LONG";
        case PositionState::SHORT:
            return "SHORT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Entry/exit signal for one symbol at one bar, consumed within the step
 */
struct Signal {
    std::string symbol;
    SignalKind kind{SignalKind::ENTRY_LONG};
    SignalPattern pattern{SignalPattern::CROSS};
    Timestamp timestamp;
    Price price{0.0};      // Close that triggered the signal
    double strength{0.0};  // Ranking score in [0, 1], higher is better

    bool is_entry() const {
        return kind == SignalKind::ENTRY_LONG || kind == SignalKind::ENTRY_SHORT;
    }

    bool is_exit() const {
        return !is_entry();
    }
};

/**
 * @brief The caller's view of the current position, threaded into detect()
 */
struct PositionView {
    PositionState state{PositionState::FLAT};
    int entries{0};
    std::optional<Price> trailing_stop;  // Active trailing level from the risk manager

    static PositionView from_position(const Position* position,
                                      std::optional<Price> trailing_stop = std::nullopt) {
        PositionView view;
        if (position == nullptr || !position->has_position()) {
            return view;
        }
        view.state = position->quantity > 0 ? PositionState::LONG : PositionState::SHORT;
        view.entries = position->entries;
        view.trailing_stop = trailing_stop;
        return view;
    }
};

/**
 * @brief Thresholds for entry and exit patterns
 */
struct SignalConfig : public ConfigBase {
    double cross_threshold{0.01};       // Max distance above the SMA for a cross entry
    double retest_min{0.03};            // Retest band lower bound
    double retest_max{0.04};            // Retest band upper bound
    double exit_threshold{0.0};         // Distance through the SMA that breaks the trend
    bool require_positive_slope{false};
    bool shorting_enabled{false};
    int max_entries_per_symbol{2};      // Initial entry plus pyramid adds

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["cross_threshold"] = cross_threshold;
        j["retest_min"] = retest_min;
        j["retest_max"] = retest_max;
        j["exit_threshold"] = exit_threshold;
        j["require_positive_slope"] = require_positive_slope;
        j["shorting_enabled"] = shorting_enabled;
        j["max_entries_per_symbol"] = max_entries_per_symbol;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("cross_threshold"))
            cross_threshold = j.at("cross_threshold").get<double>();
        if (j.contains("retest_min"))
            retest_min = j.at("retest_min").get<double>();
        if (j.contains("retest_max"))
            retest_max = j.at("retest_max").get<double>();
        if (j.contains("exit_threshold"))
            exit_threshold = j.at("exit_threshold").get<double>();
        if (j.contains("require_positive_slope"))
            require_positive_slope = j.at("require_positive_slope").get<bool>();
        if (j.contains("shorting_enabled"))
            shorting_enabled = j.at("shorting_enabled").get<bool>();
        if (j.contains("max_entries_per_symbol"))
            max_entries_per_symbol = j.at("max_entries_per_symbol").get<int>();
    }
};

/**
 * @brief Per-symbol FLAT/LONG/SHORT state machine over indicator values
 *
 * Holds configuration only. The position state is supplied on every call and
 * exit conditions are evaluated before entry conditions.
 */
class SignalDetector {
public:
    explicit SignalDetector(SignalConfig config);

    /**
     * @brief Evaluate one symbol at its latest bar
     * @param symbol Symbol being evaluated
     * @param state Indicator state after the bar
     * @param position Current position view
     * @return Signal, or nullopt when nothing fires or indicators are warming up
     */
    std::optional<Signal> detect(const std::string& symbol, const IndicatorState& state,
                                 const PositionView& position) const;

    /**
     * @brief State the position moves to once a signal is filled
     */
    static PositionState transition(PositionState current, SignalKind kind);

    const SignalConfig& get_config() const {
        return config_;
    }

private:
    std::optional<Signal> detect_exit(const std::string& symbol, const IndicatorState& state,
                                      const PositionView& position) const;
    std::optional<Signal> detect_entry(const std::string& symbol, const IndicatorState& state,
                                       const PositionView& position) const;

    // Entry pattern on the trend side; distance is signed toward the trade
    std::optional<std::pair<SignalPattern, double>> match_entry_pattern(
        double distance, std::optional<double> previous_distance) const;

    SignalConfig config_;
};

}  // namespace trend_engine
