// include/trend_engine/risk/risk_manager.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"
#include "trend_engine/portfolio/portfolio_tracker.hpp"
#include "trend_engine/risk/risk_config.hpp"
#include "trend_engine/risk/stop_book.hpp"
#include "trend_engine/signals/signal_detector.hpp"
#include "trend_engine/universe/universe_selector.hpp"

namespace trend_engine {

/**
 * @brief Step-wide inputs shared by every candidate evaluated in a step
 *
 * The pending fields carry intents accepted earlier in the step that have not
 * reached the portfolio yet (next-open fills), so caps see them too.
 */
struct RiskContext {
    const PortfolioSnapshot& portfolio;
    const UniverseSelection& universe;
    double pending_notional{0.0};  // Gross notional of unfilled entries
    double pending_cash{0.0};      // Cash committed to unfilled entries
    int pending_new_positions{0};  // Unfilled entries that open a new position

    RiskContext(const PortfolioSnapshot& snapshot, const UniverseSelection& selection)
        : portfolio(snapshot), universe(selection) {}
};

/**
 * @brief One symbol being considered by the risk rules
 */
struct RiskCandidate {
    std::string symbol;
    Timestamp timestamp;
    Price price{0.0};                      // Latest close
    std::optional<Signal> signal;          // Absent when only stops or eligibility apply
    const IndicatorState* indicators{nullptr};
    const StopLevels* stops{nullptr};
    std::optional<OrderIntent> draft;      // Intent carried forward from earlier rules
};

enum class RiskVerdict {
    DEFER,   // No decision, the next rule runs
    ACCEPT,  // Intent goes to the portfolio
    REJECT   // Intent is refused and recorded
};

inline std::string risk_verdict_to_string(RiskVerdict verdict) {
    switch (verdict) {
        case RiskVerdict::DEFER:
            return "DEFER";
        case RiskVerdict::ACCEPT:
            return "ACCEPT";
        case RiskVerdict::REJECT:
            return "REJECT";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Outcome of one rule, or of the whole rule list
 */
struct RiskDecision {
    RiskVerdict verdict{RiskVerdict::DEFER};
    std::optional<OrderIntent> intent;  // Accepted intent, or the intent that was refused
    ErrorCode code{ErrorCode::NONE};
    std::string message;
    std::string rule;

    static RiskDecision defer(std::optional<OrderIntent> draft = std::nullopt) {
        RiskDecision decision;
        decision.intent = std::move(draft);
        return decision;
    }

    static RiskDecision accept(OrderIntent intent, std::string rule) {
        RiskDecision decision;
        decision.verdict = RiskVerdict::ACCEPT;
        decision.intent = std::move(intent);
        decision.rule = std::move(rule);
        return decision;
    }

    static RiskDecision reject(ErrorCode code, std::string message, std::string rule,
                               std::optional<OrderIntent> intent = std::nullopt) {
        RiskDecision decision;
        decision.verdict = RiskVerdict::REJECT;
        decision.intent = std::move(intent);
        decision.code = code;
        decision.message = std::move(message);
        decision.rule = std::move(rule);
        return decision;
    }
};

using RiskRuleFn = std::function<Result<RiskDecision>(const RiskConfig&, const RiskContext&,
                                                      const RiskCandidate&)>;

struct RiskRule {
    std::string name;
    RiskRuleFn apply;
};

/**
 * @brief Pure rule functions in their default priority order
 *
 * A rule either decides or defers. A deferring rule may hand a draft intent
 * to the rules after it; a SIZING_ERROR result drops the candidate.
 */
namespace risk_rules {

Result<RiskDecision> forced_exit(const RiskConfig& config, const RiskContext& ctx,
                                 const RiskCandidate& candidate);
Result<RiskDecision> protective_stop(const RiskConfig& config, const RiskContext& ctx,
                                     const RiskCandidate& candidate);
Result<RiskDecision> exit_signal(const RiskConfig& config, const RiskContext& ctx,
                                 const RiskCandidate& candidate);
Result<RiskDecision> entry_sizing(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate);
Result<RiskDecision> position_cap(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate);
Result<RiskDecision> exposure_cap(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate);

std::vector<RiskRule> default_rules();

}  // namespace risk_rules

/**
 * @brief Sizes positions and enforces portfolio-level constraints
 *
 * Runs a priority-ordered rule list per candidate: forced exit, protective
 * stop/target, exit signal, entry sizing, position cap, exposure cap. Stops
 * and forced exits are decided before any sizing, so a breached stop always
 * wins over a new entry for the same symbol. Also keeps the stop book for
 * open positions.
 */
class RiskManager {
public:
    explicit RiskManager(RiskConfig config);

    /**
     * @brief Run the rule list for one candidate
     * @param ctx Step-wide portfolio and universe view
     * @param candidate Symbol, latest close, optional signal and indicators
     * @return ACCEPT with an intent, REJECT with a reason, DEFER when nothing
     *         applies, or SIZING_ERROR when the entry cannot be sized
     */
    Result<RiskDecision> evaluate(const RiskContext& ctx, RiskCandidate candidate) const;

    /**
     * @brief Record a fill so stops follow the position
     */
    void on_fill(const OrderIntent& intent, Price fill_price, const Position* position) {
        stops_.on_fill(intent, fill_price, position);
    }

    /**
     * @brief Ratchet stops of an open position after its bar
     */
    void update_stops(const Position& position, const IndicatorState& state) {
        stops_.update(position, state);
    }

    const StopBook& stops() const {
        return stops_;
    }

    const std::vector<RiskRule>& rules() const {
        return rules_;
    }

    const RiskConfig& get_config() const {
        return config_;
    }

    /**
     * @brief Replace the rule list
     */
    void set_rules(std::vector<RiskRule> rules) {
        rules_ = std::move(rules);
    }

    void reset() {
        stops_.clear();
    }

private:
    RiskConfig config_;
    std::vector<RiskRule> rules_;
    StopBook stops_;
};

}  // namespace trend_engine
