// include/trend_engine/backtest/strategy_orchestrator.hpp
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "trend_engine/backtest/backtest_types.hpp"
#include "trend_engine/backtest/bar_stream.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"
#include "trend_engine/indicators/indicator_engine.hpp"
#include "trend_engine/portfolio/portfolio_tracker.hpp"
#include "trend_engine/risk/risk_manager.hpp"
#include "trend_engine/signals/signal_detector.hpp"
#include "trend_engine/universe/universe_selector.hpp"

namespace trend_engine {
namespace backtest {

/**
 * @brief Drives the per-step pipeline over a historical bar stream
 *
 * One step per timestamp batch, always in this order:
 *  1. fill intents queued for the next open
 *  2. validate bars and update indicators
 *  3. mark open positions to the new closes
 *  4. select the universe (flags forced exits)
 *  5. exits for held symbols: forced exit, stop/target, exit signals
 *  6. entries, ranked by signal strength then symbol, unless the regime
 *     filter blocks them
 *  7. ratchet stops, snapshot the portfolio
 *
 * Malformed or out-of-order bars abort the run. Rejections and sizing
 * failures are recorded in the order log and the run continues.
 */
class StrategyOrchestrator {
public:
    explicit StrategyOrchestrator(BacktestConfig config, std::string id = "sma_trend");
    ~StrategyOrchestrator();

    StrategyOrchestrator(const StrategyOrchestrator&) = delete;
    StrategyOrchestrator& operator=(const StrategyOrchestrator&) = delete;

    /**
     * @brief Validate configuration, build components, register with StateManager
     * @return Result indicating success or failure
     */
    Result<void> initialize();

    /**
     * @brief Replay a bar stream to the end
     * @param bars Bars in any order, unique per (symbol, timestamp)
     * @return Snapshots and order log, or the fatal error that aborted the run
     */
    Result<BacktestResults> run(const std::vector<Bar>& bars);

    /**
     * @brief Process one timestamp batch
     * @param batch Bars sharing one timestamp
     * @return Snapshot recorded for the step, or a fatal error
     */
    Result<PortfolioSnapshot> step(const BarBatch& batch);

    /**
     * @brief Ask a running replay to stop before its next step
     */
    void request_stop() {
        stop_requested_.store(true);
    }

    /**
     * @brief Clear all run state so the same configuration can be replayed
     */
    Result<void> reset();

    const BacktestResults& results() const {
        return results_;
    }

    const std::vector<OrderIntent>& pending_intents() const {
        return pending_;
    }

    const IndicatorEngine* indicators() const {
        return indicators_.get();
    }

    const PortfolioTracker* portfolio() const {
        return portfolio_.get();
    }

    const RiskManager* risk_manager() const {
        return risk_.get();
    }

    const BacktestConfig& get_config() const {
        return config_;
    }

    const std::string& component_id() const {
        return component_id_;
    }

private:
    Result<void> fill_pending(const BarBatch& batch);
    Result<void> update_indicators(const BarBatch& batch);
    void process_exits(const BarBatch& batch, const UniverseSelection& selection,
                       std::set<std::string>& exited);
    void process_entries(const BarBatch& batch, const UniverseSelection& selection,
                         const std::set<std::string>& exited);
    void ratchet_stops(const Timestamp& timestamp);

    bool regime_allows_entries() const;
    bool has_bar(const BarBatch& batch, const std::string& symbol) const;
    bool is_pending(const std::string& symbol) const;
    RiskContext make_context(const PortfolioSnapshot& snapshot,
                             const UniverseSelection& selection) const;

    void dispatch(OrderIntent intent);
    void execute(const OrderIntent& intent, Price fill_price);
    void record(const OrderIntent& intent, OrderStatus status, Price fill_price,
                const std::string& message);
    void record_decision(const RiskCandidate& candidate, const RiskDecision& decision);

    BacktestConfig config_;
    std::string component_id_;
    bool is_initialized_{false};
    bool registered_{false};
    std::atomic<bool> stop_requested_{false};

    std::unique_ptr<IndicatorEngine> indicators_;
    std::unique_ptr<UniverseSelector> universe_;
    std::unique_ptr<SignalDetector> signals_;
    std::unique_ptr<RiskManager> risk_;
    std::unique_ptr<PortfolioTracker> portfolio_;

    std::vector<OrderIntent> pending_;  // Queued for the next open of their symbol
    std::optional<Timestamp> last_step_;
    BacktestResults results_;
};

}  // namespace backtest
}  // namespace trend_engine
