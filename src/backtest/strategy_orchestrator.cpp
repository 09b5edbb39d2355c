// src/backtest/strategy_orchestrator.cpp
#include "trend_engine/backtest/strategy_orchestrator.hpp"
#include <algorithm>
#include "trend_engine/core/logger.hpp"
#include "trend_engine/core/state_manager.hpp"
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {
namespace backtest {

StrategyOrchestrator::StrategyOrchestrator(BacktestConfig config, std::string id)
    : config_(std::move(config)), component_id_(std::move(id)) {}

StrategyOrchestrator::~StrategyOrchestrator() {
    if (registered_) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            DEBUG("Unregister failed for " << component_id_ << ": " << result.error()->what());
        }
    }
}

Result<void> StrategyOrchestrator::initialize() {
    if (is_initialized_) {
        return Result<void>();
    }

    auto validation = config_.validate();
    if (validation.is_error()) {
        return validation;
    }

    try {
        indicators_ = std::make_unique<IndicatorEngine>(config_.indicators);
        universe_ = std::make_unique<UniverseSelector>(config_.universe, *indicators_);
        signals_ = std::make_unique<SignalDetector>(config_.signals);
        risk_ = std::make_unique<RiskManager>(config_.risk);
        portfolio_ = std::make_unique<PortfolioTracker>(config_.portfolio);
    } catch (const EngineError& e) {
        return make_error<void>(e.code(), e.what(), "StrategyOrchestrator");
    }

    ComponentInfo info{ComponentType::ORCHESTRATOR,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"initial_cash", config_.portfolio.initial_cash},
                        {"max_positions", static_cast<double>(config_.risk.max_positions)}}};

    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        return register_result;
    }
    registered_ = true;

    results_ = BacktestResults();
    results_.initial_equity = config_.portfolio.initial_cash;
    results_.final_equity = config_.portfolio.initial_cash;
    is_initialized_ = true;

    INFO("Initialized orchestrator " << component_id_ << " (SMA " << config_.indicators.sma_period
                                     << ", fills at "
                                     << price_reference_to_string(config_.fill_price_reference)
                                     << ")");
    return Result<void>();
}

Result<void> StrategyOrchestrator::reset() {
    if (!is_initialized_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Orchestrator not initialized",
                                "StrategyOrchestrator");
    }

    auto state = StateManager::instance().get_state(component_id_);
    if (state.is_ok() && state.value().state != ComponentState::INITIALIZED) {
        auto transition =
            StateManager::instance().update_state(component_id_, ComponentState::INITIALIZED);
        if (transition.is_error()) {
            return transition;
        }
    }

    indicators_->reset();
    risk_->reset();
    portfolio_->reset();
    pending_.clear();
    last_step_.reset();
    stop_requested_.store(false);

    results_ = BacktestResults();
    results_.initial_equity = config_.portfolio.initial_cash;
    results_.final_equity = config_.portfolio.initial_cash;
    return Result<void>();
}

Result<BacktestResults> StrategyOrchestrator::run(const std::vector<Bar>& bars) {
    Logger::register_component("StrategyOrchestrator");

    if (!is_initialized_) {
        auto init_result = initialize();
        if (init_result.is_error()) {
            return forward_error<BacktestResults>(*init_result.error());
        }
    } else {
        auto reset_result = reset();
        if (reset_result.is_error()) {
            return forward_error<BacktestResults>(*reset_result.error());
        }
    }

    auto& state_manager = StateManager::instance();
    auto running = state_manager.update_state(component_id_, ComponentState::RUNNING);
    if (running.is_error()) {
        return forward_error<BacktestResults>(*running.error());
    }

    auto grouped = group_bars_by_timestamp(bars);
    if (grouped.is_error()) {
        ERROR("Backtest aborted: " << grouped.error()->what());
        auto failed = state_manager.update_state(component_id_, ComponentState::ERR_STATE,
                                                 grouped.error()->what());
        if (failed.is_error()) {
            WARN("Could not record error state: " << failed.error()->what());
        }
        return forward_error<BacktestResults>(*grouped.error());
    }

    const auto& batches = grouped.value();
    INFO("Starting backtest over " << batches.size() << " steps (" << bars.size() << " bars)");

    for (const auto& batch : batches) {
        if (stop_requested_.load()) {
            results_.stopped_early = true;
            INFO("Stop requested, ending run after " << results_.steps << " steps");
            break;
        }

        auto step_result = step(batch);
        if (step_result.is_error()) {
            ERROR("Backtest aborted at " << core::format_timestamp(batch.timestamp) << ": "
                                         << step_result.error()->to_string());
            auto failed = state_manager.update_state(component_id_, ComponentState::ERR_STATE,
                                                     step_result.error()->what());
            if (failed.is_error()) {
                WARN("Could not record error state: " << failed.error()->what());
            }
            return forward_error<BacktestResults>(*step_result.error());
        }
    }

    auto metrics = state_manager.update_metrics(
        component_id_, {{"steps", static_cast<double>(results_.steps)},
                        {"accepted", static_cast<double>(results_.accepted)},
                        {"rejected", static_cast<double>(results_.rejected)},
                        {"dropped", static_cast<double>(results_.dropped)},
                        {"final_equity", results_.final_equity}});
    if (metrics.is_error()) {
        WARN("Could not record run metrics: " << metrics.error()->what());
    }

    auto stopped = state_manager.update_state(component_id_, ComponentState::STOPPED);
    if (stopped.is_error()) {
        return forward_error<BacktestResults>(*stopped.error());
    }

    INFO("Backtest completed: " << results_.steps << " steps, " << results_.accepted
                                << " accepted, " << results_.rejected << " rejected, "
                                << results_.dropped << " dropped, final equity "
                                << results_.final_equity);

    BacktestResults out = results_;
    return Result<BacktestResults>(std::move(out));
}

Result<PortfolioSnapshot> StrategyOrchestrator::step(const BarBatch& batch) {
    if (!is_initialized_) {
        return make_error<PortfolioSnapshot>(ErrorCode::NOT_INITIALIZED,
                                             "Orchestrator not initialized",
                                             "StrategyOrchestrator");
    }
    if (last_step_ && batch.timestamp <= *last_step_) {
        return make_error<PortfolioSnapshot>(
            ErrorCode::SEQUENCE_ERROR,
            "Step at " + core::format_timestamp(batch.timestamp) +
                " does not follow " + core::format_timestamp(*last_step_),
            "StrategyOrchestrator");
    }

    auto filled = fill_pending(batch);
    if (filled.is_error()) {
        return forward_error<PortfolioSnapshot>(*filled.error());
    }

    auto updated = update_indicators(batch);
    if (updated.is_error()) {
        return forward_error<PortfolioSnapshot>(*updated.error());
    }
    last_step_ = batch.timestamp;

    for (const auto& bar : batch.bars) {
        portfolio_->mark_to_market(bar.symbol, bar.close, batch.timestamp);
    }

    std::set<std::string> candidates = portfolio_->open_symbols();
    for (const auto& bar : batch.bars) {
        candidates.insert(bar.symbol);
    }
    UniverseSelection selection =
        universe_->select(batch.timestamp, candidates, portfolio_->open_symbols());

    std::set<std::string> exited;
    process_exits(batch, selection, exited);

    if (regime_allows_entries()) {
        process_entries(batch, selection, exited);
    } else {
        DEBUG("Entries blocked by regime filter on " << config_.universe.benchmark_symbol);
    }

    ratchet_stops(batch.timestamp);

    PortfolioSnapshot snapshot = portfolio_->snapshot(batch.timestamp);
    results_.snapshots.push_back(snapshot);
    results_.final_equity = snapshot.equity;
    ++results_.steps;

    if (config_.progress_log_interval > 0 &&
        results_.steps % static_cast<size_t>(config_.progress_log_interval) == 0) {
        INFO("Step " << results_.steps << " (" << core::format_timestamp(batch.timestamp, "%Y-%m-%d")
                     << "): equity " << snapshot.equity << ", cash " << snapshot.cash << ", "
                     << snapshot.open_positions() << " positions");
    }

    return Result<PortfolioSnapshot>(std::move(snapshot));
}

Result<void> StrategyOrchestrator::fill_pending(const BarBatch& batch) {
    if (pending_.empty()) {
        return Result<void>();
    }

    std::vector<OrderIntent> waiting;
    for (const auto& intent : pending_) {
        auto it = std::find_if(batch.bars.begin(), batch.bars.end(),
                               [&intent](const Bar& bar) { return bar.symbol == intent.symbol; });
        if (it == batch.bars.end()) {
            waiting.push_back(intent);
            continue;
        }
        auto valid = validate_bar(*it);
        if (valid.is_error()) {
            return valid;
        }
        OrderIntent fill = intent;
        fill.timestamp = batch.timestamp;
        execute(fill, it->open);
    }
    pending_ = std::move(waiting);
    return Result<void>();
}

Result<void> StrategyOrchestrator::update_indicators(const BarBatch& batch) {
    for (const auto& bar : batch.bars) {
        if (bar.timestamp != batch.timestamp) {
            return make_error<void>(ErrorCode::DATA_ERROR,
                                    "Bar for " + bar.symbol + " does not match its batch time",
                                    "StrategyOrchestrator");
        }
        auto valid = validate_bar(bar);
        if (valid.is_error()) {
            return valid;
        }

        auto state = indicators_->update(bar.symbol, bar);
        if (state.is_error()) {
            return make_error<void>(state.error()->code(), state.error()->what(),
                                    state.error()->component());
        }

        const auto& values = state.value();
        if (values.warming_up()) {
            if (values.bars_seen == 1) {
                DEBUG(bar.symbol << ": warming up, SMA needs " << config_.indicators.sma_period
                                 << " bars");
            }
        } else {
            TRACE(bar.symbol << " close " << values.close << " SMA " << *values.sma);
        }
    }
    return Result<void>();
}

void StrategyOrchestrator::process_exits(const BarBatch& batch,
                                         const UniverseSelection& selection,
                                         std::set<std::string>& exited) {
    for (const auto& symbol : portfolio_->open_symbols()) {
        if (is_pending(symbol)) {
            continue;
        }
        const IndicatorState* state = indicators_->get_state(symbol);
        const Position* position = portfolio_->get_position(symbol);
        if (state == nullptr || position == nullptr) {
            continue;
        }

        RiskCandidate candidate;
        candidate.symbol = symbol;
        candidate.timestamp = batch.timestamp;
        candidate.price = state->close;
        candidate.indicators = state;

        if (has_bar(batch, symbol)) {
            auto view = PositionView::from_position(position, risk_->stops().trailing_stop(symbol));
            auto signal = signals_->detect(symbol, *state, view);
            if (signal && signal->is_exit()) {
                DEBUG(symbol << ": " << signal_kind_to_string(signal->kind) << " ("
                             << signal_pattern_to_string(signal->pattern) << ")");
                candidate.signal = signal;
            }
        }

        PortfolioSnapshot snapshot = portfolio_->snapshot(batch.timestamp);
        RiskContext ctx = make_context(snapshot, selection);
        auto decision = risk_->evaluate(ctx, candidate);
        if (decision.is_error()) {
            WARN(symbol << ": exit evaluation failed: " << decision.error()->what());
            continue;
        }

        const RiskDecision& outcome = decision.value();
        if (outcome.verdict == RiskVerdict::ACCEPT && outcome.intent &&
            !outcome.intent->is_entry()) {
            exited.insert(symbol);
            dispatch(*outcome.intent);
        } else if (outcome.verdict == RiskVerdict::REJECT) {
            record_decision(candidate, outcome);
        }
    }
}

void StrategyOrchestrator::process_entries(const BarBatch& batch,
                                           const UniverseSelection& selection,
                                           const std::set<std::string>& exited) {
    std::vector<Signal> entries;
    for (const auto& bar : batch.bars) {
        const auto& symbol = bar.symbol;
        if (exited.count(symbol) || is_pending(symbol) || !selection.is_eligible(symbol)) {
            continue;
        }
        const IndicatorState* state = indicators_->get_state(symbol);
        if (state == nullptr) {
            continue;
        }
        const Position* position = portfolio_->get_position(symbol);
        auto view = PositionView::from_position(position, risk_->stops().trailing_stop(symbol));
        auto signal = signals_->detect(symbol, *state, view);
        if (signal && signal->is_entry()) {
            entries.push_back(*signal);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const Signal& a, const Signal& b) {
        if (a.strength != b.strength)
            return a.strength > b.strength;
        return a.symbol < b.symbol;
    });

    for (const auto& signal : entries) {
        DEBUG(signal.symbol << ": " << signal_kind_to_string(signal.kind) << " ("
                            << signal_pattern_to_string(signal.pattern) << ", strength "
                            << signal.strength << ")");

        RiskCandidate candidate;
        candidate.symbol = signal.symbol;
        candidate.timestamp = batch.timestamp;
        candidate.price = signal.price;
        candidate.signal = signal;
        candidate.indicators = indicators_->get_state(signal.symbol);

        PortfolioSnapshot snapshot = portfolio_->snapshot(batch.timestamp);
        RiskContext ctx = make_context(snapshot, selection);
        auto decision = risk_->evaluate(ctx, candidate);
        if (decision.is_error()) {
            OrderIntent dropped;
            dropped.symbol = signal.symbol;
            dropped.side = signal.kind == SignalKind::ENTRY_LONG ? Side::BUY : Side::SELL;
            dropped.reference_price = signal.price;
            dropped.reason = signal.pattern == SignalPattern::RETEST ? IntentReason::ENTRY_RETEST
                                                                     : IntentReason::ENTRY_CROSS;
            dropped.timestamp = batch.timestamp;
            WARN(signal.symbol << ": entry dropped: " << decision.error()->what());
            record(dropped, OrderStatus::DROPPED, 0.0, decision.error()->what());
            continue;
        }

        const RiskDecision& outcome = decision.value();
        if (outcome.verdict == RiskVerdict::ACCEPT && outcome.intent) {
            dispatch(*outcome.intent);
        } else if (outcome.verdict == RiskVerdict::REJECT) {
            record_decision(candidate, outcome);
        }
    }
}

void StrategyOrchestrator::ratchet_stops(const Timestamp& timestamp) {
    for (const auto& [symbol, position] : portfolio_->get_positions()) {
        const IndicatorState* state = indicators_->get_state(symbol);
        if (state != nullptr && state->timestamp == timestamp) {
            risk_->update_stops(position, *state);
        }
    }
}

bool StrategyOrchestrator::regime_allows_entries() const {
    const auto& benchmark = config_.universe.benchmark_symbol;
    if (!config_.use_benchmark_filter || benchmark.empty()) {
        return true;
    }
    const IndicatorState* state = indicators_->get_state(benchmark);
    if (state == nullptr || !state->sma) {
        return false;
    }
    return state->close > *state->sma;
}

bool StrategyOrchestrator::has_bar(const BarBatch& batch, const std::string& symbol) const {
    return std::any_of(batch.bars.begin(), batch.bars.end(),
                       [&symbol](const Bar& bar) { return bar.symbol == symbol; });
}

bool StrategyOrchestrator::is_pending(const std::string& symbol) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&symbol](const OrderIntent& intent) { return intent.symbol == symbol; });
}

RiskContext StrategyOrchestrator::make_context(const PortfolioSnapshot& snapshot,
                                               const UniverseSelection& selection) const {
    RiskContext ctx(snapshot, selection);
    std::set<std::string> opening;
    for (const auto& intent : pending_) {
        if (!intent.is_entry()) {
            continue;
        }
        const double notional = intent.quantity * intent.reference_price;
        ctx.pending_notional += notional;
        if (intent.side == Side::BUY) {
            ctx.pending_cash += notional;
        }
        if (!snapshot.has_position(intent.symbol)) {
            opening.insert(intent.symbol);
        }
    }
    ctx.pending_new_positions = static_cast<int>(opening.size());
    return ctx;
}

void StrategyOrchestrator::dispatch(OrderIntent intent) {
    intent.price_reference = config_.fill_price_reference;
    if (intent.price_reference == PriceReference::NEXT_OPEN) {
        DEBUG(intent.symbol << ": " << side_to_string(intent.side) << " " << intent.quantity
                            << " queued for next open ("
                            << intent_reason_to_string(intent.reason) << ")");
        pending_.push_back(std::move(intent));
        return;
    }
    execute(intent, intent.reference_price);
}

void StrategyOrchestrator::execute(const OrderIntent& intent, Price fill_price) {
    auto result = portfolio_->apply(intent, fill_price);
    if (result.is_error()) {
        WARN(intent.symbol << ": " << side_to_string(intent.side) << " " << intent.quantity
                           << " " << intent_reason_to_string(intent.reason) << " "
                           << result.error()->what());
        record(intent, OrderStatus::REJECTED, 0.0, result.error()->what());
        return;
    }

    risk_->on_fill(intent, fill_price, portfolio_->get_position(intent.symbol));
    INFO(intent.symbol << ": " << side_to_string(intent.side) << " " << intent.quantity << " @ "
                       << fill_price << " (" << intent_reason_to_string(intent.reason)
                       << "), cash " << portfolio_->cash());
    record(intent, OrderStatus::ACCEPTED, fill_price, "");
}

void StrategyOrchestrator::record(const OrderIntent& intent, OrderStatus status, Price fill_price,
                                  const std::string& message) {
    OrderLogEntry entry;
    entry.timestamp = intent.timestamp;
    entry.symbol = intent.symbol;
    entry.side = intent.side;
    entry.quantity = intent.quantity;
    entry.reference_price = intent.reference_price;
    entry.fill_price = fill_price;
    entry.reason = intent_reason_to_string(intent.reason);
    entry.status = status;
    entry.message = message;
    results_.order_log.push_back(std::move(entry));

    switch (status) {
        case OrderStatus::ACCEPTED:
            ++results_.accepted;
            break;
        case OrderStatus::REJECTED:
            ++results_.rejected;
            break;
        case OrderStatus::DROPPED:
            ++results_.dropped;
            break;
    }
}

void StrategyOrchestrator::record_decision(const RiskCandidate& candidate,
                                           const RiskDecision& decision) {
    OrderIntent intent;
    if (decision.intent) {
        intent = *decision.intent;
    } else {
        intent.symbol = candidate.symbol;
        intent.reference_price = candidate.price;
        intent.timestamp = candidate.timestamp;
        if (candidate.signal) {
            intent.side = candidate.signal->kind == SignalKind::ENTRY_LONG ||
                                  candidate.signal->kind == SignalKind::EXIT_SHORT
                              ? Side::BUY
                              : Side::SELL;
            intent.reason = candidate.signal->pattern == SignalPattern::RETEST
                                ? IntentReason::ENTRY_RETEST
                                : IntentReason::ENTRY_CROSS;
        }
    }
    WARN(candidate.symbol << ": " << decision.rule << " " << decision.message);
    record(intent, OrderStatus::REJECTED, 0.0, decision.message);
}

}  // namespace backtest
}  // namespace trend_engine
