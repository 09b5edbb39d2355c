// src/risk/risk_manager.cpp
#include "trend_engine/risk/risk_manager.hpp"
#include <cmath>
#include <sstream>
#include "trend_engine/core/logger.hpp"

namespace trend_engine {

Result<void> RiskConfig::validate() const {
    if (risk_per_trade <= 0.0 || risk_per_trade > 0.1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "risk_per_trade must be in (0, 0.1]", "RiskConfig");
    }
    if (position_fraction <= 0.0 || position_fraction > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "position_fraction must be in (0, 1]", "RiskConfig");
    }
    if (cash_buffer <= 0.0 || cash_buffer > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "cash_buffer must be in (0, 1]",
                                "RiskConfig");
    }
    if (stop_loss_pct < 0.0 || stop_loss_pct >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "stop_loss_pct must be in [0, 1)",
                                "RiskConfig");
    }
    if (take_profit_pct < 0.0 || trailing_profit_threshold < 0.0 ||
        trailing_atr_multiplier < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Profit targets and trailing parameters cannot be negative",
                                "RiskConfig");
    }
    if (max_positions < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_positions must be at least 1",
                                "RiskConfig");
    }
    if (max_aggregate_exposure <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_aggregate_exposure must be positive", "RiskConfig");
    }
    return Result<void>();
}

namespace {

OrderIntent make_close_intent(const RiskCandidate& candidate, const Position& position,
                              IntentReason reason) {
    OrderIntent intent;
    intent.symbol = candidate.symbol;
    intent.side = position.quantity > 0.0 ? Side::SELL : Side::BUY;
    intent.quantity = std::abs(position.quantity);
    intent.reference_price = candidate.price;
    intent.reason = reason;
    intent.timestamp = candidate.timestamp;
    return intent;
}

bool is_entry_draft(const RiskCandidate& candidate) {
    return candidate.draft && candidate.draft->is_entry();
}

}  // namespace

namespace risk_rules {

Result<RiskDecision> forced_exit(const RiskConfig&, const RiskContext& ctx,
                                 const RiskCandidate& candidate) {
    const Position* position = ctx.portfolio.find(candidate.symbol);
    if (position == nullptr || !ctx.universe.is_forced_exit(candidate.symbol)) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    return Result<RiskDecision>(RiskDecision::accept(
        make_close_intent(candidate, *position, IntentReason::FORCED_EXIT), "forced_exit"));
}

Result<RiskDecision> protective_stop(const RiskConfig&, const RiskContext& ctx,
                                     const RiskCandidate& candidate) {
    const Position* position = ctx.portfolio.find(candidate.symbol);
    if (position == nullptr || candidate.stops == nullptr) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    if (candidate.stops->stop_breached(candidate.price)) {
        return Result<RiskDecision>(RiskDecision::accept(
            make_close_intent(candidate, *position, IntentReason::STOP_LOSS), "protective_stop"));
    }
    if (candidate.stops->target_reached(candidate.price)) {
        return Result<RiskDecision>(RiskDecision::accept(
            make_close_intent(candidate, *position, IntentReason::TAKE_PROFIT),
            "protective_stop"));
    }
    return Result<RiskDecision>(RiskDecision::defer());
}

Result<RiskDecision> exit_signal(const RiskConfig&, const RiskContext& ctx,
                                 const RiskCandidate& candidate) {
    if (!candidate.signal || !candidate.signal->is_exit()) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    const Position* position = ctx.portfolio.find(candidate.symbol);
    if (position == nullptr) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    const bool matches = candidate.signal->kind == SignalKind::EXIT_LONG ? position->quantity > 0.0
                                                                         : position->quantity < 0.0;
    if (!matches) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    IntentReason reason = candidate.signal->pattern == SignalPattern::TRAILING_STOP
                              ? IntentReason::TRAILING_STOP
                              : IntentReason::SIGNAL_EXIT;
    return Result<RiskDecision>(
        RiskDecision::accept(make_close_intent(candidate, *position, reason), "exit_signal"));
}

Result<RiskDecision> entry_sizing(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate) {
    if (!candidate.signal || !candidate.signal->is_entry()) {
        return Result<RiskDecision>(RiskDecision::defer());
    }

    const bool is_long = candidate.signal->kind == SignalKind::ENTRY_LONG;
    const Position* existing = ctx.portfolio.find(candidate.symbol);
    if (existing != nullptr && (existing->quantity > 0.0) != is_long) {
        return Result<RiskDecision>(RiskDecision::reject(
            ErrorCode::INVALID_ORDER, "rejected: entry against the open position", "entry_sizing"));
    }
    if (!ctx.universe.is_eligible(candidate.symbol)) {
        return Result<RiskDecision>(RiskDecision::reject(
            ErrorCode::ORDER_REJECTED, "rejected: symbol not in universe", "entry_sizing"));
    }

    const Price price = candidate.price;
    const double equity = ctx.portfolio.equity;
    if (!(price > 0.0) || !(equity > 0.0)) {
        return make_error<RiskDecision>(ErrorCode::SIZING_ERROR,
                                        "Non-positive price or equity for " + candidate.symbol,
                                        "RiskManager");
    }

    const double anchor = (candidate.indicators != nullptr && candidate.indicators->sma)
                              ? *candidate.indicators->sma
                              : price;
    const Price stop = is_long ? anchor * (1.0 - config.stop_loss_pct)
                               : anchor * (1.0 + config.stop_loss_pct);

    double raw_quantity = 0.0;
    if (config.sizing_method == SizingMethod::RISK_PER_TRADE) {
        const double stop_distance = is_long ? price - stop : stop - price;
        if (!(stop_distance > 0.0)) {
            std::ostringstream msg;
            msg << "Stop distance " << stop_distance << " for " << candidate.symbol
                << " leaves risk-per-trade sizing undefined";
            return make_error<RiskDecision>(ErrorCode::SIZING_ERROR, msg.str(), "RiskManager");
        }
        raw_quantity = equity * config.risk_per_trade / stop_distance;
    } else {
        raw_quantity = equity * config.position_fraction / price;
    }

    if (!std::isfinite(raw_quantity)) {
        return make_error<RiskDecision>(ErrorCode::SIZING_ERROR,
                                        "Non-finite quantity for " + candidate.symbol,
                                        "RiskManager");
    }

    double quantity = std::floor(raw_quantity);
    if (quantity < 1.0) {
        return Result<RiskDecision>(RiskDecision::reject(
            ErrorCode::ORDER_REJECTED, "rejected: quantity rounds to zero", "entry_sizing"));
    }

    const double available = std::max(0.0, ctx.portfolio.cash - ctx.pending_cash);
    const double affordable = std::floor(available * config.cash_buffer / price);
    if (affordable < 1.0) {
        return Result<RiskDecision>(RiskDecision::reject(ErrorCode::INSUFFICIENT_FUNDS,
                                                         "rejected: insufficient buying power",
                                                         "entry_sizing"));
    }
    quantity = std::min(quantity, affordable);

    OrderIntent intent;
    intent.symbol = candidate.symbol;
    intent.side = is_long ? Side::BUY : Side::SELL;
    intent.quantity = quantity;
    intent.reference_price = price;
    intent.reason = candidate.signal->pattern == SignalPattern::RETEST ? IntentReason::ENTRY_RETEST
                                                                       : IntentReason::ENTRY_CROSS;
    intent.timestamp = candidate.timestamp;
    intent.stop_price = stop;
    if (config.take_profit_pct > 0.0) {
        intent.target_price =
            is_long ? price * (1.0 + config.take_profit_pct) : price * (1.0 - config.take_profit_pct);
    }
    return Result<RiskDecision>(RiskDecision::defer(intent));
}

Result<RiskDecision> position_cap(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate) {
    if (!is_entry_draft(candidate) || ctx.portfolio.has_position(candidate.symbol)) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    const int open = static_cast<int>(ctx.portfolio.open_positions()) + ctx.pending_new_positions;
    if (open >= config.max_positions) {
        return Result<RiskDecision>(RiskDecision::reject(
            ErrorCode::POSITION_LIMIT_EXCEEDED,
            "rejected: max positions (" + std::to_string(config.max_positions) + ") reached",
            "position_cap", candidate.draft));
    }
    return Result<RiskDecision>(RiskDecision::defer());
}

Result<RiskDecision> exposure_cap(const RiskConfig& config, const RiskContext& ctx,
                                  const RiskCandidate& candidate) {
    if (!is_entry_draft(candidate)) {
        return Result<RiskDecision>(RiskDecision::defer());
    }
    const OrderIntent& draft = *candidate.draft;
    const double cap = config.max_aggregate_exposure * ctx.portfolio.equity;
    const double current = ctx.portfolio.gross_exposure + ctx.pending_notional;
    const double notional = draft.quantity * draft.reference_price;

    if (current + notional <= cap) {
        return Result<RiskDecision>(RiskDecision::defer());
    }

    if (config.scale_to_exposure_cap && draft.reference_price > 0.0) {
        const double room = std::floor((cap - current) / draft.reference_price);
        if (room >= 1.0) {
            OrderIntent scaled = draft;
            scaled.quantity = room;
            return Result<RiskDecision>(RiskDecision::defer(scaled));
        }
    }

    std::ostringstream msg;
    msg << "rejected: aggregate exposure cap (" << current + notional << " > " << cap << ")";
    return Result<RiskDecision>(RiskDecision::reject(ErrorCode::RISK_LIMIT_EXCEEDED, msg.str(),
                                                     "exposure_cap", candidate.draft));
}

std::vector<RiskRule> default_rules() {
    return {
        {"forced_exit", forced_exit},   {"protective_stop", protective_stop},
        {"exit_signal", exit_signal},   {"entry_sizing", entry_sizing},
        {"position_cap", position_cap}, {"exposure_cap", exposure_cap},
    };
}

}  // namespace risk_rules

RiskManager::RiskManager(RiskConfig config)
    : config_(std::move(config)), rules_(risk_rules::default_rules()), stops_(config_) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw EngineError(valid.error()->code(), valid.error()->what(), "RiskManager");
    }
}

Result<RiskDecision> RiskManager::evaluate(const RiskContext& ctx,
                                           RiskCandidate candidate) const {
    if (candidate.stops == nullptr) {
        candidate.stops = stops_.get(candidate.symbol);
    }

    std::string draft_rule;
    for (const auto& rule : rules_) {
        auto result = rule.apply(config_, ctx, candidate);
        if (result.is_error()) {
            return forward_error<RiskDecision>(*result.error());
        }
        const RiskDecision& decision = result.value();
        if (decision.verdict != RiskVerdict::DEFER) {
            TRACE(candidate.symbol << ": " << rule.name << " -> "
                                   << risk_verdict_to_string(decision.verdict));
            RiskDecision out = decision;
            if (!out.intent && candidate.draft) {
                out.intent = candidate.draft;
            }
            return Result<RiskDecision>(std::move(out));
        }
        if (decision.intent) {
            candidate.draft = decision.intent;
            draft_rule = rule.name;
        }
    }

    if (candidate.draft) {
        return Result<RiskDecision>(RiskDecision::accept(*candidate.draft, draft_rule));
    }
    return Result<RiskDecision>(RiskDecision::defer());
}

}  // namespace trend_engine
