// src/portfolio/portfolio_tracker.cpp
#include "trend_engine/portfolio/portfolio_tracker.hpp"
#include <cmath>
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {

Result<void> PortfolioConfig::validate() const {
    if (!(initial_cash > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "initial_cash must be positive",
                                "PortfolioConfig");
    }
    if (commission_per_share < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "commission_per_share cannot be negative", "PortfolioConfig");
    }
    return Result<void>();
}

nlohmann::json PortfolioSnapshot::to_json() const {
    nlohmann::json j;
    j["timestamp"] = core::to_epoch_seconds(timestamp);
    j["date"] = core::format_timestamp(timestamp, "%Y-%m-%d");
    j["cash"] = cash;
    j["equity"] = equity;
    j["gross_exposure"] = gross_exposure;
    j["realized_pnl"] = realized_pnl;
    j["unrealized_pnl"] = unrealized_pnl;
    j["commissions"] = commissions;

    j["positions"] = nlohmann::json::array();
    for (const auto& [symbol, pos] : positions) {
        nlohmann::json p;
        p["symbol"] = symbol;
        p["quantity"] = pos.quantity;
        p["average_price"] = pos.average_price;
        p["last_price"] = pos.last_price;
        p["market_value"] = pos.market_value();
        p["unrealized_pnl"] = pos.unrealized_pnl();
        p["realized_pnl"] = pos.realized_pnl;
        p["entries"] = pos.entries;
        p["opened_at"] = core::to_epoch_seconds(pos.opened_at);
        j["positions"].push_back(p);
    }
    return j;
}

PortfolioTracker::PortfolioTracker(PortfolioConfig config)
    : config_(std::move(config)), cash_(config_.initial_cash) {}

void PortfolioTracker::reset() {
    cash_ = config_.initial_cash;
    closed_realized_pnl_ = 0.0;
    commissions_ = 0.0;
    positions_.clear();
}

Result<PortfolioSnapshot> PortfolioTracker::apply(const OrderIntent& intent, Price fill_price) {
    if (intent.symbol.empty() || intent.side == Side::NONE) {
        return make_error<PortfolioSnapshot>(ErrorCode::INVALID_ORDER,
                                             "Intent has no symbol or side", "PortfolioTracker");
    }
    if (!(intent.quantity > 0.0) || !std::isfinite(intent.quantity)) {
        return make_error<PortfolioSnapshot>(
            ErrorCode::INVALID_ORDER,
            "Invalid quantity " + std::to_string(intent.quantity) + " for " + intent.symbol,
            "PortfolioTracker");
    }
    if (!(fill_price > 0.0) || !std::isfinite(fill_price)) {
        return make_error<PortfolioSnapshot>(
            ErrorCode::INVALID_ORDER,
            "Invalid fill price " + std::to_string(fill_price) + " for " + intent.symbol,
            "PortfolioTracker");
    }

    const Quantity delta = intent.signed_quantity();
    auto it = positions_.find(intent.symbol);
    const Quantity current = it == positions_.end() ? 0.0 : it->second.quantity;
    const Quantity resulting = current + delta;

    // One intent never flips a position through zero
    if (current != 0.0 && resulting != 0.0 && (current > 0.0) != (resulting > 0.0)) {
        return make_error<PortfolioSnapshot>(
            ErrorCode::INVALID_ORDER,
            "Intent would reverse the " + intent.symbol + " position from " +
                std::to_string(current) + " to " + std::to_string(resulting),
            "PortfolioTracker");
    }

    if (resulting < 0.0 && std::abs(resulting) > std::abs(current) && !config_.allow_short) {
        return make_error<PortfolioSnapshot>(ErrorCode::ORDER_REJECTED,
                                             "rejected: shorting disabled for " + intent.symbol,
                                             "PortfolioTracker");
    }

    const double commission = config_.commission_per_share * intent.quantity;
    const double cash_after = cash_ - delta * fill_price - commission;
    if (cash_after < 0.0) {
        return make_error<PortfolioSnapshot>(
            ErrorCode::INSUFFICIENT_FUNDS,
            "rejected: insufficient buying power for " + intent.symbol + " (need " +
                std::to_string(delta * fill_price + commission) + ", have " +
                std::to_string(cash_) + ")",
            "PortfolioTracker");
    }

    cash_ = cash_after;
    commissions_ += commission;

    if (it == positions_.end()) {
        Position pos(intent.symbol, delta, fill_price, intent.timestamp);
        positions_.emplace(intent.symbol, pos);
    } else {
        auto& pos = it->second;
        const bool increasing = std::abs(resulting) > std::abs(current);
        if (increasing) {
            const double total = std::abs(current) + intent.quantity;
            pos.average_price =
                (std::abs(current) * pos.average_price + intent.quantity * fill_price) / total;
            pos.entries += 1;
        } else {
            const double direction = current > 0.0 ? 1.0 : -1.0;
            pos.realized_pnl += (fill_price - pos.average_price) * intent.quantity * direction;
        }
        pos.quantity = resulting;
        pos.last_price = fill_price;
        pos.last_update = intent.timestamp;

        if (pos.quantity == 0.0) {
            closed_realized_pnl_ += pos.realized_pnl;
            positions_.erase(it);
        }
    }

    return Result<PortfolioSnapshot>(snapshot(intent.timestamp));
}

void PortfolioTracker::mark_to_market(const std::string& symbol, Price price,
                                      const Timestamp& timestamp) {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return;
    }
    it->second.last_price = price;
    it->second.last_update = timestamp;
}

double PortfolioTracker::equity() const {
    double value = cash_;
    for (const auto& [_, pos] : positions_) {
        value += pos.market_value();
    }
    return value;
}

PortfolioSnapshot PortfolioTracker::snapshot(const Timestamp& timestamp) const {
    PortfolioSnapshot snap;
    snap.timestamp = timestamp;
    snap.cash = cash_;
    snap.positions = positions_;
    snap.commissions = commissions_;
    snap.realized_pnl = closed_realized_pnl_;

    double market_value = 0.0;
    for (const auto& [_, pos] : positions_) {
        market_value += pos.market_value();
        snap.gross_exposure += std::abs(pos.market_value());
        snap.unrealized_pnl += pos.unrealized_pnl();
        snap.realized_pnl += pos.realized_pnl;
    }
    snap.equity = cash_ + market_value;
    return snap;
}

const Position* PortfolioTracker::get_position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? nullptr : &it->second;
}

std::set<std::string> PortfolioTracker::open_symbols() const {
    std::set<std::string> symbols;
    for (const auto& [symbol, _] : positions_) {
        symbols.insert(symbol);
    }
    return symbols;
}

}  // namespace trend_engine
