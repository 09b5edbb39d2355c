// include/trend_engine/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace trend_engine {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;

/**
 * @brief Quantity type for order and position sizes
 * Whole shares are traded, but the type stays floating point so that signed
 * position arithmetic and P&L share one representation.
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

/**
 * @brief Market data bar structure
 * One OHLCV observation for a symbol at a timestamp
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief Which price an order intent is filled against
 */
enum class PriceReference {
    LAST_CLOSE,  // Close of the bar that produced the intent
    NEXT_OPEN    // Open of the symbol's next bar
};

inline std::string price_reference_to_string(PriceReference ref) {
    return ref == PriceReference::NEXT_OPEN ? "NEXT_OPEN" : "LAST_CLOSE";
}

inline PriceReference price_reference_from_string(const std::string& str) {
    return str == "NEXT_OPEN" ? PriceReference::NEXT_OPEN : PriceReference::LAST_CLOSE;
}

/**
 * @brief Why an order intent was produced
 */
enum class IntentReason {
    ENTRY_CROSS,
    ENTRY_RETEST,
    SIGNAL_EXIT,
    TRAILING_STOP,
    STOP_LOSS,
    TAKE_PROFIT,
    FORCED_EXIT
};

/**
 * @brief Rationale string recorded in the order log
 */
inline std::string intent_reason_to_string(IntentReason reason) {
    switch (reason) {
        case IntentReason::ENTRY_CROSS:
            return "entry_cross";
        case IntentReason::ENTRY_RETEST:
            return "entry_retest";
        case IntentReason::SIGNAL_EXIT:
            return "signal_exit";
        case IntentReason::TRAILING_STOP:
            return "trailing_stop";
        case IntentReason::STOP_LOSS:
            return "stop";
        case IntentReason::TAKE_PROFIT:
            return "target";
        case IntentReason::FORCED_EXIT:
            return "forced_exit";
        default:
            return "unknown";
    }
}

inline bool is_entry_reason(IntentReason reason) {
    return reason == IntentReason::ENTRY_CROSS || reason == IntentReason::ENTRY_RETEST;
}

/**
 * @brief A proposed trade awaiting portfolio application
 */
struct OrderIntent {
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};  // Always positive, direction carried by side
    PriceReference price_reference{PriceReference::LAST_CLOSE};
    Price reference_price{0.0};  // Close used for sizing
    IntentReason reason{IntentReason::SIGNAL_EXIT};
    Timestamp timestamp;

    // Protective levels computed at sizing time for entries
    std::optional<Price> stop_price;
    std::optional<Price> target_price;

    // Signed change the intent applies to a position
    Quantity signed_quantity() const {
        return side == Side::BUY ? quantity : -quantity;
    }

    bool is_entry() const {
        return is_entry_reason(reason);
    }
};

/**
 * @brief Position structure
 * Quantity is signed: positive for long, negative for short
 */
struct Position {
    std::string symbol;
    Quantity quantity{0.0};
    Price average_price{0.0};
    Price last_price{0.0};
    double realized_pnl{0.0};
    int entries{0};  // Fills that opened or added to the position
    Timestamp opened_at;
    Timestamp last_update;

    Position() = default;
    Position(std::string sym, Quantity qty, Price avg_price, Timestamp ts)
        : symbol(std::move(sym)),
          quantity(qty),
          average_price(avg_price),
          last_price(avg_price),
          entries(1),
          opened_at(ts),
          last_update(ts) {}

    bool has_position() const {
        return quantity != 0.0;
    }

    Side get_side() const {
        if (quantity > 0)
            return Side::BUY;
        if (quantity < 0)
            return Side::SELL;
        return Side::NONE;
    }

    double market_value() const {
        return quantity * last_price;
    }

    // Derived, never stored
    double unrealized_pnl() const {
        return (last_price - average_price) * quantity;
    }
};

}  // namespace trend_engine
