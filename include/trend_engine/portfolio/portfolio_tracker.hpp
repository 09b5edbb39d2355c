// include/trend_engine/portfolio/portfolio_tracker.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {

/**
 * @brief Configuration for portfolio accounting
 */
struct PortfolioConfig : public ConfigBase {
    double initial_cash{100000.0};
    double commission_per_share{0.0};
    bool allow_short{false};

    Result<void> validate() const;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["initial_cash"] = initial_cash;
        j["commission_per_share"] = commission_per_share;
        j["allow_short"] = allow_short;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("initial_cash"))
            initial_cash = j.at("initial_cash").get<double>();
        if (j.contains("commission_per_share"))
            commission_per_share = j.at("commission_per_share").get<double>();
        if (j.contains("allow_short"))
            allow_short = j.at("allow_short").get<bool>();
    }
};

/**
 * @brief Portfolio state at the end of one step
 *
 * Equity and exposure are derived from cash and positions when the snapshot
 * is built and never updated afterwards.
 */
struct PortfolioSnapshot {
    Timestamp timestamp;
    double cash{0.0};
    std::map<std::string, Position> positions;
    double equity{0.0};          // cash + sum(quantity * last price)
    double gross_exposure{0.0};  // sum(|quantity * last price|)
    double realized_pnl{0.0};
    double unrealized_pnl{0.0};
    double commissions{0.0};

    const Position* find(const std::string& symbol) const {
        auto it = positions.find(symbol);
        return it == positions.end() ? nullptr : &it->second;
    }

    bool has_position(const std::string& symbol) const {
        return positions.count(symbol) > 0;
    }

    size_t open_positions() const {
        return positions.size();
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Owns authoritative cash and position state
 *
 * Applies at most one fill per intent at the caller-supplied price. Fills
 * that would drive cash negative are rejected whole, never partially filled.
 */
class PortfolioTracker {
public:
    explicit PortfolioTracker(PortfolioConfig config);

    /**
     * @brief Apply a fill for an order intent
     * @param intent Intent to fill
     * @param fill_price Price of the fill
     * @return Snapshot after the fill, or INSUFFICIENT_FUNDS / ORDER_REJECTED /
     *         INVALID_ORDER without touching state
     */
    Result<PortfolioSnapshot> apply(const OrderIntent& intent, Price fill_price);

    /**
     * @brief Update the last known price of a held symbol
     */
    void mark_to_market(const std::string& symbol, Price price, const Timestamp& timestamp);

    /**
     * @brief Build a snapshot with equity re-derived from current state
     */
    PortfolioSnapshot snapshot(const Timestamp& timestamp) const;

    double cash() const {
        return cash_;
    }

    double equity() const;

    const Position* get_position(const std::string& symbol) const;

    const std::map<std::string, Position>& get_positions() const {
        return positions_;
    }

    std::set<std::string> open_symbols() const;

    const PortfolioConfig& get_config() const {
        return config_;
    }

    void reset();

private:
    PortfolioConfig config_;
    double cash_;
    double closed_realized_pnl_{0.0};
    double commissions_{0.0};
    std::map<std::string, Position> positions_;
};

}  // namespace trend_engine
