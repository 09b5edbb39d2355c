#include <gtest/gtest.h>
#include <cmath>
#include "trend_engine/risk/risk_manager.hpp"
#include "../core/test_base.hpp"

using namespace trend_engine;
using namespace trend_engine::testing;

class RiskRulesTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        snapshot_.timestamp = day(150);
        snapshot_.cash = 100000.0;
        snapshot_.equity = 100000.0;
        universe_.as_of = day(150);
        universe_.eligible = {"AAA", "BBB"};

        state_.symbol = "AAA";
        state_.timestamp = day(150);
        state_.close = 101.49;
        state_.sma = 100.745;
    }

    void hold(const std::string& symbol, double quantity, double average, double last) {
        Position position(symbol, quantity, average, day(100));
        position.last_price = last;
        snapshot_.positions[symbol] = position;
        snapshot_.cash -= quantity * average;
        snapshot_.gross_exposure += std::abs(quantity * last);
        snapshot_.equity = snapshot_.cash + quantity * last;
    }

    RiskCandidate entry_candidate(const std::string& symbol, double price,
                                  SignalPattern pattern = SignalPattern::CROSS) const {
        Signal signal;
        signal.symbol = symbol;
        signal.kind = SignalKind::ENTRY_LONG;
        signal.pattern = pattern;
        signal.timestamp = day(150);
        signal.price = price;
        signal.strength = 0.9;

        RiskCandidate candidate;
        candidate.symbol = symbol;
        candidate.timestamp = day(150);
        candidate.price = price;
        candidate.signal = signal;
        candidate.indicators = &state_;
        return candidate;
    }

    RiskConfig config_;
    PortfolioSnapshot snapshot_;
    UniverseSelection universe_;
    IndicatorState state_;
};

TEST_F(RiskRulesTest, RiskPerTradeSizing) {
    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_ok());

    const auto& decision = result.value();
    EXPECT_EQ(decision.verdict, RiskVerdict::DEFER);
    ASSERT_TRUE(decision.intent.has_value());

    const double stop = 100.745 * (1.0 - 0.015);
    const double expected = std::floor(100000.0 * 0.01 / (101.49 - stop));
    EXPECT_DOUBLE_EQ(decision.intent->quantity, expected);
    EXPECT_DOUBLE_EQ(decision.intent->quantity, 443.0);
    EXPECT_EQ(decision.intent->side, Side::BUY);
    EXPECT_EQ(decision.intent->reason, IntentReason::ENTRY_CROSS);
    ASSERT_TRUE(decision.intent->stop_price.has_value());
    EXPECT_NEAR(*decision.intent->stop_price, stop, 1e-9);
    EXPECT_FALSE(decision.intent->target_price.has_value());
}

TEST_F(RiskRulesTest, FixedFractionalSizingAndTarget) {
    config_.sizing_method = SizingMethod::FIXED_FRACTIONAL;
    config_.position_fraction = 0.1;
    config_.take_profit_pct = 0.2;

    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx,
                                           entry_candidate("AAA", 50.0, SignalPattern::RETEST));
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().intent.has_value());
    EXPECT_DOUBLE_EQ(result.value().intent->quantity, 200.0);
    EXPECT_EQ(result.value().intent->reason, IntentReason::ENTRY_RETEST);
    ASSERT_TRUE(result.value().intent->target_price.has_value());
    EXPECT_NEAR(*result.value().intent->target_price, 60.0, 1e-9);
}

TEST_F(RiskRulesTest, ZeroStopDistanceIsSizingError) {
    config_.stop_loss_pct = 0.0;
    state_.sma = 101.49;

    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SIZING_ERROR);
}

TEST_F(RiskRulesTest, ClipsToBuyingPower) {
    snapshot_.cash = 10000.0;
    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().intent.has_value());
    EXPECT_DOUBLE_EQ(result.value().intent->quantity, std::floor(10000.0 * 0.95 / 101.49));
}

TEST_F(RiskRulesTest, NoBuyingPowerRejects) {
    snapshot_.cash = 50.0;
    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
    EXPECT_EQ(result.value().code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(result.value().message, "rejected: insufficient buying power");
}

TEST_F(RiskRulesTest, QuantityRoundingToZeroRejects) {
    config_.sizing_method = SizingMethod::FIXED_FRACTIONAL;
    config_.position_fraction = 0.001;
    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("AAA", 500.0));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
    EXPECT_FALSE(result.value().intent.has_value());
}

TEST_F(RiskRulesTest, IneligibleSymbolRejected) {
    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::entry_sizing(config_, ctx, entry_candidate("ZZZ", 101.49));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
}

TEST_F(RiskRulesTest, PositionCap) {
    config_.max_positions = 1;
    hold("BBB", 10.0, 100.0, 100.0);

    RiskContext ctx(snapshot_, universe_);
    auto candidate = entry_candidate("AAA", 101.49);
    candidate.draft = OrderIntent();
    candidate.draft->symbol = "AAA";
    candidate.draft->side = Side::BUY;
    candidate.draft->quantity = 10.0;
    candidate.draft->reference_price = 101.49;
    candidate.draft->reason = IntentReason::ENTRY_CROSS;

    auto result = risk_rules::position_cap(config_, ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
    EXPECT_EQ(result.value().code, ErrorCode::POSITION_LIMIT_EXCEEDED);

    // Adding to a held symbol does not count as a new position
    candidate.symbol = "BBB";
    candidate.draft->symbol = "BBB";
    auto add = risk_rules::position_cap(config_, ctx, candidate);
    ASSERT_TRUE(add.is_ok());
    EXPECT_EQ(add.value().verdict, RiskVerdict::DEFER);
}

TEST_F(RiskRulesTest, PendingEntriesCountTowardCaps) {
    config_.max_positions = 1;
    RiskContext ctx(snapshot_, universe_);
    ctx.pending_new_positions = 1;

    auto candidate = entry_candidate("AAA", 101.49);
    candidate.draft = OrderIntent();
    candidate.draft->symbol = "AAA";
    candidate.draft->side = Side::BUY;
    candidate.draft->quantity = 10.0;
    candidate.draft->reference_price = 101.49;
    candidate.draft->reason = IntentReason::ENTRY_CROSS;

    auto result = risk_rules::position_cap(config_, ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
}

TEST_F(RiskRulesTest, ExposureCapRejectsOrScales) {
    config_.max_aggregate_exposure = 0.6;
    hold("BBB", 400.0, 100.0, 100.0);  // 40% of equity

    auto candidate = entry_candidate("AAA", 100.0);
    candidate.draft = OrderIntent();
    candidate.draft->symbol = "AAA";
    candidate.draft->side = Side::BUY;
    candidate.draft->quantity = 300.0;  // Would take exposure to 70%
    candidate.draft->reference_price = 100.0;
    candidate.draft->reason = IntentReason::ENTRY_CROSS;

    RiskContext ctx(snapshot_, universe_);
    auto rejected = risk_rules::exposure_cap(config_, ctx, candidate);
    ASSERT_TRUE(rejected.is_ok());
    EXPECT_EQ(rejected.value().verdict, RiskVerdict::REJECT);
    EXPECT_EQ(rejected.value().code, ErrorCode::RISK_LIMIT_EXCEEDED);

    config_.scale_to_exposure_cap = true;
    auto scaled = risk_rules::exposure_cap(config_, ctx, candidate);
    ASSERT_TRUE(scaled.is_ok());
    EXPECT_EQ(scaled.value().verdict, RiskVerdict::DEFER);
    ASSERT_TRUE(scaled.value().intent.has_value());
    EXPECT_DOUBLE_EQ(scaled.value().intent->quantity, 200.0);
}

TEST_F(RiskRulesTest, ForcedExitClosesWholePosition) {
    hold("AAA", 25.0, 100.0, 102.0);
    universe_.eligible.erase("AAA");
    universe_.forced_exit.insert("AAA");

    RiskCandidate candidate;
    candidate.symbol = "AAA";
    candidate.timestamp = day(150);
    candidate.price = 102.0;

    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::forced_exit(config_, ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::ACCEPT);
    ASSERT_TRUE(result.value().intent.has_value());
    EXPECT_EQ(result.value().intent->side, Side::SELL);
    EXPECT_DOUBLE_EQ(result.value().intent->quantity, 25.0);
    EXPECT_EQ(intent_reason_to_string(result.value().intent->reason), "forced_exit");
}

TEST_F(RiskRulesTest, ProtectiveStopAndTarget) {
    hold("AAA", 25.0, 100.0, 95.0);
    StopLevels levels;
    levels.static_stop = 98.0;
    levels.target = 120.0;

    RiskCandidate candidate;
    candidate.symbol = "AAA";
    candidate.timestamp = day(150);
    candidate.price = 95.0;
    candidate.stops = &levels;

    RiskContext ctx(snapshot_, universe_);
    auto stop = risk_rules::protective_stop(config_, ctx, candidate);
    ASSERT_TRUE(stop.is_ok());
    EXPECT_EQ(stop.value().verdict, RiskVerdict::ACCEPT);
    EXPECT_EQ(intent_reason_to_string(stop.value().intent->reason), "stop");

    candidate.price = 121.0;
    auto target = risk_rules::protective_stop(config_, ctx, candidate);
    ASSERT_TRUE(target.is_ok());
    EXPECT_EQ(target.value().verdict, RiskVerdict::ACCEPT);
    EXPECT_EQ(intent_reason_to_string(target.value().intent->reason), "target");

    candidate.price = 105.0;
    auto hold_on = risk_rules::protective_stop(config_, ctx, candidate);
    ASSERT_TRUE(hold_on.is_ok());
    EXPECT_EQ(hold_on.value().verdict, RiskVerdict::DEFER);

    candidate.price = 98.0;
    auto at_stop = risk_rules::protective_stop(config_, ctx, candidate);
    ASSERT_TRUE(at_stop.is_ok());
    EXPECT_EQ(at_stop.value().verdict, RiskVerdict::DEFER);
}

TEST_F(RiskRulesTest, StopTakesPrecedenceOverEntry) {
    hold("AAA", 25.0, 100.0, 97.0);
    RiskManager manager(config_);

    StopLevels levels;
    levels.static_stop = 98.0;

    // A pyramid entry signal arrives on the same bar the stop is breached
    auto candidate = entry_candidate("AAA", 97.0, SignalPattern::RETEST);
    candidate.stops = &levels;

    RiskContext ctx(snapshot_, universe_);
    auto result = manager.evaluate(ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::ACCEPT);
    EXPECT_EQ(result.value().rule, "protective_stop");
    EXPECT_EQ(intent_reason_to_string(result.value().intent->reason), "stop");
    EXPECT_EQ(result.value().intent->side, Side::SELL);
}

TEST_F(RiskRulesTest, ExitSignalMapsTrailingStopReason) {
    hold("AAA", 25.0, 100.0, 110.0);

    Signal signal;
    signal.symbol = "AAA";
    signal.kind = SignalKind::EXIT_LONG;
    signal.pattern = SignalPattern::TRAILING_STOP;

    RiskCandidate candidate;
    candidate.symbol = "AAA";
    candidate.price = 110.0;
    candidate.signal = signal;

    RiskContext ctx(snapshot_, universe_);
    auto result = risk_rules::exit_signal(config_, ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::ACCEPT);
    EXPECT_EQ(result.value().intent->reason, IntentReason::TRAILING_STOP);
}

TEST_F(RiskRulesTest, EvaluateRunsFullPipelineForEntry) {
    RiskManager manager(config_);
    RiskContext ctx(snapshot_, universe_);
    auto result = manager.evaluate(ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::ACCEPT);
    EXPECT_EQ(result.value().rule, "entry_sizing");
    EXPECT_DOUBLE_EQ(result.value().intent->quantity, 443.0);
}

TEST_F(RiskRulesTest, EvaluateDefersWithoutSignalOrPosition) {
    RiskManager manager(config_);
    RiskContext ctx(snapshot_, universe_);

    RiskCandidate candidate;
    candidate.symbol = "AAA";
    candidate.price = 100.0;
    auto result = manager.evaluate(ctx, candidate);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::DEFER);
    EXPECT_FALSE(result.value().intent.has_value());
}

TEST_F(RiskRulesTest, CustomRuleOrder) {
    RiskManager manager(config_);
    auto rules = risk_rules::default_rules();
    EXPECT_EQ(rules.front().name, "forced_exit");
    EXPECT_EQ(rules.back().name, "exposure_cap");

    // A veto rule placed first blocks everything
    rules.insert(rules.begin(), RiskRule{"halt", [](const RiskConfig&, const RiskContext&,
                                                    const RiskCandidate&) {
                                             return Result<RiskDecision>(RiskDecision::reject(
                                                 ErrorCode::ORDER_REJECTED, "halted", "halt"));
                                         }});
    manager.set_rules(rules);

    RiskContext ctx(snapshot_, universe_);
    auto result = manager.evaluate(ctx, entry_candidate("AAA", 101.49));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().verdict, RiskVerdict::REJECT);
    EXPECT_EQ(result.value().rule, "halt");
}

TEST_F(RiskRulesTest, ConfigValidation) {
    EXPECT_TRUE(config_.validate().is_ok());
    config_.risk_per_trade = 0.0;
    EXPECT_TRUE(config_.validate().is_error());
    config_.risk_per_trade = 0.1;
    EXPECT_TRUE(config_.validate().is_ok());
    config_.max_positions = 0;
    EXPECT_TRUE(config_.validate().is_error());
    EXPECT_THROW(RiskManager manager(config_), EngineError);
}
