#include <gtest/gtest.h>
#include "trend_engine/signals/signal_detector.hpp"
#include "../core/test_base.hpp"

using namespace trend_engine;
using namespace trend_engine::testing;

class SignalDetectorTest : public TestBase {
protected:
    static IndicatorState make_state(double close, std::optional<double> sma,
                                     std::optional<double> previous_close = std::nullopt,
                                     std::optional<double> previous_sma = std::nullopt) {
        IndicatorState state;
        state.symbol = "AAA";
        state.timestamp = day(200);
        state.bars_seen = 200;
        state.close = close;
        state.sma = sma;
        state.previous_close = previous_close;
        state.previous_sma = previous_sma;
        return state;
    }

    static PositionView long_view(int entries = 1, std::optional<Price> trailing = std::nullopt) {
        PositionView view;
        view.state = PositionState::LONG;
        view.entries = entries;
        view.trailing_stop = trailing;
        return view;
    }

    SignalDetector detector_{SignalConfig()};
};

TEST_F(SignalDetectorTest, NoSignalWhileWarmingUp) {
    auto signal = detector_.detect("AAA", make_state(100.5, std::nullopt), PositionView());
    EXPECT_FALSE(signal.has_value());
}

TEST_F(SignalDetectorTest, CrossEntryNeedsPriorCloseAtOrBelowSma) {
    // 0.5% above the SMA, previous close below the previous SMA
    auto signal = detector_.detect("AAA", make_state(100.5, 100.0, 99.0, 99.8), PositionView());
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::ENTRY_LONG);
    EXPECT_EQ(signal->pattern, SignalPattern::CROSS);
    EXPECT_NEAR(signal->strength, 0.75, 1e-9);

    // Already above on the previous bar: not a cross
    auto no_cross = detector_.detect("AAA", make_state(100.5, 100.0, 100.4, 99.9), PositionView());
    EXPECT_FALSE(no_cross.has_value());
}

TEST_F(SignalDetectorTest, FirstReadyBarConfirmsCrossByBand) {
    auto signal = detector_.detect("AAA", make_state(100.5, 100.0, 100.4), PositionView());
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->pattern, SignalPattern::CROSS);
}

TEST_F(SignalDetectorTest, CrossBandUpperBound) {
    EXPECT_TRUE(detector_.detect("AAA", make_state(101.0, 100.0, 99.0, 100.0), PositionView())
                    .has_value());
    EXPECT_FALSE(detector_.detect("AAA", make_state(101.5, 100.0, 99.0, 100.0), PositionView())
                     .has_value());
}

TEST_F(SignalDetectorTest, RetestBand) {
    auto signal = detector_.detect("AAA", make_state(103.5, 100.0, 104.0, 99.9), PositionView());
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::ENTRY_LONG);
    EXPECT_EQ(signal->pattern, SignalPattern::RETEST);
    EXPECT_NEAR(signal->strength, 0.25, 1e-9);

    EXPECT_FALSE(detector_.detect("AAA", make_state(102.0, 100.0, 104.0, 99.9), PositionView())
                     .has_value());
    EXPECT_FALSE(detector_.detect("AAA", make_state(104.5, 100.0, 104.0, 99.9), PositionView())
                     .has_value());
}

TEST_F(SignalDetectorTest, TrendBreakExitsLong) {
    auto signal = detector_.detect("AAA", make_state(99.0, 100.0, 101.0, 100.0), long_view());
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::EXIT_LONG);
    EXPECT_EQ(signal->pattern, SignalPattern::TREND_BREAK);
}

TEST_F(SignalDetectorTest, TrailingStopFromPositionView) {
    auto signal =
        detector_.detect("AAA", make_state(110.0, 100.0, 112.0, 99.0), long_view(1, 111.0));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::EXIT_LONG);
    EXPECT_EQ(signal->pattern, SignalPattern::TRAILING_STOP);
}

TEST_F(SignalDetectorTest, ExitEvaluatedBeforeEntry) {
    // Close sits in the retest band but under the trailing stop: exit wins
    auto signal =
        detector_.detect("AAA", make_state(103.5, 100.0, 105.0, 99.9), long_view(1, 104.0));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::EXIT_LONG);
}

TEST_F(SignalDetectorTest, PyramidingLimitedByMaxEntries) {
    auto add = detector_.detect("AAA", make_state(103.5, 100.0, 104.0, 99.9), long_view(1));
    ASSERT_TRUE(add.has_value());
    EXPECT_EQ(add->kind, SignalKind::ENTRY_LONG);

    auto full = detector_.detect("AAA", make_state(103.5, 100.0, 104.0, 99.9), long_view(2));
    EXPECT_FALSE(full.has_value());
}

TEST_F(SignalDetectorTest, PositiveSlopeRequirement) {
    SignalConfig config;
    config.require_positive_slope = true;
    SignalDetector detector(config);

    auto state = make_state(100.5, 100.0, 99.0, 99.8);
    state.sma_slope = -0.01;
    EXPECT_FALSE(detector.detect("AAA", state, PositionView()).has_value());

    state.sma_slope = 0.01;
    EXPECT_TRUE(detector.detect("AAA", state, PositionView()).has_value());
}

TEST_F(SignalDetectorTest, ShortsOnlyWhenEnabled) {
    // 0.5% below the SMA after closing above it
    auto state = make_state(99.5, 100.0, 100.5, 100.1);
    EXPECT_FALSE(detector_.detect("AAA", state, PositionView()).has_value());

    SignalConfig config;
    config.shorting_enabled = true;
    SignalDetector detector(config);
    auto signal = detector.detect("AAA", state, PositionView());
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->kind, SignalKind::ENTRY_SHORT);
    EXPECT_EQ(signal->pattern, SignalPattern::CROSS);

    PositionView short_view;
    short_view.state = PositionState::SHORT;
    short_view.entries = 1;
    auto cover = detector.detect("AAA", make_state(101.0, 100.0, 99.0, 100.0), short_view);
    ASSERT_TRUE(cover.has_value());
    EXPECT_EQ(cover->kind, SignalKind::EXIT_SHORT);
}

TEST_F(SignalDetectorTest, TransitionFunction) {
    EXPECT_EQ(SignalDetector::transition(PositionState::FLAT, SignalKind::ENTRY_LONG),
              PositionState::LONG);
    EXPECT_EQ(SignalDetector::transition(PositionState::LONG, SignalKind::EXIT_LONG),
              PositionState::FLAT);
    EXPECT_EQ(SignalDetector::transition(PositionState::LONG, SignalKind::ENTRY_LONG),
              PositionState::LONG);
    EXPECT_EQ(SignalDetector::transition(PositionState::FLAT, SignalKind::ENTRY_SHORT),
              PositionState::SHORT);
    EXPECT_EQ(SignalDetector::transition(PositionState::SHORT, SignalKind::EXIT_SHORT),
              PositionState::FLAT);
    EXPECT_EQ(SignalDetector::transition(PositionState::FLAT, SignalKind::EXIT_LONG),
              PositionState::FLAT);
}

TEST_F(SignalDetectorTest, InvalidConfigThrows) {
    SignalConfig config;
    config.retest_min = 0.05;
    config.retest_max = 0.04;
    EXPECT_THROW(SignalDetector detector(config), EngineError);
}

TEST_F(SignalDetectorTest, PositionViewFromPosition) {
    Position position("AAA", 10.0, 100.0, day(0));
    position.entries = 2;
    auto view = PositionView::from_position(&position, 95.0);
    EXPECT_EQ(view.state, PositionState::LONG);
    EXPECT_EQ(view.entries, 2);
    ASSERT_TRUE(view.trailing_stop.has_value());

    auto flat = PositionView::from_position(nullptr, 95.0);
    EXPECT_EQ(flat.state, PositionState::FLAT);
    EXPECT_FALSE(flat.trailing_stop.has_value());
}
