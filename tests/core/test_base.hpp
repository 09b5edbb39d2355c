//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "trend_engine/core/logger.hpp"
#include "trend_engine/core/state_manager.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
        Logger::reset_for_tests();

        LoggerConfig config;
        config.min_level = LogLevel::WARNING;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        StateManager::reset_instance();
        Logger::reset_for_tests();
    }

    // 2016-01-01 00:00:00 UTC plus whole days
    static Timestamp day(int n) {
        return std::chrono::system_clock::from_time_t(1451606400) + std::chrono::hours(24 * n);
    }

    static Bar make_bar(const std::string& symbol, int n, double close, double volume = 1e6) {
        return Bar(day(n), close, close * 1.01, close * 0.99, close, volume, symbol);
    }

    /**
     * @brief One bar per element of closes, on consecutive days from day 0
     */
    static std::vector<Bar> make_series(const std::string& symbol,
                                        const std::vector<double>& closes,
                                        double volume = 1e6) {
        std::vector<Bar> bars;
        bars.reserve(closes.size());
        for (size_t i = 0; i < closes.size(); ++i) {
            bars.push_back(make_bar(symbol, static_cast<int>(i), closes[i], volume));
        }
        return bars;
    }
};

}  // namespace testing
}  // namespace trend_engine
