// src/backtest/bar_stream.cpp
#include "trend_engine/backtest/bar_stream.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include "trend_engine/core/time_utils.hpp"

namespace trend_engine {
namespace backtest {

Result<void> validate_bar(const Bar& bar) {
    auto fail = [&bar](const std::string& what) {
        return make_error<void>(ErrorCode::DATA_ERROR,
                                "Malformed bar for '" + bar.symbol + "' at " +
                                    core::format_timestamp(bar.timestamp, "%Y-%m-%d %H:%M:%S") +
                                    ": " + what,
                                "BarStream");
    };

    if (bar.symbol.empty()) {
        return fail("empty symbol");
    }
    if (!std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low) ||
        !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
        return fail("non-finite field");
    }
    if (bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0) {
        return fail("non-positive price");
    }
    if (bar.high < bar.low) {
        return fail("high below low");
    }
    if (bar.open < bar.low || bar.open > bar.high) {
        return fail("open outside [low, high]");
    }
    if (bar.close < bar.low || bar.close > bar.high) {
        return fail("close outside [low, high]");
    }
    if (bar.volume < 0.0) {
        return fail("negative volume");
    }
    return Result<void>();
}

Result<void> check_symbol_order(const std::vector<Bar>& bars) {
    std::unordered_map<std::string, Timestamp> last_seen;
    for (const auto& bar : bars) {
        auto [it, inserted] = last_seen.emplace(bar.symbol, bar.timestamp);
        if (inserted) {
            continue;
        }
        if (bar.timestamp <= it->second) {
            const std::string what = bar.timestamp == it->second ? "Duplicate" : "Out-of-order";
            return make_error<void>(
                ErrorCode::SEQUENCE_ERROR,
                what + " bar for " + bar.symbol + " at " +
                    core::format_timestamp(bar.timestamp, "%Y-%m-%d %H:%M:%S") + " after " +
                    core::format_timestamp(it->second, "%Y-%m-%d %H:%M:%S"),
                "BarStream");
        }
        it->second = bar.timestamp;
    }
    return Result<void>();
}

Result<std::vector<BarBatch>> group_bars_by_timestamp(std::vector<Bar> bars) {
    auto ordered = check_symbol_order(bars);
    if (ordered.is_error()) {
        return forward_error<std::vector<BarBatch>>(*ordered.error());
    }

    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        if (a.timestamp != b.timestamp)
            return a.timestamp < b.timestamp;
        return a.symbol < b.symbol;
    });

    std::vector<BarBatch> batches;
    for (auto& bar : bars) {
        if (batches.empty() || batches.back().timestamp != bar.timestamp) {
            BarBatch batch;
            batch.timestamp = bar.timestamp;
            batches.push_back(std::move(batch));
        }
        batches.back().bars.push_back(std::move(bar));
    }
    return Result<std::vector<BarBatch>>(std::move(batches));
}

}  // namespace backtest
}  // namespace trend_engine
