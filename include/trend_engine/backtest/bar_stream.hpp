// include/trend_engine/backtest/bar_stream.hpp
#pragma once

#include <vector>
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {
namespace backtest {

/**
 * @brief All bars sharing one timestamp, one per symbol
 */
struct BarBatch {
    Timestamp timestamp;
    std::vector<Bar> bars;  // Sorted by symbol
};

/**
 * @brief Check a bar's fields
 * @return DATA_ERROR naming the offending field
 */
Result<void> validate_bar(const Bar& bar);

/**
 * @brief Check that each symbol's bars have strictly increasing timestamps
 *
 * Bars of different symbols may interleave in any way.
 *
 * @return SEQUENCE_ERROR on the first bar that repeats or precedes its
 *         symbol's previous timestamp
 */
Result<void> check_symbol_order(const std::vector<Bar>& bars);

/**
 * @brief Group a bar stream into per-timestamp batches
 *
 * Each symbol's bars must already be in timestamp order; symbols may
 * interleave freely. Batches come out in timestamp order with bars sorted
 * by symbol inside each batch.
 *
 * @return Batches, or the SEQUENCE_ERROR from check_symbol_order
 */
Result<std::vector<BarBatch>> group_bars_by_timestamp(std::vector<Bar> bars);

}  // namespace backtest
}  // namespace trend_engine
