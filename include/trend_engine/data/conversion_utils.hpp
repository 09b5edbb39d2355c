// include/trend_engine/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {

class DataConversionUtils {
public:
    /**
     * @brief Convert an Arrow table of OHLCV rows to Bars
     * @param table Table with columns time, symbol, open, high, low, close, volume
     * @return Bars in table order, or CONVERSION_ERROR / DATA_ERROR naming the row
     */
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    static const std::vector<std::string>& required_columns();

private:
    /**
     * @brief Extract a timestamp from timestamp (any unit), date32 or int64 seconds
     */
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    /**
     * @brief Extract a number from double, float or integer columns
     */
    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace trend_engine
