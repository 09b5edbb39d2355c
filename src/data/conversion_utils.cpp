// src/data/conversion_utils.cpp
#include "trend_engine/data/conversion_utils.hpp"
#include <arrow/type_traits.h>
#include <chrono>

namespace trend_engine {

const std::vector<std::string>& DataConversionUtils::required_columns() {
    static const std::vector<std::string> columns = {"time", "symbol", "open", "high",
                                                     "low",  "close",  "volume"};
    return columns;
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    for (const auto& col : required_columns()) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::DATA_ERROR,
                                                "Missing required column: " + col,
                                                "DataConversionUtils");
        }
    }

    std::vector<Bar> bars;
    bars.reserve(static_cast<size_t>(table->num_rows()));

    try {
        // Slices every column along the same chunk boundaries
        arrow::TableBatchReader reader(*table);
        std::shared_ptr<arrow::RecordBatch> batch;
        int64_t row_offset = 0;

        while (true) {
            auto status = reader.ReadNext(&batch);
            if (!status.ok()) {
                return make_error<std::vector<Bar>>(ErrorCode::CONVERSION_ERROR,
                                                    "Failed to read table: " + status.ToString(),
                                                    "DataConversionUtils");
            }
            if (!batch) {
                break;
            }

            auto time_array = batch->GetColumnByName("time");
            auto symbol_array = batch->GetColumnByName("symbol");
            auto open_array = batch->GetColumnByName("open");
            auto high_array = batch->GetColumnByName("high");
            auto low_array = batch->GetColumnByName("low");
            auto close_array = batch->GetColumnByName("close");
            auto volume_array = batch->GetColumnByName("volume");

            for (int64_t i = 0; i < batch->num_rows(); ++i) {
                const std::string row = std::to_string(row_offset + i);

                auto ts_result = extract_timestamp(time_array, i);
                if (ts_result.is_error()) {
                    return make_error<std::vector<Bar>>(
                        ts_result.error()->code(),
                        std::string(ts_result.error()->what()) + " (row " + row + ")",
                        "DataConversionUtils");
                }

                auto symbol_result = extract_string(symbol_array, i);
                if (symbol_result.is_error()) {
                    return make_error<std::vector<Bar>>(
                        symbol_result.error()->code(),
                        std::string(symbol_result.error()->what()) + " (row " + row + ")",
                        "DataConversionUtils");
                }

                auto open_result = extract_double(open_array, i);
                auto high_result = extract_double(high_array, i);
                auto low_result = extract_double(low_array, i);
                auto close_result = extract_double(close_array, i);
                auto volume_result = extract_double(volume_array, i);

                if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                    close_result.is_error() || volume_result.is_error()) {
                    return make_error<std::vector<Bar>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Error extracting OHLCV values at row " + row, "DataConversionUtils");
                }

                bars.emplace_back(ts_result.value(), open_result.value(), high_result.value(),
                                  low_result.value(), close_result.value(),
                                  volume_result.value(), symbol_result.value());
            }
            row_offset += batch->num_rows();
        }
    } catch (const std::exception& e) {
        return make_error<std::vector<Bar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), "DataConversionUtils");
    }

    return Result<std::vector<Bar>>(std::move(bars));
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::DATA_ERROR, "Null timestamp value",
                                     "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            const int64_t value = ts_array->Value(index);
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    return Result<Timestamp>(Timestamp(std::chrono::seconds(value)));
                case arrow::TimeUnit::MILLI:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::milliseconds(value))));
                case arrow::TimeUnit::MICRO:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::microseconds(value))));
                case arrow::TimeUnit::NANO:
                    return Result<Timestamp>(Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                        std::chrono::nanoseconds(value))));
            }
            break;
        }
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            const int64_t days = date_array->Value(index);
            return Result<Timestamp>(Timestamp(std::chrono::seconds(days * 86400)));
        }
        case arrow::Type::INT64: {
            auto int_array = std::static_pointer_cast<arrow::Int64Array>(array);
            return Result<Timestamp>(Timestamp(std::chrono::seconds(int_array->Value(index))));
        }
        default:
            break;
    }

    return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                 "Unsupported timestamp column type " + array->type()->ToString(),
                                 "DataConversionUtils");
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<double>(ErrorCode::DATA_ERROR,
                                  "Null numeric value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return Result<double>(std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index));
        case arrow::Type::FLOAT:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::FloatArray>(array)->Value(index)));
        case arrow::Type::INT64:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(array)->Value(index)));
        case arrow::Type::INT32:
            return Result<double>(
                static_cast<double>(std::static_pointer_cast<arrow::Int32Array>(array)->Value(index)));
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Unsupported numeric column type " +
                                          array->type()->ToString(),
                                      "DataConversionUtils");
    }
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                       "DataConversionUtils");
    }
    if (array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::DATA_ERROR, "Null symbol value",
                                       "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Unsupported symbol column type " +
                                           array->type()->ToString(),
                                       "DataConversionUtils");
    }
    return Result<std::string>(std::static_pointer_cast<arrow::StringArray>(array)->GetString(index));
}

}  // namespace trend_engine
