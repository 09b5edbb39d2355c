// src/data/csv_bar_loader.cpp
#include "trend_engine/data/csv_bar_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <filesystem>
#include "trend_engine/core/logger.hpp"
#include "trend_engine/data/conversion_utils.hpp"

namespace trend_engine {

CsvBarLoader::CsvBarLoader(CsvBarLoaderConfig config) : config_(std::move(config)) {}

Result<std::shared_ptr<arrow::Table>> CsvBarLoader::read_table(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return make_error<std::shared_ptr<arrow::Table>>(ErrorCode::FILE_NOT_FOUND,
                                                         "File not found: " + path,
                                                         "CsvBarLoader");
    }

    auto input_result = arrow::io::ReadableFile::Open(path, arrow::default_memory_pool());
    if (!input_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open " + path + ": " + input_result.status().ToString(),
            "CsvBarLoader");
    }
    std::shared_ptr<arrow::io::ReadableFile> input = *input_result;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = config_.delimiter;

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.column_types[config_.time_column] = arrow::timestamp(arrow::TimeUnit::SECOND);
    convert_options.column_types[config_.symbol_column] = arrow::utf8();
    for (const auto* name : {&config_.open_column, &config_.high_column, &config_.low_column,
                             &config_.close_column, &config_.volume_column}) {
        convert_options.column_types[*name] = arrow::float64();
    }
    convert_options.include_columns = {config_.time_column,  config_.symbol_column,
                                       config_.open_column,  config_.high_column,
                                       config_.low_column,   config_.close_column,
                                       config_.volume_column};

    auto reader_result = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                       read_options, parse_options,
                                                       convert_options);
    if (!reader_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to create CSV reader: " + reader_result.status().ToString(), "CsvBarLoader");
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to parse " + path + ": " + table_result.status().ToString(), "CsvBarLoader");
    }
    std::shared_ptr<arrow::Table> table = *table_result;

    // include_columns fixes the column order, so renaming is positional
    auto renamed = table->RenameColumns(DataConversionUtils::required_columns());
    if (!renamed.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to rename columns: " + renamed.status().ToString(), "CsvBarLoader");
    }

    return Result<std::shared_ptr<arrow::Table>>(*renamed);
}

Result<std::vector<Bar>> CsvBarLoader::load(const std::string& path) const {
    auto table = read_table(path);
    if (table.is_error()) {
        return forward_error<std::vector<Bar>>(*table.error());
    }

    auto bars_result = DataConversionUtils::arrow_table_to_bars(table.value());
    if (bars_result.is_error()) {
        return forward_error<std::vector<Bar>>(*bars_result.error());
    }

    std::vector<Bar> bars = bars_result.value();
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        if (a.timestamp != b.timestamp)
            return a.timestamp < b.timestamp;
        return a.symbol < b.symbol;
    });

    INFO("Loaded " << bars.size() << " bars from " << path);
    return Result<std::vector<Bar>>(std::move(bars));
}

}  // namespace trend_engine
