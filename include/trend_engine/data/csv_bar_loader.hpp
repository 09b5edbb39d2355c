// include/trend_engine/data/csv_bar_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trend_engine/core/config_base.hpp"
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {

/**
 * @brief Column mapping for daily bar CSV files
 */
struct CsvBarLoaderConfig : public ConfigBase {
    std::string time_column{"time"};
    std::string symbol_column{"symbol"};
    std::string open_column{"open"};
    std::string high_column{"high"};
    std::string low_column{"low"};
    std::string close_column{"close"};
    std::string volume_column{"volume"};
    char delimiter{','};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["time_column"] = time_column;
        j["symbol_column"] = symbol_column;
        j["open_column"] = open_column;
        j["high_column"] = high_column;
        j["low_column"] = low_column;
        j["close_column"] = close_column;
        j["volume_column"] = volume_column;
        j["delimiter"] = std::string(1, delimiter);
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("time_column"))
            time_column = j.at("time_column").get<std::string>();
        if (j.contains("symbol_column"))
            symbol_column = j.at("symbol_column").get<std::string>();
        if (j.contains("open_column"))
            open_column = j.at("open_column").get<std::string>();
        if (j.contains("high_column"))
            high_column = j.at("high_column").get<std::string>();
        if (j.contains("low_column"))
            low_column = j.at("low_column").get<std::string>();
        if (j.contains("close_column"))
            close_column = j.at("close_column").get<std::string>();
        if (j.contains("volume_column"))
            volume_column = j.at("volume_column").get<std::string>();
        if (j.contains("delimiter")) {
            auto d = j.at("delimiter").get<std::string>();
            if (!d.empty())
                delimiter = d[0];
        }
    }
};

/**
 * @brief Reads OHLCV bars from CSV through Arrow's CSV reader
 *
 * Times may be ISO dates or date-times; they are read as UTC seconds.
 */
class CsvBarLoader {
public:
    explicit CsvBarLoader(CsvBarLoaderConfig config = CsvBarLoaderConfig());

    /**
     * @brief Read a file into an Arrow table with canonical column names
     * @param path CSV file path
     * @return Table, FILE_NOT_FOUND, or FILE_IO_ERROR when parsing fails
     */
    Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path) const;

    /**
     * @brief Read a file into bars sorted by (timestamp, symbol)
     */
    Result<std::vector<Bar>> load(const std::string& path) const;

private:
    CsvBarLoaderConfig config_;
};

}  // namespace trend_engine
