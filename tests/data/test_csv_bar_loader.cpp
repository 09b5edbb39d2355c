#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "trend_engine/data/csv_bar_loader.hpp"
#include "../core/test_base.hpp"

using namespace trend_engine;
using namespace trend_engine::testing;

class CsvBarLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        path_ = (std::filesystem::temp_directory_path() / "trend_engine_bars_test.csv").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        TestBase::TearDown();
    }

    void write(const std::string& contents) {
        std::ofstream out(path_);
        out << contents;
    }

    std::string path_;
};

TEST_F(CsvBarLoaderTest, LoadsAndSortsBars) {
    write(
        "time,symbol,open,high,low,close,volume\n"
        "2016-01-02,BBB,50,51,49,50.5,2000\n"
        "2016-01-01,BBB,49,50,48,49.5,1800\n"
        "2016-01-01,AAA,100,101,99,100.5,1000\n");

    CsvBarLoader loader;
    auto result = loader.load(path_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& bars = result.value();
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].symbol, "AAA");
    EXPECT_EQ(bars[0].timestamp, day(0));
    EXPECT_EQ(bars[1].symbol, "BBB");
    EXPECT_EQ(bars[1].timestamp, day(0));
    EXPECT_EQ(bars[2].timestamp, day(1));
    EXPECT_DOUBLE_EQ(bars[2].close, 50.5);
    EXPECT_DOUBLE_EQ(bars[2].volume, 2000.0);
}

TEST_F(CsvBarLoaderTest, CustomColumnsAndDelimiter) {
    write(
        "Date;Ticker;Volume;Open;High;Low;Close;Extra\n"
        "2016-01-01;AAA;1000;100;101;99;100.5;x\n");

    CsvBarLoaderConfig config;
    config.time_column = "Date";
    config.symbol_column = "Ticker";
    config.open_column = "Open";
    config.high_column = "High";
    config.low_column = "Low";
    config.close_column = "Close";
    config.volume_column = "Volume";
    config.delimiter = ';';

    CsvBarLoader loader(config);
    auto table = loader.read_table(path_);
    ASSERT_TRUE(table.is_ok()) << table.error()->what();
    EXPECT_EQ(table.value()->schema()->field_names(), DataConversionUtils::required_columns());

    auto bars = loader.load(path_);
    ASSERT_TRUE(bars.is_ok());
    ASSERT_EQ(bars.value().size(), 1u);
    EXPECT_DOUBLE_EQ(bars.value()[0].open, 100.0);
    EXPECT_DOUBLE_EQ(bars.value()[0].volume, 1000.0);
}

TEST_F(CsvBarLoaderTest, MissingFile) {
    CsvBarLoader loader;
    auto result = loader.load(path_ + ".missing");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(CsvBarLoaderTest, MissingColumnFails) {
    write(
        "time,symbol,open,high,low,close\n"
        "2016-01-01,AAA,100,101,99,100.5\n");

    CsvBarLoader loader;
    auto result = loader.load(path_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(CsvBarLoaderTest, ConfigRoundTrip) {
    CsvBarLoaderConfig config;
    config.close_column = "Adj Close";
    config.delimiter = '\t';

    CsvBarLoaderConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.close_column, "Adj Close");
    EXPECT_EQ(loaded.delimiter, '\t');
}
