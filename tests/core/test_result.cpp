#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "trend_engine/core/error.hpp"

using namespace trend_engine;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);
    EXPECT_EQ(int_result.error(), nullptr);

    Result<std::string> string_result(std::string("success"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::SEQUENCE_ERROR, "Out-of-order bar", "IndicatorEngine");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::SEQUENCE_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "Out-of-order bar");
    EXPECT_EQ(error_result.error()->component(), "IndicatorEngine");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::SIZING_ERROR, "zero stop distance");
    EXPECT_THROW(error_result.value(), EngineError);

    auto void_error = make_error<void>(ErrorCode::DATA_ERROR, "bad bar");
    EXPECT_THROW(void_error.value(), EngineError);
}

TEST_F(ResultTest, VoidSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok.is_ok());
    EXPECT_NO_THROW(ok.value());
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(7);
    Result<std::unique_ptr<int>> result(std::move(ptr));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 7);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::vector<int>> original(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved(std::move(original));
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().size(), 3u);

    auto error = make_error<std::vector<int>>(ErrorCode::FILE_NOT_FOUND, "missing");
    Result<std::vector<int>> moved_error(std::move(error));
    ASSERT_TRUE(moved_error.is_error());
    EXPECT_EQ(moved_error.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndComponent) {
    auto source = make_error<int>(ErrorCode::DATA_ERROR, "negative volume", "BarStream");
    auto forwarded = forward_error<std::string>(*source.error());
    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::DATA_ERROR);
    EXPECT_STREQ(forwarded.error()->what(), "negative volume");
    EXPECT_EQ(forwarded.error()->component(), "BarStream");
}

TEST_F(ResultTest, FatalClassification) {
    EXPECT_TRUE(is_fatal(ErrorCode::SEQUENCE_ERROR));
    EXPECT_TRUE(is_fatal(ErrorCode::DATA_ERROR));
    EXPECT_FALSE(is_fatal(ErrorCode::SIZING_ERROR));
    EXPECT_FALSE(is_fatal(ErrorCode::INSUFFICIENT_FUNDS));
    EXPECT_FALSE(is_fatal(ErrorCode::RISK_LIMIT_EXCEEDED));
    EXPECT_FALSE(is_fatal(ErrorCode::POSITION_LIMIT_EXCEEDED));
}

TEST_F(ResultTest, ErrorToString) {
    EngineError error(ErrorCode::INSUFFICIENT_FUNDS, "rejected: insufficient buying power",
                      "PortfolioTracker");
    EXPECT_EQ(error.to_string(),
              "Error in PortfolioTracker: rejected: insufficient buying power "
              "(INSUFFICIENT_FUNDS)");
}
