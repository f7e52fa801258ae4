#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "divcap/core/error.hpp"

using namespace divcap;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INSUFFICIENT_CASH, "Not enough cash", "Portfolio");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INSUFFICIENT_CASH);
    EXPECT_STREQ(error_result.error()->what(), "Not enough cash");
    EXPECT_EQ(error_result.error()->component(), "Portfolio");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::DATA_NOT_FOUND, "missing", "Data");
    EXPECT_THROW(error_result.value(), BacktestError);

    auto void_error = make_error<void>(ErrorCode::NO_POSITION, "none", "Registry");
    EXPECT_THROW(void_error.value(), BacktestError);
}

TEST_F(ResultTest, TakeValueMovesOut) {
    Result<std::vector<std::string>> result(std::vector<std::string>{"a", "b"});
    std::vector<std::string> taken = result.take_value();
    ASSERT_EQ(taken.size(), 2u);
    EXPECT_EQ(taken[1], "b");
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));
    Result<std::unique_ptr<int>> moved = std::move(result);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
}

TEST_F(ResultTest, ErrorToString) {
    BacktestError error(ErrorCode::DUPLICATE_ENTRY, "already holding 7203", "PositionRegistry");
    EXPECT_EQ(error.to_string(),
              "Error in PositionRegistry: already holding 7203 (DUPLICATE_ENTRY)");
    EXPECT_EQ(error_code_to_string(ErrorCode::SIGNAL_REJECTED), "SIGNAL_REJECTED");
    EXPECT_EQ(error_code_to_string(ErrorCode::INVALID_CONFIG), "INVALID_CONFIG");
}
