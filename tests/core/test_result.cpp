#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "hedge_ngin/core/error.hpp"

using namespace hedge_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);
    EXPECT_EQ(int_result.error(), nullptr);

    Result<std::string> string_result(std::string("BT_1"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "BT_1");
}

TEST_F(ResultTest, ErrorCarriesCodeAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::VALIDATION_ERROR, "tickers must not be empty", "Request");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_STREQ(error_result.error()->what(), "tickers must not be empty");
    EXPECT_EQ(error_result.error()->component(), "Request");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in Request: tickers must not be empty (Code: VALIDATION_ERROR)");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::COMPUTE_ERROR, "cash went negative");
    EXPECT_THROW(error_result.value(), HedgeError);

    try {
        error_result.value();
    } catch (const HedgeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::COMPUTE_ERROR);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));
    Result<std::unique_ptr<int>> moved = std::move(result);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(*moved.value(), 42);
}

TEST_F(ResultTest, ForwardErrorKeepsOrigin) {
    auto original = make_error<int>(ErrorCode::UPSTREAM_TIMEOUT, "slow", "RemoteSignalProducer");
    auto forwarded = forward_error<std::string>(original.error());

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::UPSTREAM_TIMEOUT);
    EXPECT_STREQ(forwarded.error()->what(), "slow");
    EXPECT_EQ(forwarded.error()->component(), "RemoteSignalProducer");
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::NOT_FOUND, "Backtest not found: x", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_THROW(error.value(), HedgeError);
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::NOT_FOUND), "NOT_FOUND");
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_FUNDS), "INSUFFICIENT_FUNDS");
    EXPECT_EQ(error_code_to_string(ErrorCode::CUSTOM_ERROR_START), "CUSTOM_ERROR");
}
