#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include "signal_ngin/core/error.hpp"

using namespace signal_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<std::optional<double>> empty_optional(std::optional<double>{});
    EXPECT_TRUE(empty_optional.is_ok());
    EXPECT_FALSE(empty_optional.value().has_value());
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::INSUFFICIENT_DATA, "Need 15 candles, have 3", "RsiCalculator");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
    EXPECT_STREQ(error_result.error()->what(), "Need 15 candles, have 3");
    EXPECT_EQ(error_result.error()->component(), "RsiCalculator");
}

TEST_F(ResultTest, KindsAreMachineReadable) {
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_DATA), "InsufficientData");
    EXPECT_EQ(error_code_to_string(ErrorCode::INSTRUMENT_NOT_FOUND), "InstrumentNotFound");
    EXPECT_EQ(error_code_to_string(ErrorCode::UPSTREAM_FETCH_ERROR), "UpstreamFetch");
    EXPECT_EQ(error_code_to_string(ErrorCode::AUTHORIZATION_DENIED), "AuthorizationDenied");

    SignalError error(ErrorCode::TIMEOUT_ERROR, "too slow", "TaskGroup");
    EXPECT_EQ(error.kind(), "Timeout");
    EXPECT_EQ(error.to_string(), "Error in TaskGroup: too slow (Timeout)");
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndRenamesComponent) {
    auto inner = make_error<double>(ErrorCode::UPSTREAM_FETCH_ERROR, "HTTP 503", "JupiterPriceFeed");

    auto outer = forward_error<std::string>(inner, "QuoteService");
    ASSERT_TRUE(outer.is_error());
    EXPECT_EQ(outer.error()->code(), ErrorCode::UPSTREAM_FETCH_ERROR);
    EXPECT_STREQ(outer.error()->what(), "HTTP 503");
    EXPECT_EQ(outer.error()->component(), "QuoteService");

    auto same_component = forward_error<int>(inner);
    EXPECT_EQ(same_component.error()->component(), "JupiterPriceFeed");
}

TEST_F(ResultTest, MoveOnlyValue) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));
    ASSERT_TRUE(result.is_ok());

    std::unique_ptr<int> taken = result.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);
    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto failed = make_error<std::string>(ErrorCode::CANCELLED, "cancelled", "Test");
    Result<std::string> moved_failed = std::move(failed);
    ASSERT_TRUE(moved_failed.is_error());
    EXPECT_EQ(moved_failed.error()->code(), ErrorCode::CANCELLED);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
