#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "folio/core/error.hpp"

using namespace folio;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::PRICE_UNAVAILABLE, "no quote for XYZ", "PriceSourceAdapter");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::PRICE_UNAVAILABLE);
    EXPECT_STREQ(error_result.error()->what(), "no quote for XYZ");
    EXPECT_EQ(error_result.error()->component(), "PriceSourceAdapter");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in PriceSourceAdapter: no quote for XYZ (PRICE_UNAVAILABLE)");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::INVALID_DATA, "bad", "Test");
    EXPECT_THROW(error_result.value(), FolioError);

    try {
        error_result.value();
        FAIL() << "value() should have thrown";
    } catch (const FolioError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_DATA);
    }
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

    auto failure = make_error<void>(ErrorCode::FILE_NOT_FOUND, "missing", "ConfigBase");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.error()->code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_THROW(failure.value(), FolioError);
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_POSITION), "INSUFFICIENT_POSITION");
    EXPECT_EQ(error_code_to_string(ErrorCode::OPERATION_CANCELLED), "OPERATION_CANCELLED");
    EXPECT_EQ(error_code_to_string(ErrorCode::NONE), "NONE");
}
