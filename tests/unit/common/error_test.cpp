/// @file error_test.cpp
/// @brief Tests for Guardian error handling utilities

#include <gtest/gtest.h>

#include "common/error.h"

namespace guardian {
namespace {

TEST(ErrorTest, MakeErrorMapsCanonicalCode) {
    EXPECT_EQ(CatalogLoadError("x").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(StrategyError("x").code(), absl::StatusCode::kInternal);
    EXPECT_EQ(ConfigurationError("x").code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(MakeError(ErrorCode::kProviderTimedOut, "x").code(),
              absl::StatusCode::kDeadlineExceeded);
    EXPECT_EQ(MakeError(ErrorCode::kProviderRateLimited, "x").code(),
              absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(MakeError(ErrorCode::kProviderUnavailable, "x").code(),
              absl::StatusCode::kUnavailable);
    EXPECT_EQ(MakeError(ErrorCode::kProviderInvalidResponse, "x").code(),
              absl::StatusCode::kDataLoss);
}

TEST(ErrorTest, PayloadDistinguishesSharedCanonicalCodes) {
    // Both are kInvalidArgument; only the payload tells them apart
    auto catalog = CatalogLoadError("duplicate id");
    auto plain = InvalidArgumentError("bad input");

    EXPECT_EQ(GetErrorCode(catalog), ErrorCode::kCatalogLoadError);
    EXPECT_EQ(GetErrorCode(plain), ErrorCode::kInvalidArgument);
    EXPECT_TRUE(IsCatalogLoadError(catalog));
    EXPECT_FALSE(IsCatalogLoadError(plain));
}

TEST(ErrorTest, MessagePreserved) {
    auto status = StrategyError("sanitize emptied the prompt");
    EXPECT_EQ(status.message(), "sanitize emptied the prompt");
    EXPECT_TRUE(IsStrategyError(status));
}

TEST(ErrorTest, ProviderErrors) {
    EXPECT_TRUE(IsProviderError(MakeError(ErrorCode::kProviderTimedOut, "t")));
    EXPECT_TRUE(IsProviderError(MakeError(ErrorCode::kProviderRateLimited, "r")));
    EXPECT_TRUE(IsProviderError(MakeError(ErrorCode::kProviderUnavailable, "u")));
    EXPECT_TRUE(IsProviderError(MakeError(ErrorCode::kProviderInvalidResponse, "i")));
    EXPECT_FALSE(IsProviderError(StrategyError("s")));
    EXPECT_FALSE(IsProviderError(absl::OkStatus()));
}

TEST(ErrorTest, FallbackWithoutPayload) {
    EXPECT_EQ(GetErrorCode(absl::DeadlineExceededError("late")),
              ErrorCode::kProviderTimedOut);
    EXPECT_EQ(GetErrorCode(absl::NotFoundError("gone")), ErrorCode::kNotFound);
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
}

TEST(ErrorTest, OkCodeProducesOkStatus) {
    auto status = MakeError(ErrorCode::kOk, "ignored");
    EXPECT_TRUE(status.ok());
}

TEST(ErrorTest, ErrorCodeNames) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kCatalogLoadError), "catalog_load_error");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kProviderTimedOut), "provider_timed_out");
}

absl::StatusOr<int> Half(int value) {
    if (value % 2 != 0) {
        return InvalidArgumentError("odd");
    }
    return value / 2;
}

absl::StatusOr<int> Quarter(int value) {
    GUARDIAN_ASSIGN_OR_RETURN(int half, Half(value));
    GUARDIAN_ASSIGN_OR_RETURN(int quarter, Half(half));
    return quarter;
}

absl::Status CheckPositive(int value) {
    GUARDIAN_CHECK_OR_RETURN(value > 0, InvalidArgumentError("not positive"));
    GUARDIAN_RETURN_IF_ERROR(Half(value).status());
    return OkStatus();
}

TEST(ErrorTest, PropagationMacros) {
    EXPECT_EQ(*Quarter(8), 2);
    EXPECT_FALSE(Quarter(6).ok());
    EXPECT_TRUE(CheckPositive(4).ok());
    EXPECT_FALSE(CheckPositive(-2).ok());
    EXPECT_FALSE(CheckPositive(3).ok());
}

}  // namespace
}  // namespace guardian
