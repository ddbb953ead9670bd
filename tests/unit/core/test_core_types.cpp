/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_codes, error, result)
 */

#include <gtest/gtest.h>

#include <jobwire/core/error_codes.h>
#include <jobwire/core/types.h>

#include <string>
#include <unordered_set>

namespace jobwire::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Connect errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::connect_failed), -100);
    EXPECT_EQ(static_cast<int>(error_code::network_unavailable), -105);

    // API errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::api_error), -120);
    EXPECT_EQ(static_cast<int>(error_code::api_invalid_response), -121);

    // Protocol errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::protocol_error), -140);
    EXPECT_EQ(static_cast<int>(error_code::channel_closed), -141);

    // Timeout errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::timeout), -160);

    // Transfer errors: -180 to -199
    EXPECT_EQ(static_cast<int>(error_code::transfer_failed), -180);
    EXPECT_EQ(static_cast<int>(error_code::locator_expired), -182);

    EXPECT_EQ(static_cast<int>(error_code::cancelled), -200);
    EXPECT_EQ(static_cast<int>(error_code::invalid_argument), -210);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(error_code::success), "success");
    EXPECT_EQ(to_string(error_code::host_unreachable), "host unreachable");
    EXPECT_EQ(to_string(error_code::auth_rejected), "authentication rejected");
    EXPECT_EQ(to_string(error_code::locator_consumed), "storage locator already used");
    EXPECT_EQ(to_string(error_code::cancelled), "cancelled by caller");
}

TEST_F(ErrorCodeTest, AllCodesHaveDistinctStrings) {
    const error_code codes[] = {
        error_code::connect_failed, error_code::malformed_url,
        error_code::host_unreachable, error_code::auth_rejected,
        error_code::missing_credential, error_code::network_unavailable,
        error_code::api_error, error_code::api_invalid_response,
        error_code::protocol_error, error_code::channel_closed,
        error_code::timeout, error_code::channel_timeout,
        error_code::transfer_failed, error_code::locator_consumed,
        error_code::locator_expired, error_code::cancelled,
        error_code::invalid_argument, error_code::invalid_payload,
        error_code::invalid_configuration, error_code::internal_error,
        error_code::not_connected
    };

    std::unordered_set<std::string_view> seen;
    for (auto code : codes) {
        auto text = to_string(code);
        EXPECT_NE(text, "unknown error");
        EXPECT_TRUE(seen.insert(text).second) << text;
    }
}

TEST_F(ErrorCodeTest, Categories) {
    EXPECT_EQ(category_of(error_code::success), error_category::none);
    EXPECT_EQ(category_of(error_code::malformed_url), error_category::connect);
    EXPECT_EQ(category_of(error_code::auth_rejected), error_category::connect);
    EXPECT_EQ(category_of(error_code::api_error), error_category::api);
    EXPECT_EQ(category_of(error_code::channel_closed), error_category::protocol);
    EXPECT_EQ(category_of(error_code::channel_timeout), error_category::timeout);
    EXPECT_EQ(category_of(error_code::locator_expired), error_category::transfer);
    EXPECT_EQ(category_of(error_code::cancelled), error_category::cancelled);
    EXPECT_EQ(category_of(error_code::invalid_payload), error_category::usage);
}

TEST_F(ErrorCodeTest, FallbackEligibility) {
    EXPECT_TRUE(is_fallback_eligible(error_code::connect_failed));
    EXPECT_TRUE(is_fallback_eligible(error_code::host_unreachable));
    EXPECT_TRUE(is_fallback_eligible(error_code::auth_rejected));
    EXPECT_TRUE(is_fallback_eligible(error_code::protocol_error));
    EXPECT_TRUE(is_fallback_eligible(error_code::channel_closed));

    EXPECT_FALSE(is_fallback_eligible(error_code::timeout));
    EXPECT_FALSE(is_fallback_eligible(error_code::cancelled));
    EXPECT_FALSE(is_fallback_eligible(error_code::api_error));
    EXPECT_FALSE(is_fallback_eligible(error_code::transfer_failed));
    EXPECT_FALSE(is_fallback_eligible(error_code::invalid_argument));
}

TEST_F(ErrorCodeTest, CategoryNames) {
    EXPECT_EQ(to_string(error_category::connect), "ConnectError");
    EXPECT_EQ(to_string(error_category::api), "ApiError");
    EXPECT_EQ(to_string(error_category::protocol), "ProtocolError");
    EXPECT_EQ(to_string(error_category::timeout), "TimeoutError");
    EXPECT_EQ(to_string(error_category::transfer), "TransferError");
    EXPECT_EQ(to_string(error_category::cancelled), "Cancelled");
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, DefaultErrorIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ResultTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::timeout);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "deadline exceeded");
    EXPECT_EQ(err.category(), error_category::timeout);
}

TEST_F(ResultTest, ErrorToString) {
    error err(error_code::api_error, "HTTP 500 on GET /jobs/1");
    EXPECT_EQ(err.to_string(), "ApiError (-120): HTTP 500 on GET /jobs/1");
}

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, ErrorResult) {
    result<std::string> r = unexpected{error{error_code::not_connected, "Call connect() first"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::not_connected);
    EXPECT_EQ(r.error().message, "Call connect() first");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::cancelled}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().category(), error_category::cancelled);
}

TEST_F(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

}  // namespace jobwire::test
