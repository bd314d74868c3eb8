/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result<T>
 */

#include <gtest/gtest.h>

#include <kcenon/file_delivery/core/types.h>

#include <memory>
#include <string>

namespace kcenon::file_delivery::test {

// ============================================================================
// error_code
// ============================================================================

TEST(ErrorCodeTest, ToStringCoversCodes) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::lock_conflict), "lock conflict");
    EXPECT_STREQ(to_string(error_code::host_not_approved), "host not approved");
    EXPECT_STREQ(to_string(error_code::missing_api_key), "missing api key");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST(ErrorCodeTest, CodesAreGroupedByRange) {
    EXPECT_LE(static_cast<int>(error_code::file_move_error), -100);
    EXPECT_GT(static_cast<int>(error_code::file_move_error), -120);
    EXPECT_LE(static_cast<int>(error_code::invalid_response), -160);
    EXPECT_GT(static_cast<int>(error_code::invalid_response), -180);
}

// ============================================================================
// error
// ============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
    error e;
    EXPECT_EQ(e.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(e));
}

TEST(ErrorTest, CodeOnlyUsesDefaultMessage) {
    error e(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_EQ(e.message, "file not found");
    EXPECT_EQ(e.http_status, 0);
}

TEST(ErrorTest, CarriesHttpStatus) {
    error e(error_code::http_error, "HTTP 503", 503);
    EXPECT_EQ(e.http_status, 503);
    EXPECT_EQ(e.message, "HTTP 503");
}

// ============================================================================
// result<T>
// ============================================================================

TEST(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::invalid_configuration, "bad"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
    EXPECT_EQ(r.error().message, "bad");
}

TEST(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, CopyPreservesError) {
    result<std::string> r = unexpected{error{error_code::lock_conflict, "held"}};
    auto copy = r;
    ASSERT_FALSE(copy.has_value());
    EXPECT_EQ(copy.error().message, "held");
}

TEST(ResultVoidTest, DefaultIsSuccess) {
    result<void> r;
    EXPECT_TRUE(r.has_value());
}

TEST(ResultVoidTest, HoldsError) {
    result<void> r = unexpected{error{error_code::lock_io_error, "disk full"}};
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::lock_io_error);
}

}  // namespace kcenon::file_delivery::test
