// ============================================================================
// Error Code Tests
// ============================================================================

#include "fanout/core/error.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace fanout;

// ============================================================================
// Basic Error Tests
// ============================================================================

TEST(ErrorTest, MakeErrorCode) {
    std::error_code ec = make_error_code(Errc::PoolShutdown);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.value(), static_cast<int>(Errc::PoolShutdown));
    EXPECT_EQ(std::string(ec.category().name()), "fanout");
}

TEST(ErrorTest, ErrorMessages) {
    EXPECT_EQ(make_error_code(Errc::TaskFailed).message(), "Task failed");
    EXPECT_EQ(make_error_code(Errc::TaskPanicked).message(), "Task terminated with an exception");
    EXPECT_EQ(make_error_code(Errc::Cancelled).message(), "Operation cancelled");
    EXPECT_EQ(make_error_code(Errc::DeadlineExceeded).message(), "Deadline exceeded");
    EXPECT_EQ(make_error_code(Errc::PoolShutdown).message(), "Worker pool is shut down");
    EXPECT_EQ(make_error_code(Errc::QueueClosed).message(), "Work queue is closed");
    EXPECT_EQ(make_error_code(Errc::InvalidArgument).message(), "Invalid argument");
}

TEST(ErrorTest, UnknownValue) {
    std::error_code ec(999, FanoutCategory());
    EXPECT_EQ(ec.message(), "Unknown fanout error");
}

TEST(ErrorTest, CategorySingleton) {
    const auto& cat1 = FanoutCategory();
    const auto& cat2 = FanoutCategory();
    EXPECT_EQ(&cat1, &cat2);
}

TEST(ErrorTest, ImplicitConversionFromErrc) {
    // Errc is registered as is_error_code_enum, so implicit conversion works
    std::error_code ec = Errc::TaskPanicked;
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.message(), "Task terminated with an exception");
}

TEST(ErrorTest, ComparisonBetweenErrorCodes) {
    std::error_code ec1 = Errc::TaskFailed;
    std::error_code ec2 = Errc::TaskFailed;
    std::error_code ec3 = Errc::PoolShutdown;
    EXPECT_EQ(ec1, ec2);
    EXPECT_NE(ec1, ec3);
    EXPECT_EQ(ec1, Errc::TaskFailed);
}

TEST(ErrorTest, DistinctFromGenericCategory) {
    std::error_code ours = Errc::InvalidArgument;
    std::error_code generic = std::make_error_code(std::errc::invalid_argument);
    EXPECT_NE(ours, generic);
}
