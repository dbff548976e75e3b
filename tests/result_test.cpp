// ============================================================================
// Result<T> Tests
// ============================================================================

#include "fanout/core/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace fanout;

// ============================================================================
// Construction
// ============================================================================

TEST(ResultTest, Success) {
    Result<int> r = Success(42);
    EXPECT_TRUE(r.IsSuccess());
    EXPECT_FALSE(r.IsFailure());
    EXPECT_FALSE(r.IsCancelled());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.Kind(), ResultKind::Success);
    EXPECT_EQ(r.Value(), 42);
}

TEST(ResultTest, SuccessConvertsValueType) {
    Result<std::string> r = Success("hello");
    ASSERT_TRUE(r.IsSuccess());
    EXPECT_EQ(r.Value(), "hello");
}

TEST(ResultTest, UnitSuccess) {
    Result<Unit> r = Success();
    EXPECT_TRUE(r.IsSuccess());
}

TEST(ResultTest, FailureWithCode) {
    Result<int> r = Failure(make_error_code(Errc::TaskFailed), "disk full");
    EXPECT_TRUE(r.IsFailure());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_EQ(r.Error().code, Errc::TaskFailed);
    EXPECT_EQ(r.Error().message, "disk full");
    EXPECT_FALSE(r.Error().recovered);
}

TEST(ResultTest, FailureWithTaskError) {
    Result<int> r = Failure(TaskError{make_error_code(Errc::TaskPanicked), "boom", true});
    ASSERT_TRUE(r.IsFailure());
    EXPECT_TRUE(r.Error().recovered);
    EXPECT_EQ(r.Error().ToString(), "Task terminated with an exception: boom (recovered)");
}

TEST(ResultTest, Cancelled) {
    Result<int> r = Cancelled(CancelReason::Timeout);
    EXPECT_TRUE(r.IsCancelled());
    EXPECT_EQ(r.Reason(), CancelReason::Timeout);
}

TEST(ResultTest, CancelledDefaultsToExplicit) {
    Result<int> r1 = Cancelled();
    Result<int> r2 = Cancelled(CancelReason::None);
    EXPECT_EQ(r1.Reason(), CancelReason::Explicit);
    EXPECT_EQ(r2.Reason(), CancelReason::Explicit);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r = Success(std::make_unique<int>(5));
    ASSERT_TRUE(r.IsSuccess());
    auto ptr = std::move(r).Value();
    EXPECT_EQ(*ptr, 5);
}

// ============================================================================
// Combinators
// ============================================================================

TEST(ResultTest, ValueOr) {
    Result<int> ok = Success(1);
    Result<int> failed = Failure(make_error_code(Errc::TaskFailed));
    Result<int> cancelled = Cancelled();
    EXPECT_EQ(ok.ValueOr(-1), 1);
    EXPECT_EQ(failed.ValueOr(-1), -1);
    EXPECT_EQ(cancelled.ValueOr(-1), -1);
}

TEST(ResultTest, MapSuccess) {
    Result<int> r = Success(21);
    auto doubled = r.Map([](int v) { return std::to_string(v * 2); });
    ASSERT_TRUE(doubled.IsSuccess());
    EXPECT_EQ(doubled.Value(), "42");
}

TEST(ResultTest, MapPassesThroughFailureAndCancellation) {
    Result<int> failed = Failure(make_error_code(Errc::TaskFailed), "x");
    Result<int> cancelled = Cancelled(CancelReason::Timeout);

    auto f = failed.Map([](int v) { return v + 1; });
    auto c = cancelled.Map([](int v) { return v + 1; });

    ASSERT_TRUE(f.IsFailure());
    EXPECT_EQ(f.Error().message, "x");
    ASSERT_TRUE(c.IsCancelled());
    EXPECT_EQ(c.Reason(), CancelReason::Timeout);
}

// ============================================================================
// Equality / Formatting
// ============================================================================

TEST(ResultTest, Equality) {
    Result<int> a = Success(1);
    Result<int> b = Success(1);
    Result<int> c = Success(2);
    Result<int> d = Cancelled(CancelReason::Timeout);
    Result<int> e = Cancelled(CancelReason::Explicit);

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_FALSE(a == d);
    EXPECT_FALSE(d == e);
}

TEST(ResultTest, ToString) {
    Result<int> ok = Success(1);
    Result<int> failed = Failure(make_error_code(Errc::TaskFailed), "bad input");
    Result<int> cancelled = Cancelled(CancelReason::Timeout);

    EXPECT_EQ(ok.ToString(), "Success");
    EXPECT_EQ(failed.ToString(), "Failure(Task failed: bad input)");
    EXPECT_EQ(cancelled.ToString(), "Cancelled(timeout)");
}

// ============================================================================
// Programming Faults
// ============================================================================

TEST(ResultDeathTest, ValueOfFailureAborts) {
    Result<int> r = Failure(make_error_code(Errc::TaskFailed));
    EXPECT_DEATH((void)r.Value(), "Value\\(\\) on a result that is not a success");
}

TEST(ResultDeathTest, ReasonOfSuccessAborts) {
    Result<int> r = Success(1);
    EXPECT_DEATH((void)r.Reason(), "not cancelled");
}
