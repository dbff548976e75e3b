// ============================================================================
// fanout/core/result.hpp - Task Outcome Type
// ============================================================================
//
// Result<T> is the terminal outcome of one task. It is a discriminated union
// with exactly three states:
//
//   Success(T)            - the body ran and produced a value
//   Failure(TaskError)    - the body ran and failed, or threw (recovered)
//   Cancelled(reason)     - the body never ran, or gave up on cancellation
//
// "Didn't run" and "ran and failed" are deliberately distinct so callers can
// retry only what was never attempted.
//
// USAGE:
// ------
//   Result<int> Parse(const TaskContext& ctx) {
//       if (bad_input) return Failure(Errc::TaskFailed, "bad input");
//       return Success(42);
//   }
//
//   auto r = future.Get();
//   if (r.IsSuccess()) Use(r.Value());
//   else if (r.IsFailure()) Log(r.Error().message);
//
// Tasks without a value use Result<Unit> and return Success().
//
// ============================================================================

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "fanout/core/cancellation.hpp"
#include "fanout/core/check.hpp"
#include "fanout/core/error.hpp"

namespace fanout {

// ============================================================================
// TaskError - Why a task failed
// ============================================================================
struct TaskError {
    Error code = make_error_code(Errc::TaskFailed);
    std::string message;

    // Set when the body threw and the worker converted the exception
    bool recovered = false;

    std::string ToString() const {
        std::string text = code.message();
        if (!message.empty()) {
            text += ": " + message;
        }
        if (recovered) {
            text += " (recovered)";
        }
        return text;
    }
};

inline bool operator==(const TaskError& lhs, const TaskError& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message && lhs.recovered == rhs.recovered;
}

// Unit type for tasks that produce no value
struct Unit {
    friend bool operator==(Unit, Unit) noexcept { return true; }
};

enum class ResultKind : uint8_t {
    Success,
    Failure,
    Cancelled,
};

// ============================================================================
// Tag Types and Factories
// ============================================================================
// The tags let a task body write `return Success(v);` without naming T.

template <typename T>
struct SuccessTag {
    T value;
};

struct FailureTag {
    TaskError error;
};

struct CancelledTag {
    CancelReason reason;
};

template <typename T>
SuccessTag<std::decay_t<T>> Success(T&& value) {
    return SuccessTag<std::decay_t<T>>{std::forward<T>(value)};
}

inline SuccessTag<Unit> Success() {
    return SuccessTag<Unit>{Unit{}};
}

inline FailureTag Failure(TaskError error) {
    return FailureTag{std::move(error)};
}

inline FailureTag Failure(Error code, std::string message = {}) {
    return FailureTag{TaskError{code, std::move(message), false}};
}

inline CancelledTag Cancelled(CancelReason reason = CancelReason::Explicit) {
    return CancelledTag{reason == CancelReason::None ? CancelReason::Explicit : reason};
}

// ============================================================================
// Result<T>
// ============================================================================
template <typename T>
class Result {
    static_assert(!std::is_void_v<T>, "use Result<Unit> for tasks without a value");

   public:
    using value_type = T;

    template <typename U>
        requires std::is_constructible_v<T, U&&>
    Result(SuccessTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(FailureTag&& failure) : data_(std::in_place_index<1>, std::move(failure.error)) {}

    Result(CancelledTag cancelled) : data_(std::in_place_index<2>, cancelled.reason) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    // ========================================================================
    // Observers
    // ========================================================================

    ResultKind Kind() const noexcept { return static_cast<ResultKind>(data_.index()); }

    bool IsSuccess() const noexcept { return data_.index() == 0; }
    bool IsFailure() const noexcept { return data_.index() == 1; }
    bool IsCancelled() const noexcept { return data_.index() == 2; }

    explicit operator bool() const noexcept { return IsSuccess(); }

    // ========================================================================
    // Accessors - reading the wrong alternative is a programming fault
    // ========================================================================

    T& Value() & {
        FANOUT_CHECK(IsSuccess(), "Value() on a result that is not a success");
        return std::get<0>(data_);
    }
    const T& Value() const& {
        FANOUT_CHECK(IsSuccess(), "Value() on a result that is not a success");
        return std::get<0>(data_);
    }
    T&& Value() && {
        FANOUT_CHECK(IsSuccess(), "Value() on a result that is not a success");
        return std::get<0>(std::move(data_));
    }

    const TaskError& Error() const& {
        FANOUT_CHECK(IsFailure(), "Error() on a result that is not a failure");
        return std::get<1>(data_);
    }

    CancelReason Reason() const {
        FANOUT_CHECK(IsCancelled(), "Reason() on a result that was not cancelled");
        return std::get<2>(data_);
    }

    T ValueOr(T default_value) const& {
        if (IsSuccess()) return std::get<0>(data_);
        return default_value;
    }

    // Transform a success value; failures and cancellations pass through
    template <typename F>
    auto Map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>> {
        switch (Kind()) {
            case ResultKind::Success:
                return Success(func(std::get<0>(data_)));
            case ResultKind::Failure:
                return Failure(std::get<1>(data_));
            case ResultKind::Cancelled:
                break;
        }
        return Cancelled(std::get<2>(data_));
    }

    std::string ToString() const {
        switch (Kind()) {
            case ResultKind::Success:
                return "Success";
            case ResultKind::Failure:
                return "Failure(" + std::get<1>(data_).ToString() + ")";
            case ResultKind::Cancelled:
                break;
        }
        return "Cancelled(" + std::string(fanout::ToString(std::get<2>(data_))) + ")";
    }

   private:
    std::variant<T, TaskError, CancelReason> data_;
};

template <typename T>
bool operator==(const Result<T>& lhs, const Result<T>& rhs) {
    if (lhs.Kind() != rhs.Kind()) return false;
    switch (lhs.Kind()) {
        case ResultKind::Success:
            return lhs.Value() == rhs.Value();
        case ResultKind::Failure:
            return lhs.Error() == rhs.Error();
        case ResultKind::Cancelled:
            break;
    }
    return lhs.Reason() == rhs.Reason();
}

}  // namespace fanout
