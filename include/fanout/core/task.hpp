// ============================================================================
// fanout/core/task.hpp - Units of Work
// ============================================================================
//
// Task<T> is an immutable unit of work: an optional key used in logs and
// reports, plus a body `Result<T>(const TaskContext&)`. A task is executed at
// most once, by one worker, and always yields exactly one Result<T>.
//
// TASK CONTEXT:
// -------------
// The body receives everything it may rely on explicitly, by value, in a
// TaskContext: the cancellation token for its batch, its index in the batch
// and the worker running it. Per-task data belongs in the body's own
// captures, taken by value when the task is built:
//
//   for (size_t i = 0; i < urls.size(); ++i) {
//       tasks.push_back(MakeTask([url = urls[i]](const TaskContext& ctx) {
//           return Fetch(url, ctx.token);
//       }));
//   }
//
// ISOLATION:
// ----------
// Execute() never throws. A body that throws OperationCancelled produces
// Cancelled(reason); any other exception produces a Failure with
// Errc::TaskPanicked and `recovered = true`.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "fanout/core/cancellation.hpp"
#include "fanout/core/result.hpp"

namespace fanout {

// ============================================================================
// TaskContext - What a running body can see
// ============================================================================
struct TaskContext {
    CancellationToken token;

    // Position in the submitted batch (0 for single submissions)
    size_t index = 0;

    // Worker slot running the body, in [0, pool size)
    size_t worker_index = 0;

    std::string_view key;

    bool IsCancelled() const noexcept { return token.IsCancelled(); }
};

namespace detail {

using RecoveredOutcome = std::variant<FailureTag, CancelledTag>;

// Classify the in-flight exception. Must be called from a catch block.
RecoveredOutcome RecoverCurrentException(const TaskContext& ctx) noexcept;

}  // namespace detail

// ============================================================================
// Task<T>
// ============================================================================
template <typename T>
class Task {
   public:
    using value_type = T;
    using Body = std::function<Result<T>(const TaskContext&)>;

    explicit Task(Body body, std::string key = {}) : body_(std::move(body)), key_(std::move(key)) {}

    Task(const Task&) = default;
    Task(Task&&) noexcept = default;
    Task& operator=(const Task&) = default;
    Task& operator=(Task&&) noexcept = default;

    const std::string& Key() const noexcept { return key_; }

    bool IsValid() const noexcept { return static_cast<bool>(body_); }

    // Run the body with exception isolation
    Result<T> Execute(const TaskContext& ctx) const noexcept {
        if (!body_) {
            return Failure(make_error_code(Errc::InvalidArgument), "task has no body");
        }
        try {
            return body_(ctx);
        } catch (...) {
            return std::visit([](auto&& tag) -> Result<T> { return std::move(tag); },
                              detail::RecoverCurrentException(ctx));
        }
    }

   private:
    Body body_;
    std::string key_;
};

// ============================================================================
// MakeTask - Build a Task<T> from any callable
// ============================================================================
// Accepted shapes:
//   Result<T>(const TaskContext&)    T(const TaskContext&)
//   Result<T>()                      T()
// A plain T return is wrapped in Success. `void` bodies become Task<Unit>.
// Bodies that mix Success/Failure returns must spell out `-> Result<T>`.

namespace detail {

template <typename R>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<Result<T>> : std::true_type {};

template <typename T>
struct IsResult<SuccessTag<T>> : std::true_type {};

template <typename F>
decltype(auto) InvokeBody(F& func, const TaskContext& ctx) {
    if constexpr (std::is_invocable_v<F&, const TaskContext&>) {
        return std::invoke(func, ctx);
    } else {
        return std::invoke(func);
    }
}

template <typename F>
using BodyReturn = std::decay_t<decltype(InvokeBody(std::declval<F&>(), std::declval<const TaskContext&>()))>;

template <typename R>
struct TaskValue {
    using type = R;
};

template <typename T>
struct TaskValue<Result<T>> {
    using type = T;
};

template <typename T>
struct TaskValue<SuccessTag<T>> {
    using type = T;
};

template <>
struct TaskValue<void> {
    using type = Unit;
};

}  // namespace detail

template <typename F>
auto MakeTask(F&& func, std::string key = {}) {
    using Fn = std::decay_t<F>;
    using R = detail::BodyReturn<Fn>;
    using T = typename detail::TaskValue<R>::type;

    return Task<T>(
        [fn = Fn(std::forward<F>(func))](const TaskContext& ctx) mutable -> Result<T> {
            if constexpr (std::is_void_v<R>) {
                detail::InvokeBody(fn, ctx);
                return Success();
            } else if constexpr (detail::IsResult<R>::value) {
                return detail::InvokeBody(fn, ctx);
            } else {
                return Success(detail::InvokeBody(fn, ctx));
            }
        },
        std::move(key));
}

}  // namespace fanout
