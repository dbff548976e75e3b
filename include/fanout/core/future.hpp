// ============================================================================
// fanout/core/future.hpp - One-Shot Result Handles
// ============================================================================
//
// Promise<T> / Future<T> is the hand-off between a worker and whoever
// submitted the task. The worker fulfils the promise exactly once; any number
// of Future copies can block on it or register a completion callback.
//
// Unlike std::future, a fanout Future is copyable, never carries an
// exception (WorkerPool results are Result<T> values), and supports
// OnReady() callbacks, which the fan-out coordinator uses to stream results
// in completion order.
//
// USAGE:
// ------
//   auto future = pool.Submit(MakeTask([] { return 42; }));
//   future.OnReady([](const Result<int>& r) { ... });
//   if (future.WaitFor(100ms)) {
//       Result<int> r = future.Get();
//   }
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "fanout/core/check.hpp"

namespace fanout {

namespace detail {

// ============================================================================
// FutureState - Shared state between Promise and Futures
// ============================================================================
template <typename T>
class FutureState {
   public:
    // Returns false if a value was already stored
    bool SetValue(T value) {
        std::vector<std::function<void(const T&)>> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_) {
                return false;
            }
            value_.emplace(std::move(value));
            callbacks = std::move(callbacks_);
            callbacks_.clear();
        }
        ready_cv_.notify_all();

        // The value is immutable from here on, so callbacks can read it
        // without the lock.
        for (auto& callback : callbacks) {
            callback(*value_);
        }
        return true;
    }

    bool IsReady() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_.has_value();
    }

    const T& Wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_cv_.wait(lock, [this] { return value_.has_value(); });
        return *value_;
    }

    bool WaitUntil(std::chrono::steady_clock::time_point when) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return ready_cv_.wait_until(lock, when, [this] { return value_.has_value(); });
    }

    void OnReady(std::function<void(const T&)> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!value_) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        // Already ready: invoke outside the lock
        callback(*value_);
    }

   private:
    mutable std::mutex mutex_;
    mutable std::condition_variable ready_cv_;
    std::optional<T> value_;
    std::vector<std::function<void(const T&)>> callbacks_;
};

}  // namespace detail

template <typename T>
class Promise;

// ============================================================================
// Future<T>
// ============================================================================
template <typename T>
class Future {
   public:
    // An invalid future; only assignment makes it usable
    Future() = default;

    bool IsValid() const noexcept { return state_ != nullptr; }

    bool IsReady() const {
        FANOUT_CHECK(IsValid(), "IsReady() on an invalid future");
        return state_->IsReady();
    }

    void Wait() const {
        FANOUT_CHECK(IsValid(), "Wait() on an invalid future");
        state_->Wait();
    }

    // true if the value became available within `timeout`
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        FANOUT_CHECK(IsValid(), "WaitFor() on an invalid future");
        return state_->WaitUntil(std::chrono::steady_clock::now() +
                                 std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

    // Blocks until ready
    const T& Get() const {
        FANOUT_CHECK(IsValid(), "Get() on an invalid future");
        return state_->Wait();
    }

    // Runs `callback` once the value is set: inline if it already is,
    // otherwise on the thread that fulfils the promise.
    void OnReady(std::function<void(const T&)> callback) const {
        FANOUT_CHECK(IsValid(), "OnReady() on an invalid future");
        state_->OnReady(std::move(callback));
    }

    // A future that is already fulfilled
    [[nodiscard]] static Future Ready(T value) {
        auto state = std::make_shared<detail::FutureState<T>>();
        state->SetValue(std::move(value));
        return Future(std::move(state));
    }

   private:
    friend class Promise<T>;

    explicit Future(std::shared_ptr<detail::FutureState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::FutureState<T>> state_;
};

// ============================================================================
// Promise<T>
// ============================================================================
template <typename T>
class Promise {
   public:
    Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

    Promise(const Promise&) = default;
    Promise& operator=(const Promise&) = default;
    Promise(Promise&&) noexcept = default;
    Promise& operator=(Promise&&) noexcept = default;

    [[nodiscard]] Future<T> GetFuture() const { return Future<T>(state_); }

    // Fulfilling a promise twice is a programming fault
    void SetValue(T value) {
        bool first = state_->SetValue(std::move(value));
        FANOUT_CHECK(first, "promise fulfilled twice");
    }

    // For racing producers: the first caller wins, later calls return false
    bool TrySetValue(T value) { return state_->SetValue(std::move(value)); }

    bool IsFulfilled() const { return state_->IsReady(); }

   private:
    std::shared_ptr<detail::FutureState<T>> state_;
};

}  // namespace fanout
