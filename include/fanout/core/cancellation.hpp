// ============================================================================
// fanout/core/cancellation.hpp - Cancellation Tokens
// ============================================================================
//
// CancellationToken provides cooperative cancellation for task bodies.
// A CancellationSource owns the shared state and is the only party that can
// cancel it; tokens are cheap read-only views handed to every worker that
// runs a task of the batch.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. COOPERATIVE: Task bodies must check the token - not preemptive
// 2. MONOTONIC: Once cancelled, a token never becomes un-cancelled, and the
//    first recorded reason sticks
// 3. HIERARCHICAL: A source may be created under one or more parent tokens.
//    Cancelling any parent cancels the child with that parent's reason; a
//    child never cancels its parent
// 4. DEADLINES: A source created with a timeout cancels itself with
//    CancelReason::Timeout once the deadline passes
//
// USAGE:
// ------
//   CancellationSource batch(100ms);          // timeout-bound
//   CancellationSource item(batch.GetToken()); // child of the batch
//
//   auto token = item.GetToken();
//   while (!token.IsCancelled()) {
//       ProcessNextChunk();
//   }
//   if (token.Reason() == CancelReason::Timeout) { ... }
//
// BLOCKING:
// ---------
//   token.Wait();                 // until cancelled
//   token.WaitFor(10ms);          // true if cancelled within 10ms
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace fanout {

// ============================================================================
// CancelReason
// ============================================================================
enum class CancelReason : uint8_t {
    None = 0,
    Timeout,
    Explicit,
};

std::string_view ToString(CancelReason reason) noexcept;

// Thrown by CancellationToken::ThrowIfCancelled(). Workers translate it into
// a Cancelled result rather than a failure.
class OperationCancelled : public std::runtime_error {
   public:
    explicit OperationCancelled(CancelReason reason);

    CancelReason Reason() const noexcept { return reason_; }

   private:
    CancelReason reason_;
};

// ============================================================================
// CancellationState - Shared state between source and tokens
// ============================================================================
class CancellationState : public std::enable_shared_from_this<CancellationState> {
   public:
    using Clock = std::chrono::steady_clock;

    CancellationState() = default;
    ~CancellationState();

    // Non-copyable, non-movable
    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    CancelReason Reason() const noexcept {
        if (!IsCancelled()) return CancelReason::None;
        return reason_.load(std::memory_order_acquire);
    }

    std::optional<Clock::time_point> Deadline() const noexcept { return deadline_; }

    // Returns true if this call performed the cancellation, false if the
    // state was already cancelled.
    bool Cancel(CancelReason reason);

    // Register a callback to run once on cancellation. If the state is
    // already cancelled the callback runs inline and 0 is returned.
    size_t RegisterCallback(std::function<void()> callback);

    void UnregisterCallback(size_t handle);

    void Wait();
    bool WaitUntil(Clock::time_point when);

    // Wiring used by CancellationSource at construction time
    void LinkParent(std::shared_ptr<CancellationState> parent);
    void ArmDeadline(Clock::time_point when);

   private:
    std::atomic<bool> cancelled_{false};
    std::atomic<CancelReason> reason_{CancelReason::None};
    std::optional<Clock::time_point> deadline_;

    mutable std::mutex mutex_;
    std::condition_variable cancelled_cv_;
    // Keyed by handle: registration order, and removal that does not shift
    // the other entries
    std::map<size_t, std::function<void()>> callbacks_;
    size_t next_handle_{1};

    // Parents are kept alive while this child is linked to them
    struct ParentLink {
        std::shared_ptr<CancellationState> state;
        size_t handle;
    };
    std::vector<ParentLink> parents_;
};

// ============================================================================
// CancellationToken - Read-only view of cancellation state
// ============================================================================
class CancellationToken {
   public:
    using Clock = CancellationState::Clock;

    // Default token that is never cancelled
    CancellationToken() = default;

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    // CancelReason::None until cancelled
    CancelReason Reason() const noexcept { return state_ ? state_->Reason() : CancelReason::None; }

    // true while NOT cancelled
    explicit operator bool() const noexcept { return !IsCancelled(); }

    // Effective deadline: the earliest of its own and its ancestors' 
    std::optional<Clock::time_point> Deadline() const noexcept {
        return state_ ? state_->Deadline() : std::nullopt;
    }

    // Time left until the deadline (zero once passed), nullopt without one
    std::optional<Clock::duration> RemainingTime() const;

    // Throws OperationCancelled if cancellation has been requested
    void ThrowIfCancelled() const;

    // Block until cancelled. Calling this on a token without state is a
    // programming fault: it could never return.
    void Wait() const;

    // Block until cancelled or the wait expires; true if cancelled
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        return WaitUntil(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
    }

    bool WaitUntil(Clock::time_point when) const;

    // Register callback for cancellation notification
    size_t OnCancel(std::function<void()> callback) const {
        if (state_) {
            return state_->RegisterCallback(std::move(callback));
        }
        return 0;
    }

    // Unregister a previously registered callback
    void Unregister(size_t handle) const {
        if (state_) {
            state_->UnregisterCallback(handle);
        }
    }

    // Check if this is a valid token (has associated state)
    bool IsValid() const noexcept { return state_ != nullptr; }

    // Create a "never cancelled" token
    [[nodiscard]] static CancellationToken None() { return CancellationToken{}; }

   private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// CancellationSource - Creates and controls tokens
// ============================================================================
class CancellationSource {
   public:
    using Clock = CancellationState::Clock;

    // Root source without a deadline
    CancellationSource();

    // Child of `parent`; cancelled whenever the parent is
    explicit CancellationSource(const CancellationToken& parent);

    // Root source that times out after `timeout`
    explicit CancellationSource(Clock::duration timeout);

    // Child of `parent` that also times out after `timeout`
    CancellationSource(const CancellationToken& parent, Clock::duration timeout);

    // Child of `parent` with an absolute deadline
    [[nodiscard]] static CancellationSource WithDeadline(const CancellationToken& parent, Clock::time_point deadline);

    // Child of every token in `parents`: cancelled by whichever goes first.
    // Tokens without state are ignored.
    [[nodiscard]] static CancellationSource Linked(const std::vector<CancellationToken>& parents);

    // Non-copyable but movable
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) = default;
    CancellationSource& operator=(CancellationSource&&) = default;

    [[nodiscard]] CancellationToken GetToken() const { return CancellationToken(state_); }

    // Idempotent: the first call records the reason
    void Cancel(CancelReason reason = CancelReason::Explicit) {
        if (state_) {
            state_->Cancel(reason);
        }
    }

    bool IsCancelled() const noexcept { return state_ && state_->IsCancelled(); }

    CancelReason Reason() const noexcept { return state_ ? state_->Reason() : CancelReason::None; }

   private:
    std::shared_ptr<CancellationState> state_;
};

// ============================================================================
// RAII guard for callback registration
// ============================================================================
class CancellationCallbackGuard {
   public:
    CancellationCallbackGuard(CancellationToken token, std::function<void()> callback)
        : token_(std::move(token)), handle_(token_.OnCancel(std::move(callback))) {}

    ~CancellationCallbackGuard() { token_.Unregister(handle_); }

    CancellationCallbackGuard(const CancellationCallbackGuard&) = delete;
    CancellationCallbackGuard& operator=(const CancellationCallbackGuard&) = delete;

   private:
    CancellationToken token_;
    size_t handle_;
};

}  // namespace fanout
