// ============================================================================
// fanout/core/cancellation.cpp - Cancellation Implementation
// ============================================================================

#include "fanout/core/cancellation.hpp"

#include <string>
#include <thread>

#include "fanout/core/check.hpp"
#include "fanout/core/deadline_timer.hpp"

namespace fanout {

std::string_view ToString(CancelReason reason) noexcept {
    switch (reason) {
        case CancelReason::None:
            return "none";
        case CancelReason::Timeout:
            return "timeout";
        case CancelReason::Explicit:
            return "explicit";
    }
    return "unknown";
}

OperationCancelled::OperationCancelled(CancelReason reason)
    : std::runtime_error("operation cancelled (" + std::string(ToString(reason)) + ")"), reason_(reason) {}

// ============================================================================
// CancellationState
// ============================================================================

CancellationState::~CancellationState() {
    for (auto& link : parents_) {
        link.state->UnregisterCallback(link.handle);
    }
}

bool CancellationState::Cancel(CancelReason reason) {
    if (reason == CancelReason::None) {
        reason = CancelReason::Explicit;
    }

    std::map<size_t, std::function<void()>> callbacks_to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return false;  // First reason wins
        }
        // Reason is published before the flag so a reader that observes
        // IsCancelled() also observes the reason.
        reason_.store(reason, std::memory_order_release);
        cancelled_.store(true, std::memory_order_release);
        callbacks_to_call = std::move(callbacks_);
        callbacks_.clear();
    }
    cancelled_cv_.notify_all();

    // Invoke outside the lock: callbacks may cancel children, which take
    // their own locks, or register new callbacks.
    for (auto& [handle, callback] : callbacks_to_call) {
        callback();
    }
    return true;
}

size_t CancellationState::RegisterCallback(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_relaxed)) {
            size_t handle = next_handle_++;
            callbacks_.emplace(handle, std::move(callback));
            return handle;
        }
    }
    // Already cancelled: invoke outside the lock
    callback();
    return 0;
}

void CancellationState::UnregisterCallback(size_t handle) {
    if (handle == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(handle);
}

void CancellationState::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cancelled_cv_.wait(lock, [this] { return cancelled_.load(std::memory_order_relaxed); });
}

bool CancellationState::WaitUntil(Clock::time_point when) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cancelled_cv_.wait_until(lock, when, [this] { return cancelled_.load(std::memory_order_relaxed); });
}

void CancellationState::LinkParent(std::shared_ptr<CancellationState> parent) {
    if (!parent) return;

    // Inherit the earliest ancestor deadline; ArmDeadline() may tighten it
    if (auto inherited = parent->Deadline(); inherited && (!deadline_ || *inherited < *deadline_)) {
        deadline_ = inherited;
    }

    // The callback holds only a weak reference: a parent must never keep a
    // child alive. The raw parent pointer is valid for the duration of the
    // callback because only the parent invokes it.
    std::weak_ptr<CancellationState> weak_child = weak_from_this();
    CancellationState* raw_parent = parent.get();
    size_t handle = parent->RegisterCallback([weak_child, raw_parent] {
        if (auto child = weak_child.lock()) {
            child->Cancel(raw_parent->Reason());
        }
    });
    parents_.push_back({std::move(parent), handle});
}

void CancellationState::ArmDeadline(Clock::time_point when) {
    if (deadline_ && *deadline_ <= when) {
        return;  // An ancestor's earlier deadline already covers this one
    }
    deadline_ = when;

    if (when <= Clock::now()) {
        Cancel(CancelReason::Timeout);
        return;
    }
    DeadlineTimer::Instance().Schedule(when, weak_from_this());
}

// ============================================================================
// CancellationToken
// ============================================================================

std::optional<CancellationToken::Clock::duration> CancellationToken::RemainingTime() const {
    auto deadline = Deadline();
    if (!deadline) {
        return std::nullopt;
    }
    auto now = Clock::now();
    if (*deadline <= now) {
        return Clock::duration::zero();
    }
    return *deadline - now;
}

void CancellationToken::ThrowIfCancelled() const {
    if (IsCancelled()) {
        throw OperationCancelled(Reason());
    }
}

void CancellationToken::Wait() const {
    FANOUT_CHECK(state_ != nullptr, "Wait() on a token that can never be cancelled");
    state_->Wait();
}

bool CancellationToken::WaitUntil(Clock::time_point when) const {
    if (!state_) {
        std::this_thread::sleep_until(when);
        return false;
    }
    return state_->WaitUntil(when);
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent) : CancellationSource() {
    state_->LinkParent(parent.state_);
}

CancellationSource::CancellationSource(Clock::duration timeout) : CancellationSource() {
    state_->ArmDeadline(Clock::now() + timeout);
}

CancellationSource::CancellationSource(const CancellationToken& parent, Clock::duration timeout)
    : CancellationSource() {
    auto deadline = Clock::now() + timeout;
    state_->LinkParent(parent.state_);
    if (!state_->IsCancelled()) {
        state_->ArmDeadline(deadline);
    }
}

CancellationSource CancellationSource::WithDeadline(const CancellationToken& parent, Clock::time_point deadline) {
    CancellationSource source;
    source.state_->LinkParent(parent.state_);
    if (!source.state_->IsCancelled()) {
        source.state_->ArmDeadline(deadline);
    }
    return source;
}

CancellationSource CancellationSource::Linked(const std::vector<CancellationToken>& parents) {
    CancellationSource source;
    for (const auto& parent : parents) {
        source.state_->LinkParent(parent.state_);
    }
    return source;
}

}  // namespace fanout
