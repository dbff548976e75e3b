// ============================================================================
// fanout/core/defer.hpp - Scoped Cleanup
// ============================================================================
//
// Defer runs a callable when it leaves scope, on every exit path including
// stack unwinding. Workers wrap each item run in one so the active and
// executed counters are updated however Run() exits.
//
// USAGE:
// ------
//   void RunItem(WorkItem& item, size_t worker_index) {
//       active_.fetch_add(1);
//       Defer done([&] { active_.fetch_sub(1); });
//       item.Run(worker_index);
//   }
//
// ============================================================================

#pragma once

#include <functional>
#include <utility>

namespace fanout {

class Defer {
   public:
    template <typename F>
    explicit Defer(F&& func) : cleanup_(std::forward<F>(func)) {}

    ~Defer() {
        if (cleanup_) {
            cleanup_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : cleanup_(std::exchange(other.cleanup_, nullptr)) {}
    Defer& operator=(Defer&&) = delete;

    // Disarm: the cleanup will not run
    void Dismiss() noexcept { cleanup_ = nullptr; }

    // Run the cleanup now instead of at scope exit
    void Fire() {
        if (auto fn = std::exchange(cleanup_, nullptr)) {
            fn();
        }
    }

    bool Armed() const noexcept { return static_cast<bool>(cleanup_); }

   private:
    std::function<void()> cleanup_;
};

#define FANOUT_DEFER_CONCAT_IMPL(a, b) a##b
#define FANOUT_DEFER_CONCAT(a, b) FANOUT_DEFER_CONCAT_IMPL(a, b)

// FANOUT_DEFER([&] { cleanup; }) declares an anonymous Defer for this scope.
#define FANOUT_DEFER(lambda) ::fanout::Defer FANOUT_DEFER_CONCAT(fanout_defer_, __LINE__){lambda}

}  // namespace fanout
