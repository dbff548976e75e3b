// ============================================================================
// fanout/core/aggregator.hpp - Index-Preserving Result Collection
// ============================================================================
//
// ResultAggregator<T> collects the results of a batch as they arrive (in
// completion order) into slots indexed by submission order.
//
// INVARIANTS:
// -----------
// - Every index in [0, n) is recorded exactly once. Recording an index twice,
//   or an index out of range, is a programming fault (FANOUT_CHECK aborts).
// - Collect() is only valid once IsComplete(); calling it earlier is also a
//   programming fault.
//
// CONCURRENCY:
// ------------
// Slots are claimed with a per-slot atomic flag, so workers writing disjoint
// indices never contend on the slot storage. A mutex serializes the
// completion-order log, the observer and the completion counter, which
// is what IsComplete()/Wait() synchronize on.
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "fanout/core/check.hpp"
#include "fanout/core/log.hpp"
#include "fanout/core/result.hpp"

namespace fanout {

// ============================================================================
// Batch Summary
// ============================================================================
enum class BatchStatus : uint8_t {
    Running,
    AllCompleted,
    PartiallyCancelled,
    TimedOut,
};

inline std::string_view ToString(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::Running:
            return "running";
        case BatchStatus::AllCompleted:
            return "all-completed";
        case BatchStatus::PartiallyCancelled:
            return "partially-cancelled";
        case BatchStatus::TimedOut:
            return "timed-out";
    }
    return "unknown";
}

struct BatchReport {
    BatchStatus status = BatchStatus::Running;
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;

    // Subset of `failed` whose body threw
    size_t recovered = 0;
    size_t cancelled = 0;

    size_t Finished() const noexcept { return succeeded + failed + cancelled; }
};

namespace detail {

class ReportBuilder {
   public:
    explicit ReportBuilder(size_t total) { report_.total = total; }

    template <typename T>
    void Add(const Result<T>& result) {
        switch (result.Kind()) {
            case ResultKind::Success:
                ++report_.succeeded;
                break;
            case ResultKind::Failure:
                ++report_.failed;
                if (result.Error().recovered) {
                    ++report_.recovered;
                }
                break;
            case ResultKind::Cancelled:
                ++report_.cancelled;
                timed_out_ = timed_out_ || result.Reason() == CancelReason::Timeout;
                break;
        }
    }

    BatchReport Finish(bool complete) {
        if (!complete) {
            report_.status = BatchStatus::Running;
        } else if (report_.cancelled == 0) {
            report_.status = BatchStatus::AllCompleted;
        } else {
            report_.status = timed_out_ ? BatchStatus::TimedOut : BatchStatus::PartiallyCancelled;
        }
        return report_;
    }

   private:
    BatchReport report_;
    bool timed_out_ = false;
};

}  // namespace detail

// Summary of a finished batch's ordered results
template <typename T>
BatchReport Summarize(const std::vector<Result<T>>& results) {
    detail::ReportBuilder builder(results.size());
    for (const auto& result : results) {
        builder.Add(result);
    }
    return builder.Finish(true);
}

// ============================================================================
// ResultAggregator<T>
// ============================================================================
template <typename T>
class ResultAggregator {
   public:
    // Called once per Record(), in completion order, never concurrently.
    // It must not call back into the aggregator. An exception it throws is
    // logged and dropped; the record still counts.
    using Observer = std::function<void(size_t index, const Result<T>& result)>;

    explicit ResultAggregator(size_t n) : slots_(n) { order_.reserve(n); }

    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    // Install before the first Record()
    void SetObserver(Observer observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

    void Record(size_t index, Result<T> result) {
        FANOUT_CHECK(index < slots_.size(), "aggregator index out of range");

        Slot& slot = slots_[index];
        bool expected = false;
        FANOUT_CHECK(slot.claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel),
                     "aggregator index recorded twice");
        slot.result.emplace(std::move(result));

        bool complete = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            order_.push_back(index);
            if (observer_) {
                NotifyObserver(index, *slot.result);
            }
            // Counter is bumped after the slot is written: observing the
            // final count makes every slot visible.
            complete = recorded_.fetch_add(1, std::memory_order_acq_rel) + 1 == slots_.size();
        }
        if (complete) {
            complete_cv_.notify_all();
        }
    }

    size_t Size() const noexcept { return slots_.size(); }

    size_t Recorded() const noexcept { return recorded_.load(std::memory_order_acquire); }

    bool IsComplete() const noexcept { return Recorded() == slots_.size(); }

    bool IsRecorded(size_t index) const {
        FANOUT_CHECK(index < slots_.size(), "aggregator index out of range");
        return slots_[index].claimed.load(std::memory_order_acquire);
    }

    void Wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        complete_cv_.wait(lock, [this] { return IsComplete(); });
    }

    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return complete_cv_.wait_for(lock, timeout, [this] { return IsComplete(); });
    }

    // Ordered results; index i belongs to the i-th submitted item
    std::vector<Result<T>> Collect() const {
        FANOUT_CHECK(IsComplete(), "Collect() before every index was recorded");
        std::vector<Result<T>> results;
        results.reserve(slots_.size());
        for (const auto& slot : slots_) {
            results.push_back(*slot.result);
        }
        return results;
    }

    // Indices in the order their results arrived
    std::vector<size_t> CompletionOrder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    // Summary of what has been recorded so far
    BatchReport Report() const {
        std::lock_guard<std::mutex> lock(mutex_);

        detail::ReportBuilder builder(slots_.size());
        for (size_t index : order_) {
            builder.Add(*slots_[index].result);
        }
        return builder.Finish(order_.size() == slots_.size());
    }

   private:
    void NotifyObserver(size_t index, const Result<T>& result) noexcept {
        try {
            observer_(index, result);
        } catch (const std::exception& e) {
            GetLogger()->error("result observer threw for index {}: {}", index, e.what());
        } catch (...) {
            GetLogger()->error("result observer threw for index {}: non-standard exception", index);
        }
    }

    struct Slot {
        std::atomic<bool> claimed{false};
        std::optional<Result<T>> result;
    };

    std::vector<Slot> slots_;
    std::atomic<size_t> recorded_{0};

    mutable std::mutex mutex_;
    mutable std::condition_variable complete_cv_;
    std::vector<size_t> order_;
    Observer observer_;
};

}  // namespace fanout
