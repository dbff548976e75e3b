// ============================================================================
// fanout/pool/fan_out.hpp - Fan-Out / Fan-In Batch Coordinator
// ============================================================================
//
// FanOut<T> dispatches a batch of tasks onto a WorkerPool under one
// cancellation token and gathers exactly one Result<T> per task, ordered by
// submission index regardless of completion order.
//
// USAGE:
// ------
//   std::vector<Task<Page>> tasks = ...;
//
//   // Blocking, with a timeout for the whole batch
//   auto results = RunBatch(pool, std::move(tasks), 500ms);
//
//   // With a caller token, fail-fast and a progress callback
//   FanOut<Page> batch(pool, source.GetToken(), {.fail_fast = true});
//   batch.OnResult([](size_t i, const Result<Page>& r) { ... });
//   auto results = batch.Run(std::move(tasks));
//   BatchReport report = batch.Report();
//
// CANCELLATION:
// -------------
// Once the batch token fires:
//   - no further task is dispatched
//   - every task that has not started is settled as Cancelled(reason)
//     immediately, without waiting for a worker to reach it
//   - running bodies observe the cancelled token and are allowed to finish;
//     their own results are kept
// Run() returns once all N results are recorded.
//
// Each item is claimed exactly once, either by the worker that starts it
// (Pending -> Dispatched) or by the cancellation sweep (Pending -> Done).
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "fanout/core/aggregator.hpp"
#include "fanout/core/cancellation.hpp"
#include "fanout/core/log.hpp"
#include "fanout/core/result.hpp"
#include "fanout/core/task.hpp"
#include "fanout/pool/work_item.hpp"
#include "fanout/pool/worker_pool.hpp"

namespace fanout {

struct BatchOptions {
    // Cancel the rest of the batch after the first Failure
    bool fail_fast = false;
};

namespace detail {

enum class ItemState : uint8_t {
    Pending,
    Dispatched,
    Done,
};

// Shared by the coordinator, the queued items and the cancellation sweep
template <typename T>
class BatchState {
   public:
    BatchState(size_t n, const CancellationToken& token, BatchOptions options)
        : aggregator(n), states_(n), source_(token), options_(options) {}

    ResultAggregator<T> aggregator;

    CancellationToken Token() const { return source_.GetToken(); }

    // Worker side: true if the caller now owns item `index`
    bool Claim(size_t index) {
        auto expected = ItemState::Pending;
        return states_[index].compare_exchange_strong(expected, ItemState::Dispatched, std::memory_order_acq_rel);
    }

    void Complete(size_t index, Result<T> result) {
        states_[index].store(ItemState::Done, std::memory_order_release);
        bool failed = result.IsFailure();
        aggregator.Record(index, std::move(result));
        if (failed && options_.fail_fast) {
            source_.Cancel(CancelReason::Explicit);
        }
    }

    // Settle `index` without running it; no-op if someone else owns it
    bool Abandon(size_t index, Result<T> result) {
        auto expected = ItemState::Pending;
        if (!states_[index].compare_exchange_strong(expected, ItemState::Done, std::memory_order_acq_rel)) {
            return false;
        }
        aggregator.Record(index, std::move(result));
        return true;
    }

    // Settle a claimed item whose Run() never reached Complete()
    void AbandonClaimed(size_t index, Result<T> result) {
        auto expected = ItemState::Dispatched;
        if (states_[index].compare_exchange_strong(expected, ItemState::Done, std::memory_order_acq_rel)) {
            aggregator.Record(index, std::move(result));
        }
    }

    // Cancellation sweep over every item not yet started
    size_t CancelPending(CancelReason reason) {
        size_t swept = 0;
        for (size_t i = 0; i < states_.size(); ++i) {
            if (Abandon(i, Cancelled(reason))) {
                ++swept;
            }
        }
        return swept;
    }

    CancelReason Reason() const { return source_.Reason(); }

   private:
    std::vector<std::atomic<ItemState>> states_;

    // Child of the caller's token; fail-fast cancels it
    CancellationSource source_;
    BatchOptions options_;
};

// ============================================================================
// BatchWorkItem<T> - records into a batch slot
// ============================================================================
template <typename T>
class BatchWorkItem final : public WorkItem {
   public:
    BatchWorkItem(std::shared_ptr<BatchState<T>> batch, size_t index, Task<T> task, CancellationSource source)
        : batch_(std::move(batch)),
          index_(index),
          task_(std::move(task)),
          source_(std::move(source)),
          token_(source_.GetToken()) {}

    const CancellationToken& Token() const noexcept override { return token_; }

    std::string_view Key() const noexcept override { return task_.Key(); }

    size_t Index() const noexcept override { return index_; }

    void Run(size_t worker_index) override {
        if (!batch_->Claim(index_)) {
            return;  // Already settled by the cancellation sweep
        }
        if (token_.IsCancelled()) {
            // Cancelled after the pool's pre-dispatch check
            batch_->Complete(index_, Cancelled(token_.Reason()));
            return;
        }
        TaskContext ctx{token_, index_, worker_index, task_.Key()};
        batch_->Complete(index_, task_.Execute(ctx));
    }

    void Cancel(CancelReason reason) override { batch_->Abandon(index_, Cancelled(reason)); }

    void Reject(Error error) override {
        if (!batch_->Abandon(index_, Failure(error, "work item rejected"))) {
            batch_->AbandonClaimed(index_, Failure(error, "work item failed to settle"));
        }
    }

   private:
    std::shared_ptr<BatchState<T>> batch_;
    size_t index_;
    Task<T> task_;
    CancellationSource source_;
    CancellationToken token_;
};

}  // namespace detail

// ============================================================================
// FanOut<T>
// ============================================================================
template <typename T>
class FanOut {
   public:
    using ResultCallback = std::function<void(size_t index, const Result<T>& result)>;

    explicit FanOut(WorkerPool& pool, CancellationToken token = CancellationToken::None(), BatchOptions options = {})
        : pool_(pool), token_(std::move(token)), options_(options) {}

    FanOut(const FanOut&) = delete;
    FanOut& operator=(const FanOut&) = delete;

    // Invoked once per result in completion order, never concurrently.
    // An exception thrown by the callback is logged and dropped.
    FanOut& OnResult(ResultCallback callback) {
        on_result_ = std::move(callback);
        return *this;
    }

    // Blocks until every task has a result. Must not be called from a
    // worker of `pool` (it would wait on work it may be blocking).
    std::vector<Result<T>> Run(std::vector<Task<T>> tasks) {
        FANOUT_CHECK(!pool_.InWorkerThread(), "FanOut::Run() from a worker of its own pool");

        const size_t n = tasks.size();
        auto batch = std::make_shared<detail::BatchState<T>>(n, token_, options_);
        last_ = batch;
        if (n == 0) {
            return {};
        }

        if (on_result_) {
            batch->aggregator.SetObserver(on_result_);
        }

        CancellationToken batch_token = batch->Token();
        CancellationCallbackGuard sweep(batch_token, [batch] {
            size_t swept = batch->CancelPending(batch->Reason());
            GetLogger()->debug("batch cancelled ({}): {} pending item(s) settled", ToString(batch->Reason()),
                               swept);
        });

        for (size_t i = 0; i < n; ++i) {
            if (batch_token.IsCancelled()) {
                break;  // The sweep settles everything not yet dispatched
            }
            // Post() settles the item itself when it does not return Ok
            pool_.Post(std::make_unique<detail::BatchWorkItem<T>>(batch, i, std::move(tasks[i]),
                                                                  pool_.MakeItemSource(batch_token)));
        }

        batch->aggregator.Wait();
        return batch->aggregator.Collect();
    }

    // Summary of the most recent Run(); Running before the first one
    BatchReport Report() const {
        if (!last_) {
            return BatchReport{};
        }
        return last_->aggregator.Report();
    }

   private:
    WorkerPool& pool_;
    CancellationToken token_;
    BatchOptions options_;
    ResultCallback on_result_;
    std::shared_ptr<detail::BatchState<T>> last_;
};

// ============================================================================
// RunBatch - one-shot helpers
// ============================================================================

template <typename T>
std::vector<Result<T>> RunBatch(WorkerPool& pool, std::vector<Task<T>> tasks,
                                const CancellationToken& token = CancellationToken::None(),
                                BatchOptions options = {}) {
    return FanOut<T>(pool, token, options).Run(std::move(tasks));
}

// The timeout starts when RunBatch() is called; items still queued when it
// elapses are Cancelled(Timeout).
template <typename T, typename Rep, typename Period>
std::vector<Result<T>> RunBatch(WorkerPool& pool, std::vector<Task<T>> tasks,
                                std::chrono::duration<Rep, Period> timeout, BatchOptions options = {}) {
    CancellationSource source(std::chrono::duration_cast<CancellationSource::Clock::duration>(timeout));
    return RunBatch(pool, std::move(tasks), source.GetToken(), options);
}

}  // namespace fanout
