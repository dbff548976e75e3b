// ============================================================================
// fanout/pool/work_item.hpp - Type-Erased Unit of Queued Work
// ============================================================================
//
// WorkItem is what actually sits in the pool's queue. It pairs a task with
// where its result goes (a promise, an aggregator slot) and with the token
// that decides whether it may still start.
//
// Whoever holds a WorkItem settles it exactly once, through one of:
//   Run()     - a worker executes the body
//   Cancel()  - the token fired before the body started
//   Reject()  - the pool refused the item (shut down)
// Implementations must tolerate a second settle attempt as a no-op; the
// worker only issues one on its error path.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <string_view>

#include "fanout/core/cancellation.hpp"
#include "fanout/core/error.hpp"
#include "fanout/core/future.hpp"
#include "fanout/core/result.hpp"
#include "fanout/core/task.hpp"

namespace fanout {

class WorkItem {
   public:
    virtual ~WorkItem() = default;

    // Token observed before dispatch and handed to the body
    virtual const CancellationToken& Token() const noexcept = 0;

    // Identity, for logs
    virtual std::string_view Key() const noexcept { return {}; }
    virtual size_t Index() const noexcept { return 0; }

    virtual void Run(size_t worker_index) = 0;
    virtual void Cancel(CancelReason reason) = 0;
    virtual void Reject(Error error) = 0;
};

// ============================================================================
// PromiseWorkItem<T> - settles a Promise<Result<T>> (WorkerPool::Submit)
// ============================================================================
template <typename T>
class PromiseWorkItem final : public WorkItem {
   public:
    PromiseWorkItem(Task<T> task, CancellationSource source, Promise<Result<T>> promise)
        : task_(std::move(task)), source_(std::move(source)), token_(source_.GetToken()), promise_(std::move(promise)) {}

    const CancellationToken& Token() const noexcept override { return token_; }

    std::string_view Key() const noexcept override { return task_.Key(); }

    void Run(size_t worker_index) override {
        TaskContext ctx{token_, 0, worker_index, task_.Key()};
        promise_.TrySetValue(task_.Execute(ctx));
    }

    void Cancel(CancelReason reason) override { promise_.TrySetValue(Cancelled(reason)); }

    void Reject(Error error) override { promise_.TrySetValue(Failure(error, "work item rejected")); }

   private:
    Task<T> task_;
    CancellationSource source_;
    CancellationToken token_;
    Promise<Result<T>> promise_;
};

}  // namespace fanout
