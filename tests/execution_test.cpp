// ============================================================================
// execution_test.cpp - Tests for the P2300 scheduler adapter
// ============================================================================

#ifdef FANOUT_HAS_STDEXEC

#include <atomic>
#include <gtest/gtest.h>
#include <fanout/execution/scheduler.hpp>
#include <fanout/pool/worker_pool.hpp>
#include <stdexec/execution.hpp>
#include <system_error>
#include <thread>

using namespace fanout;

// ============================================================================
// Scheduler Tests
// ============================================================================

TEST(ExecutionTest, SchedulerEquality) {
    WorkerPool pool(1);
    auto s1 = execution::AsScheduler(pool);
    auto s2 = execution::AsScheduler(pool);
    EXPECT_EQ(s1, s2);
}

TEST(ExecutionTest, SchedulerInequality) {
    WorkerPool pool1(1);
    WorkerPool pool2(1);
    EXPECT_NE(execution::AsScheduler(pool1), execution::AsScheduler(pool2));
}

TEST(ExecutionTest, SchedulerScheduleAndSyncWait) {
    WorkerPool pool(2);
    auto scheduler = execution::AsScheduler(pool);

    auto sender = stdexec::schedule(scheduler) | stdexec::then([] { return 42; });
    auto result = stdexec::sync_wait(std::move(sender));

    ASSERT_TRUE(result.has_value());
    auto [value] = *result;
    EXPECT_EQ(value, 42);
}

TEST(ExecutionTest, ScheduleRunsOnPoolWorker) {
    WorkerPool pool(2);
    auto scheduler = execution::AsScheduler(pool);

    auto sender = stdexec::schedule(scheduler) | stdexec::then([&pool] { return pool.InWorkerThread(); });
    auto [on_worker] = stdexec::sync_wait(std::move(sender)).value();
    EXPECT_TRUE(on_worker);
}

TEST(ExecutionTest, WhenAllOnPool) {
    WorkerPool pool(4);
    auto scheduler = execution::AsScheduler(pool);
    std::atomic<int> count{0};

    auto work = [&] {
        return stdexec::schedule(scheduler) | stdexec::then([&count] { return ++count; });
    };
    auto result = stdexec::sync_wait(stdexec::when_all(work(), work(), work()));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(count.load(), 3);
}

TEST(ExecutionTest, ScheduleAfterShutdownCompletesWithError) {
    WorkerPool pool(1);
    pool.Shutdown(true);
    auto scheduler = execution::AsScheduler(pool);

    std::error_code seen;
    auto sender = stdexec::schedule(scheduler) | stdexec::then([] { return 1; }) |
                  stdexec::upon_error([&seen](std::error_code ec) {
                      seen = ec;
                      return 0;
                  });
    auto [value] = stdexec::sync_wait(std::move(sender)).value();

    EXPECT_EQ(value, 0);
    EXPECT_EQ(seen, Errc::PoolShutdown);
}

TEST(ExecutionTest, ScheduleCancelledByShutdownCompletesStopped) {
    WorkerPool pool(1);
    auto scheduler = execution::AsScheduler(pool);

    std::atomic<bool> release{false};
    auto blocker = pool.Submit(MakeTask([&release](const TaskContext& ctx) {
        while (!release.load() && !ctx.IsCancelled()) {
            std::this_thread::yield();
        }
    }));

    std::thread stopper([&pool] {
        // The blocker is running and the scheduled item is queued behind it
        while (pool.ActiveTasks() == 0 || pool.PendingTasks() == 0) {
            std::this_thread::yield();
        }
        pool.Shutdown(false);
    });

    auto sender = stdexec::schedule(scheduler) | stdexec::then([] { return 1; }) |
                  stdexec::let_stopped([] { return stdexec::just(-1); });
    auto [value] = stdexec::sync_wait(std::move(sender)).value();
    stopper.join();
    release = true;
    blocker.Wait();

    EXPECT_EQ(value, -1);
}

#endif  // FANOUT_HAS_STDEXEC
