// ============================================================================
// Example 01: Worker Pool Basics
// ============================================================================
//
// Submitting independent tasks to a bounded WorkerPool and reading their
// results from futures.
//
// RUN:
//   cd build && ./examples/01_worker_pool
//
// ============================================================================

#include "fanout/fanout.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

using namespace fanout;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== fanout Example 01: Worker Pool ===" << std::endl;
    std::cout << std::endl;

    WorkerPool::Options options;
    options.num_workers = 2;
    options.queue_capacity = 16;
    options.thread_config.name_prefix = "example";
    WorkerPool pool(options);

    // Example 1: A task producing a value
    std::cout << "--- Example 1: Value Task ---" << std::endl;
    auto answer = pool.Submit(MakeTask([] { return 42; }, "answer"));
    std::cout << "Result: " << answer.Get().Value() << std::endl;
    std::cout << std::endl;

    // Example 2: A task reporting its own failure
    std::cout << "--- Example 2: Failing Task ---" << std::endl;
    auto failing = pool.Submit(MakeTask([]() -> Result<int> { return Failure(Errc::TaskFailed, "bad input"); }));
    std::cout << "Result: " << failing.Get().ToString() << std::endl;
    std::cout << std::endl;

    // Example 3: A throwing task does not take the worker down
    std::cout << "--- Example 3: Throwing Task ---" << std::endl;
    auto throwing = pool.Submit(MakeTask([]() -> int { throw std::runtime_error("boom"); }, "thrower"));
    const auto& thrown = throwing.Get();
    std::cout << "Result: " << thrown.ToString() << " (recovered: " << std::boolalpha << thrown.Error().recovered
              << ")" << std::endl;
    auto after = pool.Submit(MakeTask([] { return std::string("worker still alive"); }));
    std::cout << "Next task: " << after.Get().Value() << std::endl;
    std::cout << std::endl;

    // Example 4: Cancelling a submitted task through its token
    std::cout << "--- Example 4: Cancellation ---" << std::endl;
    CancellationSource source;
    auto slow = pool.Submit(MakeTask([](const TaskContext& ctx) -> Result<Unit> {
                                if (ctx.token.WaitFor(10s)) {
                                    return Cancelled(ctx.token.Reason());
                                }
                                return Success();
                            }),
                            source.GetToken());
    std::this_thread::sleep_for(10ms);
    source.Cancel();
    std::cout << "Result: " << slow.Get().ToString() << std::endl;
    std::cout << std::endl;

    pool.Shutdown(/*drain=*/true);

    auto stats = pool.GetStats();
    std::cout << "Submitted: " << stats.submitted << ", executed: " << stats.executed
              << ", cancelled: " << stats.cancelled << ", rejected: " << stats.rejected << std::endl;

    std::cout << "=== Example Complete ===" << std::endl;
    return 0;
}
