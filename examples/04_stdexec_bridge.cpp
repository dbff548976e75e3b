// ============================================================================
// Example 04: Bridging fanout with P2300 std::execution
// ============================================================================
//
// Using a WorkerPool as a P2300 scheduler, and driving a batch from a
// std::jthread's stop_token.
//
// Built only when stdexec is found by CMake.
//
// RUN:
//   cd build && ./examples/04_stdexec_bridge
//
// ============================================================================

#ifdef FANOUT_HAS_STDEXEC

#include "fanout/fanout.hpp"

#include <iostream>
#include <stdexec/execution.hpp>
#include <thread>
#include <vector>

using namespace fanout;
using namespace std::chrono_literals;

// ============================================================================
// 1. WorkerPool as a P2300 scheduler
// ============================================================================

void demo_scheduler(WorkerPool& pool) {
    std::cout << "--- Demo 1: WorkerPool as P2300 scheduler ---" << std::endl;

    auto scheduler = execution::AsScheduler(pool);
    auto sender = stdexec::schedule(scheduler) | stdexec::then([] {
                      std::cout << "  [then] running on " << std::this_thread::get_id() << std::endl;
                      return 21;
                  }) |
                  stdexec::then([](int x) { return x * 2; });

    auto [value] = stdexec::sync_wait(std::move(sender)).value();
    std::cout << "  Result: " << value << std::endl;
    std::cout << std::endl;
}

// ============================================================================
// 2. when_all across pool workers
// ============================================================================

void demo_when_all(WorkerPool& pool) {
    std::cout << "--- Demo 2: when_all on the pool ---" << std::endl;

    auto scheduler = execution::AsScheduler(pool);
    auto square = [&scheduler](int x) { return stdexec::schedule(scheduler) | stdexec::then([x] { return x * x; }); };

    auto [a, b, c] = stdexec::sync_wait(stdexec::when_all(square(2), square(3), square(4))).value();
    std::cout << "  Squares: " << a << ", " << b << ", " << c << std::endl;
    std::cout << std::endl;
}

// ============================================================================
// 3. std::jthread stop -> batch cancellation
// ============================================================================

void demo_stop_token(WorkerPool& pool) {
    std::cout << "--- Demo 3: jthread stop cancels a batch ---" << std::endl;

    std::jthread caller([&pool](std::stop_token st) {
        auto [token, bridge] = execution::FromStopToken(st);

        std::vector<Task<int>> tasks;
        for (int i = 0; i < 8; ++i) {
            tasks.push_back(MakeTask([i](const TaskContext& ctx) -> Result<int> {
                if (ctx.token.WaitFor(1s)) {
                    return Cancelled(ctx.token.Reason());
                }
                return Success(i);
            }));
        }
        auto report = Summarize(RunBatch(pool, std::move(tasks), token));
        std::cout << "  Status: " << ToString(report.status) << ", cancelled: " << report.cancelled << std::endl;
    });

    std::this_thread::sleep_for(30ms);
    caller.request_stop();
    caller.join();
    std::cout << std::endl;
}

int main() {
    std::cout << "=== fanout Example 04: P2300 std::execution Bridge ===" << std::endl;
    std::cout << "(main thread: " << std::this_thread::get_id() << ")" << std::endl;
    std::cout << std::endl;

    WorkerPool pool(4);
    demo_scheduler(pool);
    demo_when_all(pool);
    demo_stop_token(pool);

    std::cout << "=== Done! ===" << std::endl;
    return 0;
}

#else

#include <iostream>

int main() {
    std::cout << "This example requires stdexec to be installed." << std::endl;
    return 1;
}

#endif
