// ============================================================================
// stop_token Adapter Tests
// ============================================================================

#include "fanout/execution/stop_token_adapter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>

#include "fanout/pool/fan_out.hpp"

using namespace fanout;
using namespace std::chrono_literals;

// ============================================================================
// std::stop_token -> CancellationToken
// ============================================================================

TEST(StopTokenAdapterTest, StopRequestCancelsToken) {
    std::stop_source ss;
    auto [token, bridge] = execution::FromStopToken(ss.get_token());

    EXPECT_FALSE(token.IsCancelled());
    ss.request_stop();

    EXPECT_TRUE(token.IsCancelled());
    EXPECT_EQ(token.Reason(), CancelReason::Explicit);
}

TEST(StopTokenAdapterTest, AlreadyStoppedTokenIsCancelled) {
    std::stop_source ss;
    ss.request_stop();
    auto [token, bridge] = execution::FromStopToken(ss.get_token());
    EXPECT_TRUE(token.IsCancelled());
}

TEST(StopTokenAdapterTest, UnstoppableTokenNeverCancels) {
    auto [token, bridge] = execution::FromStopToken(std::stop_token{});
    EXPECT_TRUE(token.IsValid());
    EXPECT_FALSE(token.IsCancelled());
}

TEST(StopTokenAdapterTest, TokenOutlivesBridge) {
    std::stop_source ss;
    CancellationToken token;
    {
        auto handle = execution::FromStopToken(ss.get_token());
        token = handle.token;
    }
    // The bridge is gone: stop requests no longer reach the token
    ss.request_stop();
    EXPECT_FALSE(token.IsCancelled());
}

TEST(StopTokenAdapterTest, JthreadStopCancelsBatch) {
    WorkerPool pool(2);
    std::vector<Result<int>> results;

    std::jthread caller([&pool, &results](std::stop_token st) {
        auto [token, bridge] = execution::FromStopToken(st);
        std::vector<Task<int>> tasks;
        for (int i = 0; i < 6; ++i) {
            tasks.push_back(MakeTask([](const TaskContext& ctx) -> Result<int> {
                if (ctx.token.WaitFor(5s)) {
                    return Cancelled(ctx.token.Reason());
                }
                return Success(1);
            }));
        }
        results = RunBatch(pool, std::move(tasks), token);
    });

    std::this_thread::sleep_for(20ms);
    caller.request_stop();
    caller.join();

    ASSERT_EQ(results.size(), 6u);
    for (const auto& r : results) {
        EXPECT_TRUE(r.IsCancelled());
    }
}

// ============================================================================
// CancellationToken -> std::stop_source
// ============================================================================

TEST(StopTokenAdapterTest, CancelRequestsStop) {
    CancellationSource source;
    std::stop_source ss;
    auto link = execution::LinkCancellation(source.GetToken(), ss);

    EXPECT_FALSE(ss.stop_requested());
    source.Cancel();
    EXPECT_TRUE(ss.stop_requested());
}

TEST(StopTokenAdapterTest, TimeoutRequestsStop) {
    CancellationSource source(10ms);
    std::stop_source ss;
    auto link = execution::LinkCancellation(source.GetToken(), ss);

    std::stop_token st = ss.get_token();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(st.stop_requested());
}

TEST(StopTokenAdapterTest, DestroyedLinkStopsForwarding) {
    CancellationSource source;
    std::stop_source ss;
    {
        auto link = execution::LinkCancellation(source.GetToken(), ss);
    }
    source.Cancel();
    EXPECT_FALSE(ss.stop_requested());
}

TEST(StopTokenAdapterTest, LinkOutlivesCancellationSource) {
    std::stop_source ss;
    std::unique_ptr<execution::CancellationLink> link;
    {
        CancellationSource source;
        link = execution::LinkCancellation(source.GetToken(), ss);
    }
    link.reset();
    EXPECT_FALSE(ss.stop_requested());
}
