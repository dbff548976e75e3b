// ============================================================================
// Deadline Timer Tests
// ============================================================================

#include "fanout/core/deadline_timer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "fanout/core/cancellation.hpp"

using namespace fanout;
using namespace std::chrono_literals;

namespace {

// Poll until `pred` holds or `timeout` elapses
template <typename Pred>
bool Eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

}  // namespace

TEST(DeadlineTimerTest, IsSingleton) {
    EXPECT_EQ(&DeadlineTimer::Instance(), &DeadlineTimer::Instance());
}

TEST(DeadlineTimerTest, CancelsScheduledStateWithTimeout) {
    auto state = std::make_shared<CancellationState>();
    DeadlineTimer::Instance().Schedule(DeadlineTimer::Clock::now() + 10ms, state);

    EXPECT_TRUE(Eventually([&] { return state->IsCancelled(); }));
    EXPECT_EQ(state->Reason(), CancelReason::Timeout);
}

TEST(DeadlineTimerTest, FiresInDeadlineOrder) {
    std::vector<std::shared_ptr<CancellationState>> states;
    std::vector<int> order;
    std::mutex order_mutex;

    auto now = DeadlineTimer::Clock::now();
    // Scheduled out of order on purpose
    const int delays_ms[] = {60, 20, 40};
    for (int i = 0; i < 3; ++i) {
        auto state = std::make_shared<CancellationState>();
        state->RegisterCallback([&order, &order_mutex, i] {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        DeadlineTimer::Instance().Schedule(now + std::chrono::milliseconds(delays_ms[i]), state);
        states.push_back(std::move(state));
    }

    EXPECT_TRUE(Eventually([&] {
        std::lock_guard<std::mutex> lock(order_mutex);
        return order.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(order_mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 0}));
}

TEST(DeadlineTimerTest, ReleasedStateIsDiscarded) {
    std::weak_ptr<CancellationState> weak;
    {
        auto state = std::make_shared<CancellationState>();
        weak = state;
        DeadlineTimer::Instance().Schedule(DeadlineTimer::Clock::now() + 10ms, state);
    }
    // The timer holds only a weak reference
    EXPECT_TRUE(weak.expired());

    // The entry is dropped once due, without touching the released state
    EXPECT_TRUE(Eventually([] { return DeadlineTimer::Instance().Pending() == 0; }));
}

TEST(DeadlineTimerTest, AlreadyCancelledStateKeepsReason) {
    auto state = std::make_shared<CancellationState>();
    state->Cancel(CancelReason::Explicit);
    DeadlineTimer::Instance().Schedule(DeadlineTimer::Clock::now() + 5ms, state);

    EXPECT_TRUE(Eventually([] { return DeadlineTimer::Instance().Pending() == 0; }));
    EXPECT_EQ(state->Reason(), CancelReason::Explicit);
}

TEST(DeadlineTimerTest, ManySourcesAllTimeOut) {
    std::vector<CancellationSource> sources;
    for (int i = 0; i < 200; ++i) {
        sources.emplace_back(std::chrono::milliseconds(5 + i % 20));
    }
    for (auto& source : sources) {
        EXPECT_TRUE(source.GetToken().WaitFor(2s));
        EXPECT_EQ(source.Reason(), CancelReason::Timeout);
    }
}

TEST(DeadlineTimerTest, ReleasedEntriesArePrunedBeforeTheyComeDue) {
    auto& timer = DeadlineTimer::Instance();
    ASSERT_TRUE(Eventually([&] { return timer.Pending() == 0; }));

    // Far enough out that none of these come due during the loop
    for (int i = 0; i < 2000; ++i) {
        CancellationSource source(300ms);
    }
    EXPECT_LE(timer.Pending(), DeadlineTimer::kMinPruneThreshold);

    // Live entries survive a prune
    std::vector<CancellationSource> live;
    for (size_t i = 0; i < DeadlineTimer::kMinPruneThreshold * 2; ++i) {
        live.emplace_back(300ms);
    }
    EXPECT_GE(timer.Pending(), live.size());
    for (auto& source : live) {
        EXPECT_TRUE(source.GetToken().WaitFor(2s));
        EXPECT_EQ(source.Reason(), CancelReason::Timeout);
    }

    EXPECT_TRUE(Eventually([&] { return timer.Pending() == 0; }, 3s));
}
