// ============================================================================
// Defer Tests
// ============================================================================

#include "fanout/core/defer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace fanout;

// ============================================================================
// Basic Defer Tests
// ============================================================================

TEST(DeferTest, RunsOnScopeExit) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        EXPECT_FALSE(executed);
    }
    EXPECT_TRUE(executed);
}

TEST(DeferTest, MultipleDefers) {
    std::string order;
    {
        Defer d1([&] { order += "1"; });
        Defer d2([&] { order += "2"; });
        Defer d3([&] { order += "3"; });
    }
    // LIFO order: last registered runs first
    EXPECT_EQ(order, "321");
}

TEST(DeferTest, Dismiss) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        d.Dismiss();
        EXPECT_FALSE(d.Armed());
    }
    EXPECT_FALSE(executed);
}

TEST(DeferTest, FireRunsOnce) {
    int count = 0;
    {
        Defer d([&] { count++; });
        EXPECT_EQ(count, 0);
        d.Fire();
        EXPECT_EQ(count, 1);
        EXPECT_FALSE(d.Armed());
    }
    EXPECT_EQ(count, 1);
}

TEST(DeferTest, MoveTransfersOwnership) {
    int count = 0;
    {
        Defer d1([&] { count++; });
        Defer d2(std::move(d1));
        EXPECT_FALSE(d1.Armed());
        EXPECT_TRUE(d2.Armed());
    }
    EXPECT_EQ(count, 1);
}

TEST(DeferTest, Macro) {
    int value = 0;
    {
        FANOUT_DEFER([&] { value = 7; });
        EXPECT_EQ(value, 0);
    }
    EXPECT_EQ(value, 7);
}
