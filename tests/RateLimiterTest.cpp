#include <gtest/gtest.h>
#include "../server/src/RateLimiter.h"

using namespace Parley;

TEST(RateLimiter, SlidingWindow) {
    RateLimiter limiter(3, 1000);
    EXPECT_TRUE(limiter.Allow("k", 0));
    EXPECT_TRUE(limiter.Allow("k", 100));
    EXPECT_TRUE(limiter.Allow("k", 200));
    EXPECT_FALSE(limiter.Allow("k", 300));
    EXPECT_TRUE(limiter.Allow("other", 300));
    // The first hit leaves the window at t=1000.
    EXPECT_FALSE(limiter.Allow("k", 999));
    EXPECT_TRUE(limiter.Allow("k", 1000));
}

TEST(RateLimiter, SweepDropsIdleKeys) {
    RateLimiter limiter(2, 1000);
    limiter.Allow("a", 0);
    limiter.Allow("b", 900);
    EXPECT_EQ(limiter.Size(), 2u);
    EXPECT_EQ(limiter.Sweep(1000), 1u);
    EXPECT_EQ(limiter.Size(), 1u);
    EXPECT_EQ(limiter.Sweep(2000), 1u);
    EXPECT_EQ(limiter.Size(), 0u);
}
