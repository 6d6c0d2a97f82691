#include "core/types/Deadline.hpp"

#include <gtest/gtest.h>

using core::types::Deadline;
using namespace std::chrono_literals;

TEST(DeadlineTest, UnboundedNeverExpires) {
    auto deadline = Deadline::unbounded();
    EXPECT_FALSE(deadline.isBounded());
    EXPECT_FALSE(deadline.expired());
    EXPECT_EQ(deadline.clamp(5000ms), 5000ms);
    EXPECT_NO_THROW(deadline.checkpoint("scan"));
}

TEST(DeadlineTest, ClampsWaitsToRemainingBudget) {
    auto deadline = Deadline::after(50ms);
    EXPECT_TRUE(deadline.isBounded());
    EXPECT_LE(deadline.clamp(5000ms), 50ms);
}

TEST(DeadlineTest, CheckpointThrowsOnceExpired) {
    auto deadline = Deadline::after(0ms);
    EXPECT_TRUE(deadline.expired());
    EXPECT_THROW(deadline.checkpoint("delivery"), core::types::TimeoutError);
}

TEST(DeadlineTest, SleepStopsAtTheDeadline) {
    auto deadline = Deadline::after(20ms);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(deadline.sleepFor(2000ms, "delivery"), core::types::TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}
