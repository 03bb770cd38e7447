#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <thread>
#include <vector>

#include "core/state/state.hpp"

using namespace mlprogress::core;
using namespace std::chrono_literals;

TEST(StateTest, StartsEmpty)
{
    State state{StateOptions{.total = 10}};
    const auto snap = state.snapshot();
    EXPECT_EQ(snap.pos(), 0u);
    ASSERT_TRUE(snap.total());
    EXPECT_EQ(*snap.total(), 10u);
    EXPECT_FALSE(snap.speed());
    EXPECT_FALSE(snap.eta());
    EXPECT_FALSE(snap.is_finished());
    EXPECT_EQ(snap.thousands_separator(), " ");
}

TEST(StateTest, PercentWithoutTotalIsUnavailable)
{
    State state;
    state.inc(5);
    EXPECT_FALSE(state.snapshot().percent());
}

TEST(StateTest, ZeroTotalIsComplete)
{
    State state{StateOptions{.total = 0}};
    ASSERT_TRUE(state.snapshot().percent());
    EXPECT_DOUBLE_EQ(*state.snapshot().percent(), 100.0);
}

TEST(StateTest, PreIncCountsStartedStepAsNotDone)
{
    State state{StateOptions{.total = 4, .pre_inc = true}};
    state.inc(1);
    auto snap = state.snapshot();
    EXPECT_EQ(snap.pos(), 1u);
    EXPECT_EQ(snap.completed(), 0u);
    EXPECT_DOUBLE_EQ(*snap.percent(), 0.0);

    state.inc(2);
    EXPECT_DOUBLE_EQ(*state.snapshot().percent(), 50.0);

    // After finishing the last started step counts as done
    ASSERT_TRUE(state.mark_finished());
    EXPECT_EQ(state.snapshot().completed(), 3u);
}

TEST(StateTest, SetPositionNeverDecreases)
{
    State state{StateOptions{.total = 100}};
    state.set_position(40);
    state.set_position(10);
    EXPECT_EQ(state.pos(), 40u);
    state.set_position(41);
    EXPECT_EQ(state.pos(), 41u);
}

TEST(StateTest, IncSaturates)
{
    State state;
    state.set_position(std::numeric_limits<std::uint64_t>::max() - 1);
    state.inc(10);
    EXPECT_EQ(state.pos(), std::numeric_limits<std::uint64_t>::max());
}

TEST(StateTest, ConcurrentIncrementsAreNotLost)
{
    constexpr int kThreads = 8;
    constexpr int kIncrements = 10000;

    State state{StateOptions{.total = kThreads * kIncrements}};
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&state] {
                for (int i = 0; i < kIncrements; ++i) {
                    state.inc(1);
                    if (i % 1000 == 0) {
                        (void)state.snapshot();
                    }
                }
            });
        }
    }

    EXPECT_EQ(state.pos(), static_cast<std::uint64_t>(kThreads * kIncrements));
}

TEST(StateTest, CompleteMovesPositionToTotal)
{
    State state{StateOptions{.total = 10}};
    state.inc(3);
    state.complete();
    EXPECT_EQ(state.pos(), 10u);
    EXPECT_EQ(state.total(), 10u);
}

TEST(StateTest, CompleteNeverMovesPositionBack)
{
    State state{StateOptions{.total = 10}};
    state.set_position(15);
    state.complete();
    EXPECT_EQ(state.pos(), 15u);
}

TEST(StateTest, CompleteRacingWithIncKeepsAllSteps)
{
    constexpr int kIncrements = 5000;

    State state{StateOptions{.total = 10}};
    {
        std::jthread worker([&state] {
            for (int i = 0; i < kIncrements; ++i) {
                state.inc(1);
            }
        });
        state.complete();
    }
    // complete() only raises the position, so every inc is still counted on top of it
    EXPECT_GE(state.pos(), static_cast<std::uint64_t>(kIncrements));
    EXPECT_LE(state.pos(), static_cast<std::uint64_t>(kIncrements + 10));
}

TEST(StateTest, CompleteWithoutTotalUsesPosition)
{
    State state;
    state.inc(7);
    state.complete();
    EXPECT_EQ(state.pos(), 7u);
    EXPECT_EQ(state.total(), 7u);
}

TEST(StateTest, FreezeTotalAtPosition)
{
    State state{StateOptions{.total = 100}};
    state.inc(30);
    state.freeze_total_at_position();
    EXPECT_EQ(state.total(), 30u);
    EXPECT_DOUBLE_EQ(*state.snapshot().percent(), 100.0);
}

TEST(StateTest, MarkFinishedOnlyOnce)
{
    State state;
    EXPECT_TRUE(state.mark_finished());
    EXPECT_FALSE(state.mark_finished());
    EXPECT_TRUE(state.is_finished());
    EXPECT_EQ(state.snapshot().eta(), std::chrono::nanoseconds::zero());
}

TEST(StateTest, SpeedAndEtaAfterWarmup)
{
    State state{StateOptions{.total = 100}};
    std::this_thread::sleep_for(kMinSpeedElapsed + 50ms);
    state.inc(50);

    const auto snap = state.snapshot();
    ASSERT_TRUE(snap.speed());
    EXPECT_GT(*snap.speed(), 0.0);
    ASSERT_TRUE(snap.eta());
    // Half done: remaining time is about the elapsed time
    EXPECT_GT(*snap.eta(), 0ns);
    EXPECT_LE(*snap.eta(), snap.elapsed() + 10ms);
}

TEST(StateTest, EtaUnavailablePastTotal)
{
    State state{StateOptions{.total = 10}};
    std::this_thread::sleep_for(kMinSpeedElapsed + 10ms);
    state.set_position(15);

    const auto snap = state.snapshot();
    ASSERT_TRUE(snap.speed());
    EXPECT_FALSE(snap.eta());
    // percent itself is not clamped
    EXPECT_DOUBLE_EQ(*snap.percent(), 150.0);
}

TEST(StateTest, MessageIsCopiedIntoSnapshot)
{
    State state;
    state.set_message("loading");
    EXPECT_EQ(state.snapshot().message(), "loading");
}
