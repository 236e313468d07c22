// ────────────────────────────────────────────
//  File: test_throttled_frame_clock.cpp · Created by Yash Patel · 2-10-2026
// ────────────────────────────────────────────

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <random>

#include "timing/throttled_frame_clock.hpp"
#include "support/manual_clock.hpp"

using namespace tempo;
using tempo::test::FakeWaitStrategy;
using tempo::test::ManualClock;

class ThrottledFrameClockTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            source = std::make_shared<ManualClock>(0.0);
            waiter = std::make_shared<FakeWaitStrategy>(*source);
            clock = std::make_unique<ThrottledFrameClock>(source, waiter);
        }

        // spend workMs inside the frame, then hand control to the clock
        void runFrame(double workMs)
        {
            source->advance(workMs);
            clock->processFrame();
        }

        std::shared_ptr<ManualClock> source;
        std::shared_ptr<FakeWaitStrategy> waiter;
        std::unique_ptr<ThrottledFrameClock> clock;
};

TEST_F(ThrottledFrameClockTest, DefaultsToOneKilohertzAndYielding)
{
    EXPECT_EQ(clock->getMaximumUpdateHz(), 1000);
    EXPECT_TRUE(clock->getAlwaysYield());
    EXPECT_DOUBLE_EQ(clock->getTargetFrameTime(), 1.0);
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), 0.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFrameTime(), 0.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFps(), 0.0);
}

TEST_F(ThrottledFrameClockTest, TargetFrameTimeFollowsRate)
{
    clock->setMaximumUpdateHz(100);
    EXPECT_DOUBLE_EQ(clock->getTargetFrameTime(), 10.0);

    clock->setMaximumUpdateHz(0);
    EXPECT_DOUBLE_EQ(clock->getTargetFrameTime(), 0.0);

    clock->setMaximumUpdateHz(-60);
    EXPECT_DOUBLE_EQ(clock->getTargetFrameTime(), 0.0);
}

TEST_F(ThrottledFrameClockTest, SubMillisecondFrameCarriesFractionIntoLaterWaits)
{
    // 1 ms budget, 0.3 ms of work: 0.7 ms wanted but only whole units can be slept
    runFrame(0.3);
    ASSERT_EQ(waiter->getSleeps().size(), 1u);
    EXPECT_EQ(waiter->getSleeps()[0], 1);
    EXPECT_NEAR(clock->getAccumulatedSleepError(), -0.3, 1e-9);
    EXPECT_EQ(waiter->getYieldCount(), 0u);

    // the 0.3 ms overpaid is taken back by skipping the next wait
    runFrame(0.3);
    EXPECT_EQ(waiter->getSleeps().size(), 1u);
    EXPECT_EQ(waiter->getYieldCount(), 1u);
    EXPECT_NEAR(clock->getAccumulatedSleepError(), 0.4, 1e-9);

    runFrame(0.3);
    ASSERT_EQ(waiter->getSleeps().size(), 2u);
    EXPECT_EQ(waiter->getSleeps()[1], 1);
    EXPECT_NEAR(clock->getAccumulatedSleepError(), 0.1, 1e-9);
}

TEST_F(ThrottledFrameClockTest, LongRunSleepMatchesExactBudget)
{
    constexpr int kFrames = 1000;
    for (int i = 0; i < kFrames; ++i)
    {
        runFrame(0.3);
        EXPECT_LE(std::abs(clock->getAccumulatedSleepError()), 1.0);
    }

    for (const int64_t ms : waiter->getSleeps())
    {
        EXPECT_GT(ms, 0);
    }
    EXPECT_NEAR(static_cast<double>(waiter->getTotalSlept()), 0.7 * kFrames, 1.0);
}

TEST_F(ThrottledFrameClockTest, CurrentTimeIsReanchoredToWallClockAfterWait)
{
    clock->setMaximumUpdateHz(100);
    waiter->setOvershoot(0.25);

    runFrame(3.0);

    ASSERT_EQ(waiter->getSleeps().size(), 1u);
    EXPECT_EQ(waiter->getSleeps()[0], 7);
    EXPECT_DOUBLE_EQ(source->getCurrentTime(), 10.25);
    EXPECT_DOUBLE_EQ(clock->getCurrentTime(), source->getCurrentTime());
    EXPECT_NE(clock->getCurrentTime(), 3.0 + 7.0);

    // the 0.25 ms over-sleep is owed back to later frames
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -0.25);
}

TEST_F(ThrottledFrameClockTest, OverSleepIsCompensatedOverManyFrames)
{
    clock->setMaximumUpdateHz(100);
    waiter->setOvershoot(0.5);

    constexpr int kFrames = 200;
    for (int i = 0; i < kFrames; ++i)
    {
        runFrame(3.0);
    }

    // waits alternate between 7 and 6 ms so that sleep plus overshoot averages 7
    bool sawShortWait = false;
    for (const int64_t ms : waiter->getSleeps())
    {
        EXPECT_TRUE(ms == 6 || ms == 7) << ms;
        sawShortWait = sawShortWait || ms == 6;
    }
    EXPECT_TRUE(sawShortWait);

    EXPECT_NEAR(source->getCurrentTime() / kFrames, 10.0, 0.05);
    EXPECT_NEAR(clock->getAverageFrameTime(), 10.0, 0.1);
    EXPECT_NEAR(clock->getAverageFps(), 100.0, 1.0);
}

TEST_F(ThrottledFrameClockTest, RunningBehindNeverWaits)
{
    clock->setMaximumUpdateHz(100);

    constexpr int kFrames = 50;
    for (int i = 0; i < kFrames; ++i)
    {
        runFrame(15.0);
        EXPECT_LE(clock->getAccumulatedSleepError(), 0.0);
        EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -5.0);
    }

    EXPECT_TRUE(waiter->getSleeps().empty());
    EXPECT_EQ(waiter->getYieldCount(), static_cast<uint64_t>(kFrames));
    EXPECT_NEAR(clock->getAverageFrameTime(), 15.0, 1e-9);
}

TEST_F(ThrottledFrameClockTest, SlowFrameShortensFollowingWaitInsteadOfSkippingIt)
{
    clock->setMaximumUpdateHz(100);
    waiter->setOvershoot(0.0);

    // any credit built before is discarded by the overrun
    runFrame(0.5);
    runFrame(15.0);
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -5.0);

    waiter->clear();
    runFrame(3.0);
    ASSERT_EQ(waiter->getSleeps().size(), 1u);
    EXPECT_EQ(waiter->getSleeps()[0], 2);
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), 0.0);

    runFrame(3.0);
    ASSERT_EQ(waiter->getSleeps().size(), 2u);
    EXPECT_EQ(waiter->getSleeps()[1], 7);
}

TEST_F(ThrottledFrameClockTest, CompensationNeverDrivesWaitNegative)
{
    clock->setMaximumUpdateHz(100);

    runFrame(20.0);
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -10.0);

    // only 2 ms of wait available per frame to pay the 10 ms debt
    runFrame(8.0);
    EXPECT_TRUE(waiter->getSleeps().empty());
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -8.0);

    runFrame(8.0);
    EXPECT_TRUE(waiter->getSleeps().empty());
    EXPECT_DOUBLE_EQ(clock->getAccumulatedSleepError(), -6.0);

    EXPECT_EQ(waiter->getYieldCount(), 3u);
}

TEST_F(ThrottledFrameClockTest, BackwardsSourceJumpWaitsAtMostOneBudget)
{
    runFrame(0.3);
    ASSERT_EQ(waiter->getSleeps().size(), 1u);

    // a seek far into the past makes the elapsed time hugely negative
    source->set(-1e12);
    clock->processFrame();

    ASSERT_EQ(waiter->getSleeps().size(), 2u);
    EXPECT_EQ(waiter->getSleeps()[1], 1);
    EXPECT_TRUE(std::isfinite(clock->getAccumulatedSleepError()));
    EXPECT_NEAR(clock->getAccumulatedSleepError(), -0.3, 1e-3);

    // pacing carries on normally from the new position
    runFrame(0.3);
    runFrame(0.3);
    for (const int64_t sleep : waiter->getSleeps())
    {
        EXPECT_GE(sleep, 0);
        EXPECT_LE(sleep, 1);
    }
    EXPECT_LT(std::abs(clock->getAccumulatedSleepError()), 1.5);
}

TEST_F(ThrottledFrameClockTest, ForwardSourceJumpNeverProducesNegativeWait)
{
    // a seek far ahead leaves a debt far beyond the range of a single wait
    runFrame(1e12);
    EXPECT_LT(clock->getAccumulatedSleepError(), -1e11);

    runFrame(0.3);
    runFrame(0.3);
    EXPECT_TRUE(waiter->getSleeps().empty());
    EXPECT_EQ(waiter->getYieldCount(), 3u);
    EXPECT_TRUE(std::isfinite(clock->getAccumulatedSleepError()));
}

TEST_F(ThrottledFrameClockTest, DisabledCapLeavesAccumulatorUntouched)
{
    runFrame(0.3);
    const double errorBefore = clock->getAccumulatedSleepError();
    const size_t sleepsBefore = waiter->getSleeps().size();
    const uint64_t yieldsBefore = waiter->getYieldCount();

    clock->setMaximumUpdateHz(0);
    for (int i = 0; i < 10; ++i)
    {
        runFrame(0.3);
    }

    clock->setMaximumUpdateHz(-1);
    runFrame(0.3);

    EXPECT_EQ(clock->getAccumulatedSleepError(), errorBefore);
    EXPECT_EQ(waiter->getSleeps().size(), sleepsBefore);
    EXPECT_EQ(waiter->getYieldCount(), yieldsBefore + 11);
}

TEST_F(ThrottledFrameClockTest, AlwaysYieldFalseSuppressesZeroLengthYield)
{
    clock->setAlwaysYield(false);

    // 1 ms sleep, then a frame whose wait is fully paid by the carried error
    runFrame(0.3);
    runFrame(0.3);
    EXPECT_EQ(waiter->getSleeps().size(), 1u);
    EXPECT_EQ(waiter->getYieldCount(), 0u);

    clock->setMaximumUpdateHz(0);
    runFrame(2.0);
    EXPECT_EQ(waiter->getYieldCount(), 0u);

    clock->setAlwaysYield(true);
    runFrame(2.0);
    EXPECT_EQ(waiter->getYieldCount(), 1u);
}

TEST_F(ThrottledFrameClockTest, AccumulatorStaysBoundedUnderJitter)
{
    clock->setMaximumUpdateHz(100);
    const double target = clock->getTargetFrameTime();

    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> work(0.0, 2.0 * target);
    std::uniform_real_distribution<double> overshoot(0.0, 1.0);

    for (int i = 0; i < 2000; ++i)
    {
        waiter->setOvershoot(overshoot(rng));
        runFrame(work(rng));
        ASSERT_LE(std::abs(clock->getAccumulatedSleepError()), target + 1.0) << "frame " << i;
    }

    for (const int64_t ms : waiter->getSleeps())
    {
        EXPECT_GT(ms, 0);
    }
}

TEST_F(ThrottledFrameClockTest, AveragesSeeFullPacedFramePeriod)
{
    clock->setMaximumUpdateHz(100);

    runFrame(3.0);
    EXPECT_DOUBLE_EQ(clock->getElapsedFrameTime(), 10.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFrameTime(), 10.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFps(), 100.0);

    for (int i = 0; i < 100; ++i)
    {
        runFrame(3.0);
    }
    EXPECT_NEAR(clock->getAverageFrameTime(), 10.0, 1e-9);
    EXPECT_NEAR(clock->getAverageFps(), 100.0, 1e-9);
    EXPECT_EQ(clock->getFrameCount(), 101u);
    EXPECT_EQ(clock->getStatistics().getSampleCount(), 101u);
}

TEST_F(ThrottledFrameClockTest, UncappedAveragesFollowRawFrameTimes)
{
    clock->setMaximumUpdateHz(0);

    runFrame(4.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFrameTime(), 4.0);
    EXPECT_DOUBLE_EQ(clock->getAverageFps(), 250.0);

    runFrame(8.0);
    EXPECT_NEAR(clock->getAverageFrameTime(), 4.2, 1e-9);
    EXPECT_NEAR(clock->getAverageFps(), 243.75, 1e-9);
}

TEST(ThrottledFrameClockFallbackTest, NullWaitStrategyFallsBackToThreadSleep)
{
    auto source = std::make_shared<ManualClock>(0.0);
    ThrottledFrameClock clock(source, nullptr);
    clock.setMaximumUpdateHz(0);

    source->advance(2.0);
    clock.processFrame();
    EXPECT_DOUBLE_EQ(clock.getElapsedFrameTime(), 2.0);
}

TEST(ThrottledFrameClockRealTimeTest, CapsLoopAgainstSteadyClock)
{
    ThrottledFrameClock clock;
    clock.setMaximumUpdateHz(200);

    clock.processFrame();
    const double start = clock.getCurrentTime();
    for (int i = 0; i < 20; ++i)
    {
        clock.processFrame();
    }

    // nominally 100 ms; a large first over-sleep is paid back later, so keep the bound loose
    const double elapsed = clock.getCurrentTime() - start;
    EXPECT_GE(elapsed, 50.0);
    EXPECT_GT(clock.getAverageFrameTime(), 0.0);
}
