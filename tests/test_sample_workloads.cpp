// ────────────────────────────────────────────
//  File: test_sample_workloads.cpp · Created by Yash Patel · 2-12-2026
// ────────────────────────────────────────────

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>

#include "core/tempo_app.hpp"
#include "samples/busy_loop/busy_loop.hpp"
#include "samples/jitter/jitter_load.hpp"
#include "support/manual_clock.hpp"

using namespace tempo;
using tempo::test::FakeWaitStrategy;
using tempo::test::ManualClock;

class SampleWorkloadTest : public ::testing::Test
{
    protected:
        void SetUp() override
        {
            source = std::make_shared<ManualClock>(0.0);
            waiter = std::make_shared<FakeWaitStrategy>(*source);
            clock = std::make_shared<ThrottledFrameClock>(source, waiter);
            clock->setMaximumUpdateHz(100);
        }

        std::shared_ptr<ManualClock> source;
        std::shared_ptr<FakeWaitStrategy> waiter;
        std::shared_ptr<ThrottledFrameClock> clock;
};

TEST_F(SampleWorkloadTest, BusyLoopRejectsNegativeWork)
{
    TempoApp app;
    EXPECT_FALSE(app.initialize(std::make_unique<BusyLoop>(-1.0, 4), clock));
    EXPECT_EQ(app.run(), EXIT_FAILURE);
}

TEST_F(SampleWorkloadTest, BusyLoopRunsRequestedFrames)
{
    TempoApp app;
    ASSERT_TRUE(app.initialize(std::make_unique<BusyLoop>(0.0, 4), clock));
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(clock->getFrameCount(), 4u);
}

TEST_F(SampleWorkloadTest, JitterLoadRejectsNegativeMean)
{
    TempoApp app;
    EXPECT_FALSE(app.initialize(std::make_unique<JitterLoad>(-2.0, 0.0, 2, 4, 7u), clock));
    EXPECT_EQ(app.run(), EXIT_FAILURE);
}

TEST_F(SampleWorkloadTest, JitterLoadRejectsNegativeSpike)
{
    TempoApp app;
    EXPECT_FALSE(app.initialize(std::make_unique<JitterLoad>(0.0, -5.0, 2, 4, 7u), clock));
}

TEST_F(SampleWorkloadTest, JitterLoadRejectsZeroSpikeInterval)
{
    TempoApp app;
    EXPECT_FALSE(app.initialize(std::make_unique<JitterLoad>(0.0, 0.0, 0, 4, 7u), clock));
}

TEST_F(SampleWorkloadTest, JitterLoadRunsRequestedFrames)
{
    TempoApp app;
    ASSERT_TRUE(app.initialize(std::make_unique<JitterLoad>(0.2, 0.0, 2, 6, 7u), clock));
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(clock->getFrameCount(), 6u);
}
