// ────────────────────────────────────────────
//  File: throttled_frame_clock.hpp · Created by Yash Patel · 10-28-2025
// ────────────────────────────────────────────

#pragma once

#include <memory>

#include "framed_clock.hpp"
#include "frame_statistics.hpp"
#include "wait_strategy.hpp"

namespace tempo
{
    // A framed clock that caps the frame rate by blocking inside
    // processFrame(). Waits are whole milliseconds; the fractional part and
    // any over-sleep of the wait primitive are carried across frames in an
    // error accumulator so the long-run average period matches the target.
    class ThrottledFrameClock final : public FramedClock
    {
        public:
            // creation and destruction
            ThrottledFrameClock() noexcept;
            ThrottledFrameClock(std::shared_ptr<Clock> source, std::shared_ptr<WaitStrategy> waitStrategy) noexcept;

            // samples the source, throttles, then updates the averages
            void processFrame() noexcept override;

            // configuration; a rate <= 0 disables the cap
            void setMaximumUpdateHz(int hz) noexcept;
            void setAlwaysYield(bool alwaysYield) noexcept;

            // accessors
            int    getMaximumUpdateHz() const noexcept          { return m_maximumUpdateHz; }
            bool   getAlwaysYield() const noexcept              { return m_alwaysYield; }
            double getTargetFrameTime() const noexcept;
            double getAccumulatedSleepError() const noexcept    { return m_accumulatedSleepError; }
            double getAverageFrameTime() const noexcept         { return m_statistics.getAverageFrameTime(); }
            double getAverageFps() const noexcept               { return m_statistics.getAverageFps(); }
            const FrameStatistics& getStatistics() const noexcept { return m_statistics; }

        private:
            void throttleFrameTime() noexcept;

        private:
            std::shared_ptr<WaitStrategy>   m_waitStrategy;
            FrameStatistics                 m_statistics;

            int     m_maximumUpdateHz;
            bool    m_alwaysYield;
            double  m_accumulatedSleepError;
            bool    m_behindBudget;
    };
}   // namespace tempo
