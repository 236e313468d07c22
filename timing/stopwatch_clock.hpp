// ────────────────────────────────────────────
//  File: stopwatch_clock.hpp · Created by Yash Patel · 1-16-2026
// ────────────────────────────────────────────

#pragma once

#include <chrono>

#include "clock.hpp"

namespace tempo
{
    // monotonic wall clock with start/stop, seeking and playback rate
    class StopwatchClock final : public AdjustableClock
    {
        public:
            // creation and destruction
            explicit StopwatchClock(bool startRunning = false) noexcept;

            // Clock
            double getCurrentTime() const noexcept override;
            double getRate() const noexcept override    { return m_rate; }
            bool isRunning() const noexcept override    { return m_running; }

            // AdjustableClock
            void start() noexcept override;
            void stop() noexcept override;
            void reset() noexcept override;
            bool seek(double position) noexcept override;
            void setRate(double rate) noexcept override;

        private:
            using clock = std::chrono::steady_clock;
            using time_point = clock::time_point;

            double elapsedSinceSegmentStart() const noexcept;

            bool        m_running;
            double      m_rate;
            double      m_offset;          // clock time at m_segmentStart
            time_point  m_segmentStart;
    };
}   // namespace tempo
