// ────────────────────────────────────────────
//  File: frame_statistics.hpp · Created by Yash Patel · 2-4-2026
// ────────────────────────────────────────────

#pragma once

#include <cstdint>

#include "core/tempo_config.hpp"

namespace tempo
{
    // Exponential moving averages of frame time and frame rate. A zero
    // average means "no sample yet" and is seeded by the next sample.
    // The fps average smooths the per-frame rate 1000 / elapsed, so it is
    // not the reciprocal of the frame time average when frames vary.
    class FrameStatistics
    {
        public:
            // creation and destruction
            explicit FrameStatistics(double smoothing = config::kAverageSmoothing) noexcept;

            // usage
            void update(double elapsedFrameTime) noexcept;
            void reset() noexcept;

            // accessors
            double   getAverageFrameTime() const noexcept   { return m_averageFrameTime; }
            double   getAverageFps() const noexcept         { return m_averageFps; }
            double   getSmoothing() const noexcept          { return m_smoothing; }
            uint64_t getSampleCount() const noexcept        { return m_sampleCount; }

        private:
            double      m_smoothing;
            double      m_averageFrameTime;
            double      m_averageFps;
            uint64_t    m_sampleCount;
    };
}   // namespace tempo
