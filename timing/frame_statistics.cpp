// ────────────────────────────────────────────
//  File: frame_statistics.cpp · Created by Yash Patel · 2-4-2026
// ────────────────────────────────────────────

#include "frame_statistics.hpp"

namespace tempo
{
    FrameStatistics::FrameStatistics(double smoothing) noexcept
        : m_smoothing(smoothing)
        , m_averageFrameTime(0.0)
        , m_averageFps(0.0)
        , m_sampleCount(0)
    {
    }

    void FrameStatistics::update(double elapsedFrameTime) noexcept
    {
        const double alpha = m_smoothing;

        m_averageFrameTime = (m_averageFrameTime == 0.0)
            ? elapsedFrameTime
            : m_averageFrameTime * (1.0 - alpha) + elapsedFrameTime * alpha;

        // a zero-length frame has no finite rate; keep the fps average as is
        if (elapsedFrameTime > 0.0)
        {
            const double fps = 1000.0 / elapsedFrameTime;
            m_averageFps = (m_averageFps == 0.0)
                ? fps
                : m_averageFps * (1.0 - alpha) + fps * alpha;
        }

        ++m_sampleCount;
    }

    void FrameStatistics::reset() noexcept
    {
        m_averageFrameTime = 0.0;
        m_averageFps = 0.0;
        m_sampleCount = 0;
    }
}   // namespace tempo
