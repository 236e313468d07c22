// ────────────────────────────────────────────
//  File: framed_clock.cpp · Created by Yash Patel · 2-2-2026
// ────────────────────────────────────────────

#include "framed_clock.hpp"

#include <utility>

#include "stopwatch_clock.hpp"
#include "utils/logger.hpp"

namespace tempo
{
    FramedClock::FramedClock(std::shared_ptr<Clock> source) noexcept
        : m_source(std::move(source))
        , m_currentTime(0.0)
        , m_lastFrameTime(0.0)
        , m_frameCount(0)
    {
        if (!m_source)
        {
            TEMPO_LOG_ERROR("FramedClock: source clock is null, falling back to a running stopwatch");
            m_source = std::make_shared<StopwatchClock>(true);
        }

        m_currentTime = m_source->getCurrentTime();
        m_lastFrameTime = m_currentTime;
    }

    void FramedClock::processFrame() noexcept
    {
        m_lastFrameTime = m_currentTime;
        m_currentTime = m_source->getCurrentTime();
        ++m_frameCount;
    }
}   // namespace tempo
