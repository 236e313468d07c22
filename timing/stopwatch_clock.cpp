// ────────────────────────────────────────────
//  File: stopwatch_clock.cpp · Created by Yash Patel · 1-16-2026
// ────────────────────────────────────────────

#include "stopwatch_clock.hpp"

namespace tempo
{
    StopwatchClock::StopwatchClock(bool startRunning) noexcept
        : m_running(startRunning)
        , m_rate(1.0)
        , m_offset(0.0)
        , m_segmentStart(clock::now())
    {
    }

    double StopwatchClock::getCurrentTime() const noexcept
    {
        if (!m_running)
        {
            return m_offset;
        }

        return m_offset + elapsedSinceSegmentStart() * m_rate;
    }

    void StopwatchClock::start() noexcept
    {
        if (m_running)
        {
            return;
        }

        m_segmentStart = clock::now();
        m_running = true;
    }

    void StopwatchClock::stop() noexcept
    {
        if (!m_running)
        {
            return;
        }

        // freeze the current position
        m_offset = getCurrentTime();
        m_running = false;
    }

    void StopwatchClock::reset() noexcept
    {
        m_running = false;
        m_offset = 0.0;
        m_segmentStart = clock::now();
    }

    bool StopwatchClock::seek(double position) noexcept
    {
        m_offset = position;
        m_segmentStart = clock::now();
        return true;
    }

    void StopwatchClock::setRate(double rate) noexcept
    {
        // rebase so time stays continuous across the rate change
        m_offset = getCurrentTime();
        m_segmentStart = clock::now();
        m_rate = rate;
    }

    double StopwatchClock::elapsedSinceSegmentStart() const noexcept
    {
        return std::chrono::duration<double, std::milli>(clock::now() - m_segmentStart).count();
    }
}   // namespace tempo
