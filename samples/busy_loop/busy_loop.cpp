// ────────────────────────────────────────────
//  File: busy_loop.cpp · Created by Yash Patel · 2-6-2026
// ────────────────────────────────────────────

#include "busy_loop.hpp"

#include <chrono>

#include "utils/logger.hpp"

namespace tempo
{
    void spinFor(double milliseconds) noexcept
    {
        using clock = std::chrono::steady_clock;

        const auto deadline = clock::now() + std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double, std::milli>(milliseconds));
        while (clock::now() < deadline)
        {
        }
    }

    BusyLoop::BusyLoop(double workMs, uint64_t frameCount) noexcept
        : m_workMs(workMs)
        , m_frameCount(frameCount)
        , m_framesDone(0)
    {
    }

    bool BusyLoop::initialize(std::weak_ptr<const ThrottledFrameClock> clock) noexcept
    {
        auto clockLocked = clock.lock();
        if (!clockLocked)
        {
            return false;
        }

        if (m_workMs < 0.0)
        {
            TEMPO_LOG_ERROR("BusyLoop: negative work time %.3f ms", m_workMs);
            return false;
        }

        TEMPO_LOG_INFO("BusyLoop: %.3f ms of work per frame for %llu frames (budget %.3f ms)", m_workMs,
                       static_cast<unsigned long long>(m_frameCount), clockLocked->getTargetFrameTime());
        return true;
    }

    bool BusyLoop::update(double /* elapsedMs */) noexcept
    {
        spinFor(m_workMs);
        ++m_framesDone;
        return true;
    }
}   // namespace tempo
