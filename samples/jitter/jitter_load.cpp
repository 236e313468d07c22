// ────────────────────────────────────────────
//  File: jitter_load.cpp · Created by Yash Patel · 2-9-2026
// ────────────────────────────────────────────

#include "jitter_load.hpp"

#include "samples/busy_loop/busy_loop.hpp"
#include "utils/logger.hpp"

namespace tempo
{
    JitterLoad::JitterLoad(double meanWorkMs, double spikeMs, uint64_t spikeInterval, uint64_t frameCount, uint32_t seed) noexcept
        : m_rng(seed)
        , m_meanWorkMs(meanWorkMs)
        , m_spikeMs(spikeMs)
        , m_spikeInterval(spikeInterval)
        , m_frameCount(frameCount)
        , m_framesDone(0)
        , m_afterSpike(false)
    {
    }

    bool JitterLoad::initialize(std::weak_ptr<const ThrottledFrameClock> clock) noexcept
    {
        m_clock = clock;
        auto clockLocked = m_clock.lock();
        if (!clockLocked)
        {
            return false;
        }

        if (m_meanWorkMs < 0.0 || m_spikeMs < 0.0)
        {
            TEMPO_LOG_ERROR("JitterLoad: negative work time (mean %.3f ms, spike %.3f ms)", m_meanWorkMs, m_spikeMs);
            return false;
        }

        if (m_spikeInterval == 0)
        {
            TEMPO_LOG_ERROR("JitterLoad: spike interval must be positive");
            return false;
        }

        // cost drawn uniformly within half the mean either side
        m_work = std::uniform_real_distribution<double>(m_meanWorkMs * 0.5, m_meanWorkMs * 1.5);

        TEMPO_LOG_INFO("JitterLoad: work %.3f..%.3f ms, %.3f ms spike every %llu frames, budget %.3f ms",
                       m_work.a(), m_work.b(), m_spikeMs,
                       static_cast<unsigned long long>(m_spikeInterval), clockLocked->getTargetFrameTime());
        return true;
    }

    bool JitterLoad::update(double elapsedMs) noexcept
    {
        auto clock = m_clock.lock();
        if (!clock)
        {
            TEMPO_LOG_ERROR("JitterLoad: clock released while running");
            return false;
        }

        // frame following a spike: report the debt the clock carries forward
        if (m_afterSpike)
        {
            TEMPO_LOG_INFO("JitterLoad: spike frame took %.3f ms, sleep error now %.3f ms",
                           elapsedMs, clock->getAccumulatedSleepError());
            m_afterSpike = false;
        }

        ++m_framesDone;
        if (m_framesDone % m_spikeInterval == 0)
        {
            spinFor(m_spikeMs);
            m_afterSpike = true;
        }
        else
        {
            spinFor(m_work(m_rng));
        }

        return true;
    }
}   // namespace tempo
