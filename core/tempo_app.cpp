// ────────────────────────────────────────────
//  File: tempo_app.cpp · Created by Yash Patel · 6-28-2025
// ────────────────────────────────────────────

#include "tempo_app.hpp"

#include <cstdlib>
#include <utility>

#include "tempo_config.hpp"
#include "workload.hpp"
#include "timing/throttled_frame_clock.hpp"
#include "utils/logger.hpp"

namespace tempo
{
    TempoApp::TempoApp() noexcept
        : m_clock(nullptr)
        , m_workload(nullptr)
    {
    }

    TempoApp::~TempoApp()
    {
        shutdown();
    }

    bool TempoApp::initialize(std::unique_ptr<Workload> workload, std::shared_ptr<ThrottledFrameClock> clock) noexcept
    {
        // acquire workload
        m_workload = std::move(workload);
        if (!m_workload)
        {
            TEMPO_LOG_ERROR("TempoApp::initialize failed: workload is null");
            return false;
        }

        // create the paced clock unless the caller supplied one
        m_clock = std::move(clock);
        if (!m_clock)
        {
            m_clock = std::make_shared<ThrottledFrameClock>();
        }

        if (!m_workload->initialize(m_clock))
        {
            TEMPO_LOG_ERROR("TempoApp::initialize failed: workload '%s' did not initialize", m_workload->getName());
            m_workload.reset();
            return false;
        }

        TEMPO_LOG_INFO("TempoApp::initialize successful: '%s' capped at %d Hz", m_workload->getName(), m_clock->getMaximumUpdateHz());
        return true;
    }

    int TempoApp::run() noexcept
    {
        if (!m_clock || !m_workload)
        {
            TEMPO_LOG_ERROR("TempoApp::run called before a successful initialize");
            return EXIT_FAILURE;
        }

        while (!m_workload->shouldStop())
        {
            // sample time, pace the loop and refresh the averages
            m_clock->processFrame();

            // one frame of work
            if (!m_workload->update(m_clock->getElapsedFrameTime()))
            {
                TEMPO_LOG_ERROR("TempoApp::run: '%s' failed on frame %llu", m_workload->getName(),
                                static_cast<unsigned long long>(m_clock->getFrameCount()));
                return EXIT_FAILURE;
            }

            if (m_clock->getFrameCount() % config::kStatsLogInterval == 0)
            {
                logStatistics("running");
            }
        }

        logStatistics("finished");
        return EXIT_SUCCESS;
    }

    void TempoApp::shutdown() noexcept
    {
        // release in reverse order of creation
        m_workload.reset();
        m_clock.reset();
    }

    std::shared_ptr<const ThrottledFrameClock> TempoApp::getClock() const noexcept
    {
        return m_clock;
    }

    void TempoApp::logStatistics(const char* label) const noexcept
    {
        TEMPO_LOG_INFO("%s: frames=%llu avg frame=%.3f ms avg fps=%.1f sleep error=%.3f ms", label,
                       static_cast<unsigned long long>(m_clock->getFrameCount()),
                       m_clock->getAverageFrameTime(), m_clock->getAverageFps(), m_clock->getAccumulatedSleepError());
    }
}   // namespace tempo
