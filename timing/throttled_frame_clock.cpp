// ────────────────────────────────────────────
//  File: throttled_frame_clock.cpp · Created by Yash Patel · 10-28-2025
// ────────────────────────────────────────────

#include "throttled_frame_clock.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <utility>

#include "stopwatch_clock.hpp"
#include "core/tempo_config.hpp"
#include "utils/logger.hpp"

namespace tempo
{
    ThrottledFrameClock::ThrottledFrameClock() noexcept
        : ThrottledFrameClock(std::make_shared<StopwatchClock>(true), std::make_shared<ThreadWaitStrategy>())
    {
    }

    ThrottledFrameClock::ThrottledFrameClock(std::shared_ptr<Clock> source, std::shared_ptr<WaitStrategy> waitStrategy) noexcept
        : FramedClock(std::move(source))
        , m_waitStrategy(std::move(waitStrategy))
        , m_statistics(config::kAverageSmoothing)
        , m_maximumUpdateHz(config::kDefaultMaximumUpdateHz)
        , m_alwaysYield(config::kDefaultAlwaysYield)
        , m_accumulatedSleepError(0.0)
        , m_behindBudget(false)
    {
        if (!m_waitStrategy)
        {
            TEMPO_LOG_ERROR("ThrottledFrameClock: wait strategy is null, falling back to thread sleep");
            m_waitStrategy = std::make_shared<ThreadWaitStrategy>();
        }
    }

    void ThrottledFrameClock::processFrame() noexcept
    {
        FramedClock::processFrame();

        throttleFrameTime();

        // current time may have been re-anchored after the wait
        m_statistics.update(getElapsedFrameTime());
    }

    void ThrottledFrameClock::setMaximumUpdateHz(int hz) noexcept
    {
        if (hz == m_maximumUpdateHz)
        {
            return;
        }

        m_maximumUpdateHz = hz;
        if (hz > 0)
        {
            TEMPO_LOG_INFO("ThrottledFrameClock: frame rate capped at %d Hz (%.3f ms per frame)", hz, getTargetFrameTime());
        }
        else
        {
            TEMPO_LOG_INFO("ThrottledFrameClock: frame rate cap disabled");
        }
    }

    void ThrottledFrameClock::setAlwaysYield(bool alwaysYield) noexcept
    {
        m_alwaysYield = alwaysYield;
    }

    double ThrottledFrameClock::getTargetFrameTime() const noexcept
    {
        if (m_maximumUpdateHz <= 0)
        {
            return 0.0;
        }

        return 1000.0 / static_cast<double>(m_maximumUpdateHz);
    }

    void ThrottledFrameClock::throttleFrameTime() noexcept
    {
        const double targetMilliseconds = getTargetFrameTime();
        const double elapsedFrameTime = getElapsedFrameTime();
        int timeToSleepFloored = 0;

        if (targetMilliseconds > 0.0)
        {
            if (elapsedFrameTime < targetMilliseconds)
            {
                if (m_behindBudget)
                {
                    TEMPO_LOG_DEBUG("ThrottledFrameClock: back on budget (%.3f ms of %.3f ms)", elapsedFrameTime, targetMilliseconds);
                    m_behindBudget = false;
                }

                // the wait primitive only honours whole milliseconds; a source that
                // ran backwards never asks for more than one budget
                const double timeToSleep = std::min(targetMilliseconds - elapsedFrameTime, targetMilliseconds);
                timeToSleepFloored = static_cast<int>(std::floor(timeToSleep));

                assert(timeToSleepFloored >= 0);
                if (timeToSleepFloored < 0)
                {
                    timeToSleepFloored = 0;
                }

                // carry the fractional part and pay it back once it rounds to a whole unit
                m_accumulatedSleepError += timeToSleep - timeToSleepFloored;
                double roundedError = std::nearbyint(m_accumulatedSleepError);

                // can't sleep a negative amount of time, nor pay back more than a budget at once
                roundedError = std::max(roundedError, -static_cast<double>(timeToSleepFloored));
                roundedError = std::min(roundedError, std::ceil(targetMilliseconds));
                const int compensation = static_cast<int>(roundedError);

                m_accumulatedSleepError -= compensation;
                timeToSleepFloored += compensation;

                // zero-length waits are covered by the yield below
                if (timeToSleepFloored > 0)
                {
                    m_waitStrategy->sleepFor(std::chrono::milliseconds(timeToSleepFloored));
                }

                // the wait only guarantees a lower bound; book the actual time spent
                const double afterSleepTime = getSourceTime();
                m_accumulatedSleepError += timeToSleepFloored - (afterSleepTime - getCurrentTime());
                setCurrentTime(afterSleepTime);
            }
            else
            {
                if (!m_behindBudget)
                {
                    TEMPO_LOG_DEBUG("ThrottledFrameClock: behind budget (%.3f ms of %.3f ms)", elapsedFrameTime, targetMilliseconds);
                    m_behindBudget = true;
                }

                // start fresh with a debt equal to the overrun to damp jitter
                const double spareTime = elapsedFrameTime - targetMilliseconds;
                m_accumulatedSleepError = -spareTime;
            }
        }

        if (timeToSleepFloored == 0 && m_alwaysYield)
        {
            m_waitStrategy->yield();
        }
    }
}   // namespace tempo
