// ────────────────────────────────────────────
//  File: jitter_load.hpp · Created by Yash Patel · 2-9-2026
// ────────────────────────────────────────────

#pragma once

#include <cstdint>
#include <random>

#include "core/workload.hpp"

namespace tempo
{
    // Random per-frame cost around a mean, with a long spike every few
    // frames to push the loop behind budget. Logs how the clock reacts to
    // each spike.
    class JitterLoad final : public Workload
    {
        public:
            // creation and destruction
            JitterLoad(double meanWorkMs, double spikeMs, uint64_t spikeInterval, uint64_t frameCount, uint32_t seed) noexcept;

            // Workload
            bool initialize(std::weak_ptr<const ThrottledFrameClock> clock) noexcept override;
            bool update(double elapsedMs) noexcept override;
            bool shouldStop() const noexcept override       { return m_framesDone >= m_frameCount; }
            const char* getName() const noexcept override   { return "jitter"; }

        private:
            std::weak_ptr<const ThrottledFrameClock> m_clock;
            std::mt19937                             m_rng;
            std::uniform_real_distribution<double>   m_work;

            double      m_meanWorkMs;
            double      m_spikeMs;
            uint64_t    m_spikeInterval;
            uint64_t    m_frameCount;
            uint64_t    m_framesDone;
            bool        m_afterSpike;
    };
}   // namespace tempo
