// ────────────────────────────────────────────
//  File: busy_loop.hpp · Created by Yash Patel · 2-6-2026
// ────────────────────────────────────────────

#pragma once

#include <cstdint>

#include "core/workload.hpp"

namespace tempo
{
    // burns a fixed amount of cpu time per frame for a fixed number of frames
    class BusyLoop final : public Workload
    {
        public:
            // creation and destruction
            BusyLoop(double workMs, uint64_t frameCount) noexcept;

            // Workload
            bool initialize(std::weak_ptr<const ThrottledFrameClock> clock) noexcept override;
            bool update(double elapsedMs) noexcept override;
            bool shouldStop() const noexcept override   { return m_framesDone >= m_frameCount; }
            const char* getName() const noexcept override { return "busy_loop"; }

        private:
            double      m_workMs;
            uint64_t    m_frameCount;
            uint64_t    m_framesDone;
    };

    // spin the calling thread for the given number of milliseconds
    void spinFor(double milliseconds) noexcept;
}   // namespace tempo
