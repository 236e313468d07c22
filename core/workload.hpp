// ────────────────────────────────────────────
//  File: workload.hpp · Created by Yash Patel · 7-24-2025
// ────────────────────────────────────────────

#pragma once

#include <memory>

#include "timing/throttled_frame_clock.hpp"

namespace tempo
{
    class Workload
    {
        public:
            virtual ~Workload() = default;

            // core per-frame interface: acquire resources, then do one frame of work per call
            virtual bool initialize(std::weak_ptr<const ThrottledFrameClock> clock) noexcept = 0;
            virtual bool update(double elapsedMs) noexcept = 0;
            virtual bool shouldStop() const noexcept = 0;

            virtual const char* getName() const noexcept { return "workload"; }
    };
}   // namespace tempo
