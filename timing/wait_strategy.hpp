// ────────────────────────────────────────────
//  File: wait_strategy.hpp · Created by Yash Patel · 2-3-2026
// ────────────────────────────────────────────

#pragma once

#include <chrono>

namespace tempo
{
    class WaitStrategy
    {
        public:
            virtual ~WaitStrategy() = default;

            // block for at least the given duration; may overshoot
            virtual void sleepFor(std::chrono::milliseconds duration) noexcept = 0;

            // give the scheduler a chance to run other threads without a timed wait
            virtual void yield() noexcept = 0;
    };

    class ThreadWaitStrategy final : public WaitStrategy
    {
        public:
            void sleepFor(std::chrono::milliseconds duration) noexcept override;
            void yield() noexcept override;
    };
}   // namespace tempo
