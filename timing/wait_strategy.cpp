// ────────────────────────────────────────────
//  File: wait_strategy.cpp · Created by Yash Patel · 2-3-2026
// ────────────────────────────────────────────

#include "wait_strategy.hpp"

#include <thread>

namespace tempo
{
    void ThreadWaitStrategy::sleepFor(std::chrono::milliseconds duration) noexcept
    {
        if (duration.count() <= 0)
        {
            return;
        }

        std::this_thread::sleep_for(duration);
    }

    void ThreadWaitStrategy::yield() noexcept
    {
        std::this_thread::yield();
    }
}   // namespace tempo
