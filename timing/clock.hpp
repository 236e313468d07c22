// ────────────────────────────────────────────
//  File: clock.hpp · Created by Yash Patel · 2-2-2026
// ────────────────────────────────────────────

#pragma once

namespace tempo
{
    // all times are in milliseconds
    class Clock
    {
        public:
            virtual ~Clock() = default;

            virtual double getCurrentTime() const noexcept = 0;
            virtual double getRate() const noexcept = 0;
            virtual bool isRunning() const noexcept = 0;
    };

    class AdjustableClock : public Clock
    {
        public:
            virtual void start() noexcept = 0;
            virtual void stop() noexcept = 0;
            virtual void reset() noexcept = 0;
            virtual bool seek(double position) noexcept = 0;
            virtual void setRate(double rate) noexcept = 0;
    };

    // a clock that only advances when a frame is processed
    class FrameBasedClock : public Clock
    {
        public:
            virtual void processFrame() noexcept = 0;
            virtual double getElapsedFrameTime() const noexcept = 0;
    };
}   // namespace tempo
