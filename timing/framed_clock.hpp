// ────────────────────────────────────────────
//  File: framed_clock.hpp · Created by Yash Patel · 2-2-2026
// ────────────────────────────────────────────

#pragma once

#include <cstdint>
#include <memory>

#include "clock.hpp"

namespace tempo
{
    // Samples a source clock once per frame. Between calls to processFrame()
    // the reported time stays frozen, so every consumer of a frame sees the
    // same timestamp.
    class FramedClock : public FrameBasedClock
    {
        public:
            // creation and destruction
            explicit FramedClock(std::shared_ptr<Clock> source) noexcept;
            virtual ~FramedClock() = default;

            // FrameBasedClock
            void processFrame() noexcept override;
            double getElapsedFrameTime() const noexcept override    { return m_currentTime - m_lastFrameTime; }

            // Clock
            double getCurrentTime() const noexcept override         { return m_currentTime; }
            double getRate() const noexcept override                { return m_source->getRate(); }
            bool isRunning() const noexcept override                { return m_source->isRunning(); }

            // accessors
            double getLastFrameTime() const noexcept                { return m_lastFrameTime; }
            double getSourceTime() const noexcept                   { return m_source->getCurrentTime(); }
            uint64_t getFrameCount() const noexcept                 { return m_frameCount; }
            const std::shared_ptr<Clock>& getSource() const noexcept { return m_source; }

        protected:
            void setCurrentTime(double time) noexcept               { m_currentTime = time; }

        private:
            std::shared_ptr<Clock>  m_source;
            double                  m_currentTime;
            double                  m_lastFrameTime;
            uint64_t                m_frameCount;
    };
}   // namespace tempo
