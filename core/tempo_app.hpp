// ────────────────────────────────────────────
//  File: tempo_app.hpp · Created by Yash Patel · 6-28-2025
// ────────────────────────────────────────────

#pragma once

#include <memory>

namespace tempo
{
    // forward declarations
    class ThrottledFrameClock;
    class Workload;

    class TempoApp final
    {
        public:
            // creation and destruction
            TempoApp() noexcept;
            ~TempoApp();

            // disable copy and move semantics to enforce unique ownership
            TempoApp(const TempoApp&) = delete;
            TempoApp& operator=(const TempoApp&) = delete;
            TempoApp(TempoApp&&) = delete;
            TempoApp& operator=(TempoApp&&) = delete;

            // app lifecycle functions; a null clock selects the configured default
            bool initialize(std::unique_ptr<Workload> workload, std::shared_ptr<ThrottledFrameClock> clock = nullptr) noexcept;
            int run() noexcept;
            void shutdown() noexcept;

            // accessors
            std::shared_ptr<const ThrottledFrameClock> getClock() const noexcept;

        private:
            void logStatistics(const char* label) const noexcept;

        private:
            std::shared_ptr<ThrottledFrameClock>    m_clock;
            std::unique_ptr<Workload>               m_workload;
    };
}   // namespace tempo
