// ────────────────────────────────────────────
//  File: tempo_config.hpp · Created by Yash Patel · 8-19-2025
// ────────────────────────────────────────────

#pragma once

#include <cstdint>

namespace tempo::config
{
    // logging
    inline constexpr const char* kLogFile                  = "tempolog.txt";

    // throttling
    inline constexpr int kDefaultMaximumUpdateHz           = 1000;
    inline constexpr bool kDefaultAlwaysYield              = true;

    // frame statistics
    inline constexpr double kAverageSmoothing              = 0.05;
    inline constexpr uint64_t kStatsLogInterval            = 240;   // frames between stats log lines

    // demo loop defaults
    inline constexpr int kDemoUpdateHz                     = 120;
    inline constexpr uint64_t kDemoFrameCount              = 1200;
    inline constexpr double kDemoWorkMs                    = 3.0;
    inline constexpr double kJitterSpikeMs                 = 25.0;
    inline constexpr uint64_t kJitterSpikeInterval         = 90;
} // namespace tempo::config
