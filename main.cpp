// ────────────────────────────────────────────
//  File: main.cpp · Created by Yash Patel · 6-22-2025
// ────────────────────────────────────────────

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>

#include "core/tempo_app.hpp"
#include "core/tempo_config.hpp"
#include "samples/busy_loop/busy_loop.hpp"
#include "timing/throttled_frame_clock.hpp"
#include "utils/logger.hpp"

namespace
{
    bool parseLong(const char* text, long& out) noexcept
    {
        char* end = nullptr;
        errno = 0;
        const long value = std::strtol(text, &end, 10);
        if (errno != 0 || end == text || *end != '\0')
        {
            return false;
        }
        out = value;
        return true;
    }

    bool parseDouble(const char* text, double& out) noexcept
    {
        char* end = nullptr;
        errno = 0;
        const double value = std::strtod(text, &end);
        if (errno != 0 || end == text || *end != '\0')
        {
            return false;
        }
        out = value;
        return true;
    }
}

// usage: tempo_demo [maxHz] [frames] [workMs] [logLevel]
int main(int argc, char* argv[])
{
    // start the logging thread early
    auto& logger = tempo::Logger::getInstance();
    logger.setConsoleOutput(true);

    long hz = tempo::config::kDemoUpdateHz;
    long frames = static_cast<long>(tempo::config::kDemoFrameCount);
    double workMs = tempo::config::kDemoWorkMs;

    tempo::Logger::Level minLevel = tempo::Logger::Level::Info;

    if ((argc > 1 && (!parseLong(argv[1], hz) || hz > INT_MAX || hz < INT_MIN)) ||
        (argc > 2 && (!parseLong(argv[2], frames) || frames < 0)) ||
        (argc > 3 && !parseDouble(argv[3], workMs)) ||
        (argc > 4 && !tempo::Logger::levelFromString(argv[4], minLevel)))
    {
        TEMPO_LOG_FATAL("usage: %s [maxHz] [frames] [workMs] [trace|debug|info|warn|error|fatal]", argv[0]);
        logger.terminate();
        return EXIT_FAILURE;
    }

    if (argc > 4)
    {
        logger.setMinLevel(minLevel);
    }

    auto clock = std::make_shared<tempo::ThrottledFrameClock>();
    clock->setMaximumUpdateHz(static_cast<int>(hz));

    // app init
    tempo::TempoApp app;
    if (!app.initialize(std::make_unique<tempo::BusyLoop>(workMs, static_cast<uint64_t>(frames)), clock))
    {
        TEMPO_LOG_FATAL("failed to initialize tempo application");
        logger.terminate();
        return EXIT_FAILURE;
    }

    // run the paced loop
    const int exitCode = app.run();

    // clean up logging thread
    app.shutdown();
    logger.terminate();
    return exitCode;
}
