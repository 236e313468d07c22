// ────────────────────────────────────────────
//  File: main.cpp · Created by Yash Patel · 2-9-2026
// ────────────────────────────────────────────

#include <cstdlib>
#include <memory>
#include <utility>

#include "core/tempo_app.hpp"
#include "core/tempo_config.hpp"
#include "samples/jitter/jitter_load.hpp"
#include "timing/throttled_frame_clock.hpp"
#include "utils/logger.hpp"

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[])
{
    // start the logging thread early
    auto& logger = tempo::Logger::getInstance();
    logger.setConsoleOutput(true);

    auto clock = std::make_shared<tempo::ThrottledFrameClock>();
    clock->setMaximumUpdateHz(tempo::config::kDemoUpdateHz);

    auto workload = std::make_unique<tempo::JitterLoad>(
        tempo::config::kDemoWorkMs, tempo::config::kJitterSpikeMs, tempo::config::kJitterSpikeInterval,
        tempo::config::kDemoFrameCount, std::random_device{}());

    // app init
    tempo::TempoApp app;
    if (!app.initialize(std::move(workload), clock))
    {
        TEMPO_LOG_FATAL("failed to initialize jitter sample");
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
