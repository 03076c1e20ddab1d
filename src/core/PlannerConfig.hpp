#pragma once

#include <chrono>
#include <cstddef>

namespace vpb::core {

struct PlannerConfig {
    // Buffer per side, in viewport spans.
    double bufferMultiple = 3.0;
    // Pan speed (chart milliseconds per wall-clock second) that doubles the buffer on
    // the side being panned towards.
    double velocityK = 3'600'000.0;
    double maxVelocityFactor = 3.0;
    // Floor for each side's buffer, in native bars.
    std::size_t minBars = 30;
    // Cap for a single request, in native bars.
    std::size_t maxBars = 1000;
    // Extend a side when the viewport sits within this fraction of the loaded span from it.
    double proximityThreshold = 0.2;
    // Viewport edge moves below this fraction of the span are treated as jitter.
    double jitterFraction = 0.05;
    std::chrono::milliseconds recentWindow{30'000};
    std::size_t velocityHistory = 8;
};

}  // namespace vpb::core
