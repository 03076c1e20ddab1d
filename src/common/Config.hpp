#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"
#include "core/PlannerConfig.hpp"

namespace vpb::common {

struct Config {
    vpb::log::Level logLevel = vpb::log::Level::Info;
    std::string provider = "synthetic";
    std::string symbol = "BTCUSDT";
    std::string timeframe = "5m";

    std::uint32_t viewportMinutes = 60;
    std::uint32_t panSteps = 12;
    std::int32_t panStepMinutes = -20;
    std::uint32_t panIntervalMs = 250;

    std::size_t fetchThreads = 2;
    int httpTimeoutSec = 20;
    std::uint32_t syntheticLatencyMs = 40;

    core::PlannerConfig planner{};

    static Config fromArgs(int argc, char** argv);
};

}  // namespace vpb::common
