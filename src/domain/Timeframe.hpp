#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace vpb::domain {

// A chart timeframe: a native provider resolution plus how many native bars make one
// displayed bar. "45m" is served as 15m bars grouped by 3.
struct Timeframe {
    std::string label;
    TimestampMs baseMs{0};
    int group{1};

    bool valid() const noexcept { return baseMs > 0 && group > 0; }
    TimestampMs barMs() const noexcept { return baseMs * group; }
    Timeframe base() const;
};

std::optional<Timeframe> timeframeFromLabel(std::string_view label);
std::string resolutionLabel(TimestampMs ms);
const std::vector<std::string>& supportedTimeframes();

}  // namespace vpb::domain
