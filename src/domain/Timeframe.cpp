#include "domain/Timeframe.hpp"

#include <array>

namespace vpb::domain {
namespace {

constexpr TimestampMs kMinute = 60'000;
constexpr TimestampMs kHour = 60 * kMinute;
constexpr TimestampMs kDay = 24 * kHour;
constexpr TimestampMs kWeek = 7 * kDay;

struct TimeframeSpec {
    std::string_view label;
    TimestampMs baseMs;
    int group;
};

constexpr std::array<TimeframeSpec, 14> kTimeframes{{
    {"1m", kMinute, 1},
    {"2m", kMinute, 2},
    {"3m", kMinute, 3},
    {"4m", kMinute, 4},
    {"5m", 5 * kMinute, 1},
    {"10m", 5 * kMinute, 2},
    {"15m", 15 * kMinute, 1},
    {"30m", 30 * kMinute, 1},
    {"45m", 15 * kMinute, 3},
    {"1h", kHour, 1},
    {"2h", kHour, 2},
    {"4h", kHour, 4},
    {"1D", kDay, 1},
    {"1W", kWeek, 1},
}};

// Day and week labels are accepted in either case; minutes stay lower case so that
// "1M" is never mistaken for a minute timeframe.
std::string canonicalLabel(std::string_view label) {
    std::string out{label};
    if (!out.empty() && (out.back() == 'd' || out.back() == 'w')) {
        out.back() = static_cast<char>(out.back() - 'a' + 'A');
    }
    return out;
}

}  // namespace

Timeframe Timeframe::base() const {
    return Timeframe{resolutionLabel(baseMs), baseMs, 1};
}

std::optional<Timeframe> timeframeFromLabel(std::string_view label) {
    const auto canonical = canonicalLabel(label);
    for (const auto& spec : kTimeframes) {
        if (spec.label == canonical) {
            return Timeframe{std::string{spec.label}, spec.baseMs, spec.group};
        }
    }
    return std::nullopt;
}

std::string resolutionLabel(TimestampMs ms) {
    if (ms <= 0) {
        return "";
    }
    if (ms % kWeek == 0) {
        return std::to_string(ms / kWeek) + "W";
    }
    if (ms % kDay == 0) {
        return std::to_string(ms / kDay) + "D";
    }
    if (ms % kHour == 0) {
        return std::to_string(ms / kHour) + "h";
    }
    if (ms % kMinute == 0) {
        return std::to_string(ms / kMinute) + "m";
    }
    return std::to_string(ms) + "ms";
}

const std::vector<std::string>& supportedTimeframes() {
    static const std::vector<std::string> labels = [] {
        std::vector<std::string> out;
        out.reserve(kTimeframes.size());
        for (const auto& spec : kTimeframes) {
            out.emplace_back(spec.label);
        }
        return out;
    }();
    return labels;
}

}  // namespace vpb::domain
