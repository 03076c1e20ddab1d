#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace vpb::domain {

using TimestampMs = long long;
using Symbol = std::string;

inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    return (step > 0) ? (t / step) * step : t;
}

inline TimestampMs align_up_ms(TimestampMs t, TimestampMs step) {
    return (step > 0) ? ((t + step - 1) / step) * step : t;
}

// Closed interval [start, end] in epoch milliseconds.
struct TimeRange {
    TimestampMs start{0};
    TimestampMs end{0};

    TimestampMs span() const noexcept { return end - start; }
    bool contains(TimestampMs t) const noexcept { return t >= start && t <= end; }
    bool overlaps(const TimeRange& other) const noexcept {
        return std::max(start, other.start) <= std::min(end, other.end);
    }
    // True when the two closed intervals share a point or sit on adjacent milliseconds.
    bool touches(const TimeRange& other) const noexcept {
        return start <= other.end + 1 && other.start <= end + 1;
    }

    static TimeRange ordered(TimestampMs a, TimestampMs b) noexcept {
        return TimeRange{std::min(a, b), std::max(a, b)};
    }
};

inline TimeRange envelope(const TimeRange& a, const TimeRange& b) noexcept {
    return TimeRange{std::min(a.start, b.start), std::max(a.end, b.end)};
}

inline bool operator==(const TimeRange& lhs, const TimeRange& rhs) noexcept {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const TimeRange& lhs, const TimeRange& rhs) noexcept {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& out, const TimeRange& range) {
    return out << '[' << range.start << ", " << range.end << ']';
}

struct Candle {
    TimestampMs openTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    std::optional<double> volume{};
};

inline bool operator==(const Candle& lhs, const Candle& rhs) noexcept {
    return lhs.openTime == rhs.openTime && lhs.open == rhs.open && lhs.high == rhs.high
        && lhs.low == rhs.low && lhs.close == rhs.close && lhs.volume == rhs.volume;
}

inline bool operator!=(const Candle& lhs, const Candle& rhs) noexcept {
    return !(lhs == rhs);
}

using Series = std::vector<Candle>;
using SeriesPtr = std::shared_ptr<const Series>;

}  // namespace vpb::domain
