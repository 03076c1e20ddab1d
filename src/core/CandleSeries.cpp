#include "core/CandleSeries.hpp"

#include <algorithm>
#include <iterator>

namespace vpb::core {

domain::Series mergeSeries(const domain::Series& a, const domain::Series& b) {
    domain::Series out;
    out.reserve(a.size() + b.size());

    auto pushUnique = [&out](const domain::Candle& candle) {
        if (out.empty() || out.back().openTime != candle.openTime) {
            out.push_back(candle);
        }
    };

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() || j < b.size()) {
        if (j >= b.size() || (i < a.size() && a[i].openTime <= b[j].openTime)) {
            pushUnique(a[i]);
            ++i;
        } else {
            pushUnique(b[j]);
            ++j;
        }
    }
    return out;
}

domain::Series aggregate(const domain::Series& series, std::size_t groupSize) {
    if (groupSize <= 1) {
        return series;
    }

    domain::Series out;
    out.reserve((series.size() + groupSize - 1) / groupSize);

    for (std::size_t begin = 0; begin < series.size(); begin += groupSize) {
        const auto end = std::min(series.size(), begin + groupSize);
        const auto& first = series[begin];

        domain::Candle bucket{};
        bucket.openTime = first.openTime;
        bucket.open = first.open;
        bucket.high = first.high;
        bucket.low = first.low;
        bucket.close = series[end - 1].close;

        for (std::size_t k = begin; k < end; ++k) {
            const auto& candle = series[k];
            bucket.high = std::max(bucket.high, candle.high);
            bucket.low = std::min(bucket.low, candle.low);
            if (candle.volume) {
                bucket.volume = bucket.volume.value_or(0.0) + *candle.volume;
            }
        }
        out.push_back(bucket);
    }
    return out;
}

domain::Series aggregateAligned(const domain::Series& series, domain::TimestampMs barMs) {
    if (barMs <= 0) {
        return series;
    }

    domain::Series out;
    for (const auto& candle : series) {
        const auto bucketStart = domain::align_down_ms(candle.openTime, barMs);
        if (out.empty() || out.back().openTime != bucketStart) {
            domain::Candle bucket = candle;
            bucket.openTime = bucketStart;
            out.push_back(bucket);
            continue;
        }
        auto& bucket = out.back();
        bucket.high = std::max(bucket.high, candle.high);
        bucket.low = std::min(bucket.low, candle.low);
        bucket.close = candle.close;
        if (candle.volume) {
            bucket.volume = bucket.volume.value_or(0.0) + *candle.volume;
        }
    }
    return out;
}

domain::Series normalizeSeries(domain::Series series) {
    std::stable_sort(series.begin(), series.end(),
                     [](const domain::Candle& lhs, const domain::Candle& rhs) {
                         return lhs.openTime < rhs.openTime;
                     });
    auto last = std::unique(series.begin(), series.end(),
                            [](const domain::Candle& lhs, const domain::Candle& rhs) {
                                return lhs.openTime == rhs.openTime;
                            });
    series.erase(last, series.end());
    return series;
}

domain::Series clipSeries(const domain::Series& series, const domain::TimeRange& range) {
    auto first = std::lower_bound(series.begin(), series.end(), range.start,
                                  [](const domain::Candle& candle, domain::TimestampMs t) {
                                      return candle.openTime < t;
                                  });
    auto last = std::upper_bound(first, series.end(), range.end,
                                 [](domain::TimestampMs t, const domain::Candle& candle) {
                                     return t < candle.openTime;
                                 });
    return domain::Series(first, last);
}

bool isStrictlyAscending(const domain::Series& series) noexcept {
    return std::adjacent_find(series.begin(), series.end(),
                              [](const domain::Candle& lhs, const domain::Candle& rhs) {
                                  return lhs.openTime >= rhs.openTime;
                              }) == series.end();
}

}  // namespace vpb::core
