#pragma once

#include <cstddef>

#include "domain/Types.h"

namespace vpb::core {

// Two-pointer merge of ascending, timestamp-unique sequences. When both inputs hold
// the same timestamp the candle from `a` is kept.
domain::Series mergeSeries(const domain::Series& a, const domain::Series& b);

// Rolls consecutive groups of `groupSize` candles into one (the last group may be
// short). groupSize <= 1 returns the input unchanged.
domain::Series aggregate(const domain::Series& series, std::size_t groupSize);

// Rolls an ascending series into bars of `barMs` aligned to the epoch: every candle lands in
// the bucket opening at align_down_ms(openTime, barMs), however many candles that bucket has.
domain::Series aggregateAligned(const domain::Series& series, domain::TimestampMs barMs);

// Sorts by timestamp and drops repeated timestamps, keeping the first occurrence.
domain::Series normalizeSeries(domain::Series series);

domain::Series clipSeries(const domain::Series& series, const domain::TimeRange& range);

bool isStrictlyAscending(const domain::Series& series) noexcept;

}  // namespace vpb::core
