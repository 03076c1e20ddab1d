#pragma once

#include <optional>

#include "core/ChunkStore.hpp"
#include "core/PlannerConfig.hpp"
#include "domain/Types.h"

namespace vpb::core {

struct FetchPlan {
    // Extends coverage towards earlier time. On a first load this is the whole window.
    std::optional<domain::TimeRange> backfill;
    // Extends coverage towards later time.
    std::optional<domain::TimeRange> prefetch;

    bool empty() const noexcept { return !backfill && !prefetch; }
};

struct BufferSizes {
    domain::TimestampMs left{0};
    domain::TimestampMs right{0};
};

class ViewportPlanner {
public:
    explicit ViewportPlanner(PlannerConfig config = {});

    // Decides which ranges, if any, to fetch for the visible domain. Updates the
    // entry's viewport, velocity history and recently-requested record.
    FetchPlan plan(Entry& entry, domain::TimeRange visible, Clock::time_point now) const;

    BufferSizes bufferSizes(const domain::TimeRange& visible,
                            domain::TimestampMs barMs,
                            const VelocitySample& velocity) const;

    const PlannerConfig& config() const noexcept { return config_; }

    static VelocitySample estimateVelocity(const ViewportSample& previous,
                                           const domain::TimeRange& current,
                                           Clock::time_point now);

private:
    bool movedBeyondJitter(const domain::TimeRange& previous, const domain::TimeRange& current) const;
    void pushVelocity(Entry& entry, const VelocitySample& sample) const;
    domain::TimestampMs maxRequestSpan(domain::TimestampMs barMs) const;
    domain::TimeRange initialWindow(const domain::TimeRange& visible,
                                    const BufferSizes& buffers,
                                    domain::TimestampMs barMs) const;
    bool admit(Entry& entry, const domain::TimeRange& candidate, Clock::time_point now) const;

    PlannerConfig config_;
};

// Drops expired records, then reports whether `range` overlaps one still inside `window`.
bool wasRecentlyRequested(Entry& entry,
                          const domain::TimeRange& range,
                          Clock::time_point now,
                          std::chrono::milliseconds window);

// Remembers an attempted range; an identical record only has its timestamp refreshed.
void recordRequest(Entry& entry, const domain::TimeRange& range, Clock::time_point now);

// Drops the record of a range that was never loaded (cancelled or failed), so it can be planned again.
void forgetRequest(Entry& entry, const domain::TimeRange& range);

}  // namespace vpb::core
