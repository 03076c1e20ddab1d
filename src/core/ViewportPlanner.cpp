#include "core/ViewportPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace vpb::core {
namespace {

using domain::TimeRange;
using domain::TimestampMs;

constexpr std::size_t kMaxRecentRequests = 64;

TimestampMs toMs(double value) {
    return static_cast<TimestampMs>(std::llround(value));
}

}  // namespace

ViewportPlanner::ViewportPlanner(PlannerConfig config) : config_(config) {}

VelocitySample ViewportPlanner::estimateVelocity(const ViewportSample& previous,
                                                 const TimeRange& current,
                                                 Clock::time_point now) {
    const auto leftDelta = current.start - previous.domain.start;
    const auto rightDelta = current.end - previous.domain.end;

    VelocitySample sample{};
    sample.at = now;

    // Symmetric zoom moves both edges apart (or together) by the same amount.
    if (leftDelta == -rightDelta && leftDelta != 0) {
        return sample;
    }

    const auto dominant = std::llabs(leftDelta) >= std::llabs(rightDelta) ? leftDelta : rightDelta;
    if (dominant == 0) {
        return sample;
    }

    sample.direction = dominant < 0 ? PanDirection::Left : PanDirection::Right;
    const auto elapsedMs = std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::milliseconds>(now - previous.at).count());
    sample.speed = static_cast<double>(std::llabs(dominant)) * 1000.0 / static_cast<double>(elapsedMs);
    return sample;
}

BufferSizes ViewportPlanner::bufferSizes(const TimeRange& visible,
                                         TimestampMs barMs,
                                         const VelocitySample& velocity) const {
    const auto span = std::max<TimestampMs>(1, visible.span());
    const double base = config_.bufferMultiple * static_cast<double>(span);

    double factor = 1.0;
    if (velocity.direction != PanDirection::None && config_.velocityK > 0.0) {
        factor = std::min(config_.maxVelocityFactor, 1.0 + velocity.speed / config_.velocityK);
    }

    const auto floor = static_cast<TimestampMs>(config_.minBars) * barMs;

    BufferSizes buffers;
    buffers.left = std::max(floor, toMs(velocity.direction == PanDirection::Left ? base * factor : base));
    buffers.right = std::max(floor, toMs(velocity.direction == PanDirection::Right ? base * factor : base));
    return buffers;
}

bool ViewportPlanner::movedBeyondJitter(const TimeRange& previous, const TimeRange& current) const {
    const auto reference = static_cast<double>(std::max(previous.span(), current.span()));
    const double threshold = reference * config_.jitterFraction;
    const auto leftMove = static_cast<double>(std::llabs(current.start - previous.start));
    const auto rightMove = static_cast<double>(std::llabs(current.end - previous.end));
    return leftMove > threshold || rightMove > threshold;
}

void ViewportPlanner::pushVelocity(Entry& entry, const VelocitySample& sample) const {
    entry.velocity.push_back(sample);
    while (entry.velocity.size() > std::max<std::size_t>(1, config_.velocityHistory)) {
        entry.velocity.pop_front();
    }
}

TimestampMs ViewportPlanner::maxRequestSpan(TimestampMs barMs) const {
    if (config_.maxBars == 0 || barMs <= 0) {
        return 0;
    }
    return static_cast<TimestampMs>(config_.maxBars) * barMs;
}

TimeRange ViewportPlanner::initialWindow(const TimeRange& visible,
                                         const BufferSizes& buffers,
                                         TimestampMs barMs) const {
    TimeRange window{visible.start - buffers.left, visible.end + buffers.right};
    const auto cap = maxRequestSpan(barMs);
    if (cap <= 0 || window.span() <= cap) {
        return window;
    }

    // Keep the most recent part: trim from the old side first, then give up the right
    // buffer if the viewport alone does not fit.
    window.start = window.end - cap;
    if (window.start > visible.start) {
        window.end = visible.end;
        window.start = visible.end - cap;
    }
    return window;
}

bool ViewportPlanner::admit(Entry& entry, const TimeRange& candidate, Clock::time_point now) const {
    if (wasRecentlyRequested(entry, candidate, now, config_.recentWindow)) {
        LOG_DEBUG("Planner " << entry.key << ": suppressing " << candidate << ", requested recently");
        common::metrics::Registry::instance().incrementCounter("viewport.plans_suppressed");
        return false;
    }
    recordRequest(entry, candidate, now);
    return true;
}

FetchPlan ViewportPlanner::plan(Entry& entry, TimeRange visible, Clock::time_point now) const {
    const auto view = TimeRange::ordered(visible.start, visible.end);
    const auto barMs = entry.timeframe.barMs();

    VelocitySample velocity{};
    velocity.at = now;
    bool moved = true;
    if (entry.lastViewport) {
        moved = movedBeyondJitter(entry.lastViewport->domain, view);
        if (moved) {
            velocity = estimateVelocity(*entry.lastViewport, view, now);
            pushVelocity(entry, velocity);
        }
    }
    if (moved) {
        entry.lastViewport = ViewportSample{view, now};
    }

    const auto buffers = bufferSizes(view, barMs, velocity);
    FetchPlan plan;

    if (!entry.loadedRange) {
        const auto window = initialWindow(view, buffers, barMs);
        if (admit(entry, window, now)) {
            plan.backfill = window;
        }
    } else {
        const auto loaded = *entry.loadedRange;
        const auto loadedSpan = static_cast<double>(std::max<TimestampMs>(1, loaded.span()));
        const double leftProximity = static_cast<double>(view.start - loaded.start) / loadedSpan;
        const double rightProximity = static_cast<double>(loaded.end - view.end) / loadedSpan;
        const auto idealLeft = view.start - buffers.left;
        const auto idealRight = view.end + buffers.right;
        const auto cap = maxRequestSpan(barMs);

        const bool leftTrigger = idealLeft < loaded.start
            && (velocity.direction == PanDirection::Left || leftProximity < config_.proximityThreshold);
        const bool rightTrigger = idealRight > loaded.end
            && (velocity.direction == PanDirection::Right || rightProximity < config_.proximityThreshold);

        if (leftTrigger) {
            TimeRange range{std::min(idealLeft, loaded.start - buffers.left), loaded.start - 1};
            if (cap > 0 && range.span() > cap) {
                range.start = range.end - cap;
            }
            if (admit(entry, range, now)) {
                plan.backfill = range;
            }
        }
        if (rightTrigger) {
            TimeRange range{loaded.end + 1, std::max(idealRight, loaded.end + buffers.right)};
            if (cap > 0 && range.span() > cap) {
                range.end = range.start + cap;
            }
            if (admit(entry, range, now)) {
                plan.prefetch = range;
            }
        }
    }

    if (!plan.empty()) {
        common::metrics::Registry::instance().incrementCounter("viewport.plans");
        LOG_DEBUG("Planner " << entry.key << ": viewport=" << view
                             << " pan=" << toString(velocity.direction)
                             << " speed=" << velocity.speed
                             << " buffers=" << buffers.left << '/' << buffers.right
                             << (plan.backfill ? " backfill" : "")
                             << (plan.prefetch ? " prefetch" : ""));
    }
    return plan;
}

bool wasRecentlyRequested(Entry& entry,
                          const TimeRange& range,
                          Clock::time_point now,
                          std::chrono::milliseconds window) {
    auto& recent = entry.recentRequests;
    recent.erase(std::remove_if(recent.begin(), recent.end(),
                                [&](const RecentRequest& request) { return now - request.at >= window; }),
                 recent.end());

    return std::any_of(recent.begin(), recent.end(), [&](const RecentRequest& request) {
        return request.range.overlaps(range);
    });
}

void recordRequest(Entry& entry, const TimeRange& range, Clock::time_point now) {
    for (auto& request : entry.recentRequests) {
        if (request.range == range) {
            request.at = now;
            return;
        }
    }
    entry.recentRequests.push_back(RecentRequest{range, now});
    while (entry.recentRequests.size() > kMaxRecentRequests) {
        entry.recentRequests.pop_front();
    }
}

void forgetRequest(Entry& entry, const TimeRange& range) {
    auto& recent = entry.recentRequests;
    recent.erase(std::remove_if(recent.begin(), recent.end(),
                                [&](const RecentRequest& request) { return request.range == range; }),
                 recent.end());
}

}  // namespace vpb::core
