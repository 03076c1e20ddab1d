#include <chrono>
#include <iostream>

#include "common/Metrics.hpp"
#include "core/ChunkStore.hpp"
#include "core/ViewportPlanner.hpp"

using vpb::core::ChunkStore;
using vpb::core::Clock;
using vpb::core::PanDirection;
using vpb::core::PlannerConfig;
using vpb::core::ViewportPlanner;
using vpb::domain::CacheKey;
using vpb::domain::TimeRange;

namespace {

constexpr long long kMinute = 60'000;
constexpr long long kHour = 60 * kMinute;
constexpr long long kDay = 24 * kHour;
constexpr long long kT = 1'699'999'800'000;  // multiple of five minutes

}  // namespace

int main() {
    using namespace std::chrono_literals;
    auto& registry = vpb::common::metrics::Registry::instance();
    const auto t0 = Clock::now();

    // First load: one window with three viewport spans on each side.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner;

        const TimeRange viewport{kT, kT + kHour};
        const auto plan = planner.plan(entry, viewport, t0);
        if (!plan.backfill || plan.prefetch) {
            std::cerr << "Expected the initial plan to be a single backfill window\n";
            return 1;
        }
        if (*plan.backfill != TimeRange{kT - 3 * kHour, kT + 4 * kHour}) {
            std::cerr << "Expected initial window [T-3h, T+4h], got " << *plan.backfill << "\n";
            return 1;
        }
        if (plan.backfill->span() / (5 * kMinute) != 84) {
            std::cerr << "Expected the window to hold 84 five-minute bars\n";
            return 1;
        }
        if (!entry.lastViewport || entry.lastViewport->domain != viewport) {
            std::cerr << "Expected the viewport to be recorded\n";
            return 1;
        }

        // Same domain again: nothing new to ask for.
        const auto suppressedBefore = registry.counter("viewport.plans_suppressed");
        const auto again = planner.plan(entry, viewport, t0 + 200ms);
        if (!again.empty()) {
            std::cerr << "Expected an empty plan for an unchanged viewport\n";
            return 1;
        }
        if (registry.counter("viewport.plans_suppressed") != suppressedBefore + 1) {
            std::cerr << "Expected the repeated window to be counted as suppressed\n";
            return 1;
        }
    }

    // Minimum bar floor applies to small viewports.
    {
        ViewportPlanner planner;
        const auto buffers = planner.bufferSizes(TimeRange{kT, kT + 10 * kMinute}, 5 * kMinute, {});
        if (buffers.left != 150 * kMinute || buffers.right != 150 * kMinute) {
            std::cerr << "Expected 30 bars of 5m (150 min) per side, got " << buffers.left << '/' << buffers.right
                      << "\n";
            return 1;
        }
    }

    // Velocity estimate and the buffer it produces.
    {
        const vpb::core::ViewportSample previous{TimeRange{0, kHour}, t0};
        const auto left = ViewportPlanner::estimateVelocity(previous, TimeRange{-30 * kMinute, 30 * kMinute}, t0 + 1s);
        if (left.direction != PanDirection::Left || left.speed != 1'800'000.0) {
            std::cerr << "Expected a left pan at 1.8e6 ms/s, got " << vpb::core::toString(left.direction) << ' '
                      << left.speed << "\n";
            return 1;
        }

        const auto zoom = ViewportPlanner::estimateVelocity(previous, TimeRange{-10 * kMinute, 70 * kMinute}, t0 + 1s);
        if (zoom.direction != PanDirection::None) {
            std::cerr << "Expected a symmetric zoom to have no direction\n";
            return 1;
        }

        const auto right = ViewportPlanner::estimateVelocity(previous, TimeRange{5 * kMinute, 90 * kMinute}, t0 + 1s);
        if (right.direction != PanDirection::Right) {
            std::cerr << "Expected the dominant right edge to give a right pan\n";
            return 1;
        }

        ViewportPlanner planner;
        const auto buffers = planner.bufferSizes(TimeRange{0, kHour}, 5 * kMinute, left);
        if (buffers.left != 4 * kHour + 30 * kMinute || buffers.right != 3 * kHour) {
            std::cerr << "Expected 1.5x buffer on the left only, got " << buffers.left << '/' << buffers.right << "\n";
            return 1;
        }

        vpb::core::VelocitySample fast{PanDirection::Right, 1e12, t0};
        const auto capped = planner.bufferSizes(TimeRange{0, kHour}, 5 * kMinute, fast);
        if (capped.right != 9 * kHour || capped.left != 3 * kHour) {
            std::cerr << "Expected the velocity factor to cap at 3x\n";
            return 1;
        }
    }

    // Panning left past the loaded edge extends it contiguously.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner;
        entry.loadedRange = TimeRange{kT - 3 * kHour, kT + 4 * kHour};
        entry.lastViewport = vpb::core::ViewportSample{TimeRange{kT, kT + kHour}, t0};

        const auto plan = planner.plan(entry, TimeRange{kT - kHour, kT}, t0 + 1s);
        if (!plan.backfill || plan.prefetch) {
            std::cerr << "Expected only a backfill when panning left\n";
            return 1;
        }
        if (plan.backfill->end != kT - 3 * kHour - 1) {
            std::cerr << "Expected the backfill to end just before the loaded range, got " << *plan.backfill << "\n";
            return 1;
        }
        // Speed 3.6e6 ms/s doubles the 3h left buffer: ideal left edge is T-7h, extension reaches T-9h.
        if (plan.backfill->start != kT - 9 * kHour) {
            std::cerr << "Expected the backfill to start at T-9h, got " << *plan.backfill << "\n";
            return 1;
        }
        if (entry.velocity.empty() || entry.velocity.back().direction != PanDirection::Left) {
            std::cerr << "Expected a left velocity sample in the history\n";
            return 1;
        }
    }

    // Proximity alone triggers a prefetch.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner;
        entry.loadedRange = TimeRange{kT, kT + 10 * kHour};

        const auto plan = planner.plan(entry, TimeRange{kT + 8 * kHour + 30 * kMinute, kT + 9 * kHour + 30 * kMinute}, t0);
        if (plan.backfill || !plan.prefetch) {
            std::cerr << "Expected only a prefetch near the right edge\n";
            return 1;
        }
        if (*plan.prefetch != TimeRange{kT + 10 * kHour + 1, kT + 13 * kHour}) {
            std::cerr << "Expected prefetch [T+10h+1, T+13h], got " << *plan.prefetch << "\n";
            return 1;
        }
    }

    // Both edges close: one plan carries both sides.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner;
        entry.loadedRange = TimeRange{kT, kT + 72 * kMinute};

        const auto plan = planner.plan(entry, TimeRange{kT + 6 * kMinute, kT + 66 * kMinute}, t0);
        if (!plan.backfill || !plan.prefetch) {
            std::cerr << "Expected both a backfill and a prefetch\n";
            return 1;
        }
        if (plan.backfill->end != kT - 1 || plan.prefetch->start != kT + 72 * kMinute + 1) {
            std::cerr << "Expected both extensions to touch the loaded range\n";
            return 1;
        }
    }

    // Sub-jitter movement is a no-op and leaves the recorded viewport alone.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner;
        entry.loadedRange = TimeRange{kT - 10 * kHour, kT + 10 * kHour};

        const TimeRange viewport{kT, kT + kHour};
        if (!planner.plan(entry, viewport, t0).empty()) {
            std::cerr << "Expected no fetch deep inside the loaded range\n";
            return 1;
        }
        const auto history = entry.velocity.size();
        const auto plan = planner.plan(entry, TimeRange{kT + kMinute, kT + kHour + kMinute}, t0 + 100ms);
        if (!plan.empty() || entry.velocity.size() != history || entry.lastViewport->domain != viewport) {
            std::cerr << "Expected a one-minute nudge to be ignored as jitter\n";
            return 1;
        }
    }

    // Oversized first loads keep the most recent part.
    {
        PlannerConfig config;
        config.maxBars = 60;
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        ViewportPlanner planner(config);
        const auto plan = planner.plan(entry, TimeRange{kT, kT + kHour}, t0);
        if (!plan.backfill || *plan.backfill != TimeRange{kT - kHour, kT + 4 * kHour}) {
            std::cerr << "Expected a 5h window ending at T+4h\n";
            return 1;
        }

        ChunkStore dailyStore;
        auto& daily = dailyStore.getEntry(CacheKey{"AAPL", "1D"});
        ViewportPlanner dailyPlanner;
        const TimeRange year{kT, kT + 365 * kDay};
        const auto dailyPlan = dailyPlanner.plan(daily, year, t0);
        if (!dailyPlan.backfill || dailyPlan.backfill->end != year.end
            || dailyPlan.backfill->span() != 1000 * kDay) {
            std::cerr << "Expected a 1000-day window ending at the viewport's right edge\n";
            return 1;
        }
    }

    // Recently-requested records expire after the window.
    {
        ChunkStore store;
        auto& entry = store.getEntry(CacheKey{"AAPL", "5m"});
        const TimeRange range{kT, kT + kHour};
        vpb::core::recordRequest(entry, range, t0);
        vpb::core::recordRequest(entry, range, t0);
        if (entry.recentRequests.size() != 1) {
            std::cerr << "Expected identical records to be collapsed\n";
            return 1;
        }
        if (!vpb::core::wasRecentlyRequested(entry, TimeRange{kT + 30 * kMinute, kT + 2 * kHour}, t0 + 1s, 30s)) {
            std::cerr << "Expected an overlapping range to count as recently requested\n";
            return 1;
        }
        if (vpb::core::wasRecentlyRequested(entry, TimeRange{kT + kHour + 1, kT + 2 * kHour}, t0 + 1s, 30s)) {
            std::cerr << "Expected an adjacent range not to be suppressed\n";
            return 1;
        }
        if (!vpb::core::wasRecentlyRequested(entry, TimeRange{kT + kHour, kT + 2 * kHour}, t0 + 1s, 30s)) {
            std::cerr << "Expected a range sharing the end instant to count as recently requested\n";
            return 1;
        }
        if (!vpb::core::wasRecentlyRequested(entry, TimeRange{kT, kT}, t0 + 1s, 30s)) {
            std::cerr << "Expected a single instant on the start boundary to count as recently requested\n";
            return 1;
        }
        if (!TimeRange{kT, kT + kHour}.overlaps(TimeRange{kT + kHour, kT + 2 * kHour})
            || TimeRange{kT, kT + kHour}.overlaps(TimeRange{kT + kHour + 1, kT + 2 * kHour})) {
            std::cerr << "Expected closed ranges to overlap exactly when they share an instant\n";
            return 1;
        }
        if (vpb::core::wasRecentlyRequested(entry, range, t0 + 31s, 30s) || !entry.recentRequests.empty()) {
            std::cerr << "Expected the record to expire after 30s\n";
            return 1;
        }
    }

    std::cout << "viewport planner tests passed\n";
    return 0;
}
