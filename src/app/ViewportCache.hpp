#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>

#include "core/ChunkStore.hpp"
#include "core/PlannerConfig.hpp"
#include "core/ViewportPlanner.hpp"
#include "domain/CacheKey.hpp"
#include "domain/Types.h"
#include "domain/ports/ICandleProvider.hpp"

namespace vpb::app {

// Interval cache in front of a pull-based candle provider, keyed by (symbol, timeframe).
//
// Every member function must be called on `executor`'s thread. Provider completions are
// posted back to that executor, so entries are only ever mutated there and never observed
// half-updated. Fetches for different keys run concurrently; within one key a new primary
// fetch cancels the previous one.
class ViewportCache {
public:
    using SeriesHandler = std::function<void(domain::SeriesPtr)>;

    ViewportCache(boost::asio::any_io_executor executor,
                  domain::ICandleProvider& provider,
                  core::PlannerConfig plannerConfig = {});
    ~ViewportCache();

    ViewportCache(const ViewportCache&) = delete;
    ViewportCache& operator=(const ViewportCache&) = delete;

    core::FetchPlan planViewportFetch(const domain::CacheKey& key, domain::TimeRange visible);

    // Makes sure [from, to] is cached. `handler` receives the flattened series once the
    // fetch settles; on failure or cancellation it receives whatever was cached. When
    // `viewport` is given the delivered series is clipped to it.
    void ensureRange(const domain::CacheKey& key,
                     domain::TimestampMs from,
                     domain::TimestampMs to,
                     SeriesHandler handler = {},
                     core::FetchPriority priority = core::FetchPriority::Primary,
                     std::optional<domain::TimeRange> viewport = std::nullopt);

    // Issues both sides of a plan. The backfill takes the primary slot; the prefetch always
    // runs with Prefetch priority so it never cancels a backfill. `handler` runs once per fetch.
    void executePlan(const domain::CacheKey& key, const core::FetchPlan& plan, SeriesHandler handler = {});

    domain::SeriesPtr getSeries(const domain::CacheKey& key);
    std::optional<domain::TimeRange> getLoadedRange(const domain::CacheKey& key);
    core::EntryStatus getStatus(const domain::CacheKey& key);

    const core::Entry* findEntry(const domain::CacheKey& key) const;
    std::size_t entryCount() const noexcept { return store_.size(); }
    const core::ViewportPlanner& planner() const noexcept { return planner_; }

    void clear();
    void clear(const domain::CacheKey& key);
    void clearSymbol(const domain::Symbol& symbol);

private:
    struct PendingFetch {
        domain::CacheKey key;
        std::string id;
        domain::CancellationToken token;
        domain::TimeRange requested;
        core::Clock::time_point startedAt;
        SeriesHandler handler;
        std::optional<domain::TimeRange> viewport;
    };

    static std::string requestId(const domain::TimeRange& range, core::FetchPriority priority);
    static domain::SeriesPtr clipTo(domain::SeriesPtr series, const std::optional<domain::TimeRange>& viewport);

    void onSettled(PendingFetch pending, domain::FetchResult result);
    void mergeResult(core::Entry& entry, const domain::TimeRange& requested, domain::Series data);
    void cancelInFlight(core::Entry& entry);
    void refreshStatus(core::Entry& entry);
    void publishEntryGauge();

    boost::asio::any_io_executor executor_;
    domain::ICandleProvider& provider_;
    core::ViewportPlanner planner_;
    core::ChunkStore store_;
    // Completions hold a weak reference so that ones arriving after destruction are dropped.
    std::shared_ptr<int> alive_;
};

}  // namespace vpb::app
