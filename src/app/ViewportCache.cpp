#include "app/ViewportCache.hpp"

#include <exception>
#include <sstream>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/CandleSeries.hpp"

namespace vpb::app {
namespace {

using common::metrics::Registry;
using core::Clock;
using core::Entry;
using core::FetchPriority;
using domain::TimeRange;

domain::SeriesPtr emptySeries() {
    static const auto empty = std::make_shared<const domain::Series>();
    return empty;
}

}  // namespace

ViewportCache::ViewportCache(boost::asio::any_io_executor executor,
                             domain::ICandleProvider& provider,
                             core::PlannerConfig plannerConfig)
    : executor_(std::move(executor)),
      provider_(provider),
      planner_(plannerConfig),
      alive_(std::make_shared<int>(0)) {}

ViewportCache::~ViewportCache() {
    alive_.reset();
    for (const auto& key : store_.keys()) {
        if (auto* entry = store_.find(key)) {
            cancelInFlight(*entry);
        }
    }
}

core::FetchPlan ViewportCache::planViewportFetch(const domain::CacheKey& key, TimeRange visible) {
    Registry::ScopedTimer timer("viewport.plan");
    auto& entry = store_.getEntry(key);
    publishEntryGauge();
    return planner_.plan(entry, visible, Clock::now());
}

void ViewportCache::ensureRange(const domain::CacheKey& key,
                                domain::TimestampMs from,
                                domain::TimestampMs to,
                                SeriesHandler handler,
                                FetchPriority priority,
                                std::optional<TimeRange> viewport) {
    auto& entry = store_.getEntry(key);
    publishEntryGauge();

    const auto requested = TimeRange::ordered(from, to);
    auto id = requestId(requested, priority);
    auto& registry = Registry::instance();

    if (entry.inFlight.count(id) != 0) {
        registry.incrementCounter("viewport.dedup_hits");
        LOG_DEBUG("Viewport fetch " << key << ' ' << id << " already in flight, serving cache");
        if (handler) {
            boost::asio::post(executor_, [handler = std::move(handler),
                                          series = clipTo(core::ChunkStore::flatten(entry), viewport)]() {
                handler(series);
            });
        }
        return;
    }

    if (priority == FetchPriority::Primary && !entry.primaryRequest.empty()) {
        if (auto it = entry.inFlight.find(entry.primaryRequest); it != entry.inFlight.end()) {
            it->second.token.cancel();
            registry.incrementCounter("viewport.cancelled");
            LOG_DEBUG("Viewport fetch " << key << ' ' << it->first << " superseded by " << id);
            core::forgetRequest(entry, it->second.range);
            entry.inFlight.erase(it);
        }
        entry.primaryRequest.clear();
    }

    domain::CancellationToken token;
    entry.inFlight.emplace(id, core::InFlightRequest{token, priority, requested});
    if (priority == FetchPriority::Primary) {
        entry.primaryRequest = id;
    }
    entry.status = core::EntryStatus::Fetching;
    core::recordRequest(entry, requested, Clock::now());
    registry.incrementCounter("viewport.provider_calls");

    LOG_DEBUG("Viewport fetch " << key << " window=" << requested << " priority=" << core::toString(priority));

    PendingFetch pending{key, std::move(id), token, requested, Clock::now(), std::move(handler), viewport};
    domain::FetchRequest request{key.symbol, entry.timeframe, requested};

    std::weak_ptr<int> alive = alive_;
    auto executor = executor_;
    auto onComplete = [this, alive, executor, pending](domain::FetchResult result) {
        boost::asio::post(executor, [this, alive, pending, result = std::move(result)]() mutable {
            if (alive.expired()) {
                return;
            }
            onSettled(std::move(pending), std::move(result));
        });
    };

    try {
        provider_.fetchWindow(request, token, onComplete);
    } catch (const std::exception& ex) {
        onComplete(domain::FetchResult::failure(ex.what()));
    }
}

void ViewportCache::executePlan(const domain::CacheKey& key, const core::FetchPlan& plan, SeriesHandler handler) {
    if (plan.backfill) {
        ensureRange(key, plan.backfill->start, plan.backfill->end, handler, FetchPriority::Primary);
    }
    if (plan.prefetch) {
        ensureRange(key, plan.prefetch->start, plan.prefetch->end, handler, FetchPriority::Prefetch);
    }
}

domain::SeriesPtr ViewportCache::getSeries(const domain::CacheKey& key) {
    return store_.getFlattenedSeries(key);
}

std::optional<TimeRange> ViewportCache::getLoadedRange(const domain::CacheKey& key) {
    return store_.loadedRange(key);
}

core::EntryStatus ViewportCache::getStatus(const domain::CacheKey& key) {
    return store_.status(key);
}

const Entry* ViewportCache::findEntry(const domain::CacheKey& key) const {
    return store_.find(key);
}

void ViewportCache::clear() {
    const auto keys = store_.keys();
    for (const auto& key : keys) {
        if (auto* entry = store_.find(key)) {
            cancelInFlight(*entry);
        }
    }
    store_.clear();
    publishEntryGauge();
    LOG_INFO("Viewport cache cleared (" << keys.size() << " entries)");
}

void ViewportCache::clear(const domain::CacheKey& key) {
    auto* entry = store_.find(key);
    if (entry == nullptr) {
        return;
    }
    cancelInFlight(*entry);
    store_.erase(key);
    publishEntryGauge();
    LOG_INFO("Viewport cache cleared for " << key);
}

void ViewportCache::clearSymbol(const domain::Symbol& symbol) {
    const auto keys = store_.keysForSymbol(symbol);
    for (const auto& key : keys) {
        if (auto* entry = store_.find(key)) {
            cancelInFlight(*entry);
        }
        store_.erase(key);
    }
    publishEntryGauge();
    LOG_INFO("Viewport cache cleared for symbol " << symbol << " (" << keys.size() << " timeframes)");
}

std::string ViewportCache::requestId(const TimeRange& range, FetchPriority priority) {
    std::ostringstream id;
    id << range.start << '-' << range.end << '#' << core::toString(priority);
    return id.str();
}

domain::SeriesPtr ViewportCache::clipTo(domain::SeriesPtr series, const std::optional<TimeRange>& viewport) {
    if (!viewport || !series) {
        return series ? series : emptySeries();
    }
    const auto range = TimeRange::ordered(viewport->start, viewport->end);
    return std::make_shared<const domain::Series>(core::clipSeries(*series, range));
}

void ViewportCache::onSettled(PendingFetch pending, domain::FetchResult result) {
    auto& registry = Registry::instance();
    registry.observeLatency(
        "viewport.fetch",
        std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(Clock::now() - pending.startedAt)
            .count());

    auto* entry = store_.find(pending.key);

    if (pending.token.isCancelled() || entry == nullptr) {
        LOG_DEBUG("Viewport fetch " << pending.key << ' ' << pending.id << " settled after cancellation, discarded");
        if (pending.handler) {
            pending.handler(clipTo(entry ? core::ChunkStore::flatten(*entry) : emptySeries(), pending.viewport));
        }
        return;
    }

    entry->inFlight.erase(pending.id);
    if (entry->primaryRequest == pending.id) {
        entry->primaryRequest.clear();
    }

    if (result.failed()) {
        registry.incrementCounter("viewport.failures");
        core::forgetRequest(*entry, pending.requested);
        LOG_WARN("Viewport fetch failed for " << pending.key << " window=" << pending.requested << ": "
                                              << result.error);
    } else {
        mergeResult(*entry, pending.requested, std::move(result.value));
    }

    refreshStatus(*entry);
    if (pending.handler) {
        pending.handler(clipTo(core::ChunkStore::flatten(*entry), pending.viewport));
    }
}

void ViewportCache::mergeResult(Entry& entry, const TimeRange& requested, domain::Series data) {
    auto& registry = Registry::instance();
    data = core::normalizeSeries(std::move(data));

    // A chunk spans exactly the requested window; stray bars outside it are dropped.
    const auto received = data.size();
    data = core::clipSeries(data, requested);
    if (data.size() != received) {
        LOG_DEBUG("Viewport fetch " << entry.key << " window=" << requested << " dropped "
                                    << (received - data.size()) << " bars outside the window");
    }

    const auto barMs = entry.timeframe.barMs();
    const auto expectedBars = barMs > 0 ? static_cast<std::size_t>(requested.span() / barMs) : 0U;
    if (data.size() < expectedBars) {
        registry.incrementCounter("viewport.gaps");
        LOG_DEBUG("Viewport fetch " << entry.key << " window=" << requested << " returned " << data.size()
                                    << " of ~" << expectedBars << " bars (gap kept as loaded)");
    }

    core::Chunk chunk;
    chunk.range = requested;
    chunk.data = std::move(data);

    store_.insertChunk(entry, std::move(chunk));
    registry.incrementCounter("viewport.chunks_merged");
}

void ViewportCache::cancelInFlight(Entry& entry) {
    if (!entry.inFlight.empty()) {
        Registry::instance().incrementCounter("viewport.cancelled", entry.inFlight.size());
    }
    for (auto& [id, request] : entry.inFlight) {
        request.token.cancel();
        core::forgetRequest(entry, request.range);
    }
    entry.inFlight.clear();
    entry.primaryRequest.clear();
    refreshStatus(entry);
}

void ViewportCache::refreshStatus(Entry& entry) {
    if (!entry.inFlight.empty()) {
        entry.status = core::EntryStatus::Fetching;
    } else if (entry.status == core::EntryStatus::Fetching) {
        entry.status = core::EntryStatus::Idle;
    }
}

void ViewportCache::publishEntryGauge() {
    Registry::instance().setGauge("viewport.entries", static_cast<double>(store_.size()));
}

}  // namespace vpb::app
