#include "core/ChunkStore.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include "core/CandleSeries.hpp"

namespace vpb::core {

const char* toString(EntryStatus status) noexcept {
    switch (status) {
    case EntryStatus::Idle:
        return "idle";
    case EntryStatus::Fetching:
        return "fetching";
    case EntryStatus::Live:
        return "live";
    }
    return "idle";
}

const char* toString(PanDirection direction) noexcept {
    switch (direction) {
    case PanDirection::Left:
        return "left";
    case PanDirection::Right:
        return "right";
    case PanDirection::None:
    default:
        break;
    }
    return "none";
}

const char* toString(FetchPriority priority) noexcept {
    return priority == FetchPriority::Prefetch ? "prefetch" : "primary";
}

Entry& ChunkStore::getEntry(const domain::CacheKey& key) {
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    if (key.symbol.empty()) {
        throw std::invalid_argument("Cache key requires a symbol");
    }
    auto timeframe = domain::timeframeFromLabel(key.timeframe);
    if (!timeframe) {
        throw std::invalid_argument("Unsupported timeframe: " + key.timeframe);
    }

    Entry entry;
    entry.key = key;
    entry.timeframe = std::move(*timeframe);
    return entries_.emplace(key, std::move(entry)).first->second;
}

Entry* ChunkStore::find(const domain::CacheKey& key) {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

const Entry* ChunkStore::find(const domain::CacheKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

domain::SeriesPtr ChunkStore::getFlattenedSeries(const domain::CacheKey& key) {
    return flatten(getEntry(key));
}

std::optional<domain::TimeRange> ChunkStore::loadedRange(const domain::CacheKey& key) {
    return getEntry(key).loadedRange;
}

EntryStatus ChunkStore::status(const domain::CacheKey& key) {
    return getEntry(key).status;
}

void ChunkStore::insertChunk(Entry& entry, Chunk chunk) {
    const auto requested = chunk.range;
    entry.chunks = mergeChunk(entry.chunks, std::move(chunk));
    entry.loadedRange = entry.loadedRange ? domain::envelope(*entry.loadedRange, requested) : requested;
    if (auto covered = coveredRange(entry.chunks)) {
        entry.loadedRange = domain::envelope(*entry.loadedRange, *covered);
    }
    ++entry.version;
}

bool ChunkStore::erase(const domain::CacheKey& key) {
    return entries_.erase(key) > 0;
}

std::vector<domain::CacheKey> ChunkStore::keys() const {
    std::vector<domain::CacheKey> out;
    out.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        out.push_back(key);
    }
    return out;
}

std::vector<domain::CacheKey> ChunkStore::keysForSymbol(const domain::Symbol& symbol) const {
    std::vector<domain::CacheKey> out;
    for (const auto& [key, entry] : entries_) {
        if (key.symbol == symbol) {
            out.push_back(key);
        }
    }
    return out;
}

void ChunkStore::clear() { entries_.clear(); }

domain::SeriesPtr ChunkStore::flatten(const Entry& entry) {
    if (entry.flattened && entry.flattenedVersion == entry.version) {
        return entry.flattened;
    }

    std::vector<const Chunk*> ordered;
    ordered.reserve(entry.chunks.size());
    for (const auto& chunk : entry.chunks) {
        ordered.push_back(&chunk);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Chunk* lhs, const Chunk* rhs) {
        return lhs->range.start < rhs->range.start;
    });

    domain::Series all;
    for (const auto* chunk : ordered) {
        all = mergeSeries(all, chunk->data);
    }

    entry.flattened = std::make_shared<const domain::Series>(std::move(all));
    entry.flattenedVersion = entry.version;
    return entry.flattened;
}

}  // namespace vpb::core
